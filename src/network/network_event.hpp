#ifndef UNSAFE_FETCH_NETWORK_EVENT_HPP
#define UNSAFE_FETCH_NETWORK_EVENT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../http/model/model.hpp"

namespace network {
    // 0 means the producer could not correlate the event.
    using CorrelationId = std::uint64_t;

    struct RequestEvent {
        CorrelationId id_ = 0;
        std::chrono::system_clock::time_point timestamp_;
        std::string method_ = "GET";
        std::string url_;
        http::model::Headers headers_;
        std::string resource_type_;
    };

    struct ResponseEvent {
        CorrelationId id_ = 0;
        std::chrono::system_clock::time_point timestamp_;
        std::string url_;
        long status_ = 0;
        http::model::Headers headers_;
        bool ok_ = false;  // derived on record
        std::optional<std::string> error_;
    };

    struct NetworkSummary {
        size_t total_requests_ = 0;
        size_t total_responses_ = 0;
        size_t failed_responses_ = 0;
        std::vector<RequestEvent> recent_requests_;
        std::vector<ResponseEvent> recent_responses_;
    };
}  // namespace network

#endif
