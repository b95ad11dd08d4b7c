#ifndef UNSAFE_FETCH_NETWORK_RECORDER_HPP
#define UNSAFE_FETCH_NETWORK_RECORDER_HPP

#include <atomic>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>

#include "../utils/constants.hpp"
#include "network_event.hpp"

namespace network {
    // Bounded, thread-safe log of request/response events for one browsing context.
    class NetworkRecorder {
       public:
        // capacity 0 keeps every event
        explicit NetworkRecorder(size_t capacity = constants::DEFAULT_RECORDER_CAPACITY);

        ~NetworkRecorder() = default;
        NetworkRecorder(const NetworkRecorder&) = delete;
        NetworkRecorder& operator=(const NetworkRecorder&) = delete;
        NetworkRecorder(NetworkRecorder&&) = delete;
        NetworkRecorder& operator=(NetworkRecorder&&) = delete;

        void set_enabled(bool enabled) { enabled_ = enabled; }
        [[nodiscard]] bool enabled() const { return enabled_; }

        [[nodiscard]] CorrelationId next_correlation_id() { return next_id_.fetch_add(1); }

        void record_request(RequestEvent evt);
        void record_response(ResponseEvent evt);

        [[nodiscard]] NetworkSummary summary(size_t limit = constants::DEFAULT_SUMMARY_LIMIT) const;
        void clear();

        // HAR 1.2; the buffer is left untouched.
        [[nodiscard]] std::string export_trace() const;
        // Throws std::runtime_error when the file cannot be written.
        void export_trace_to_file(const std::filesystem::path& path) const;

        [[nodiscard]] size_t capacity() const { return capacity_; }

       private:
        template <typename Event>
        void push_bounded(std::deque<Event>& events, Event evt);

        const size_t capacity_;
        std::atomic<bool> enabled_ = true;
        std::atomic<CorrelationId> next_id_ = 1;

        mutable std::mutex mutex_;
        std::deque<RequestEvent> requests_;
        std::deque<ResponseEvent> responses_;
        size_t total_requests_ = 0;
        size_t total_responses_ = 0;
        size_t failed_responses_ = 0;
    };
}  // namespace network

#endif
