#ifndef UNSAFE_FETCH_HAR_HPP
#define UNSAFE_FETCH_HAR_HPP

#include <deque>
#include <nlohmann/json.hpp>

#include "network_event.hpp"

namespace network::har {
    inline constexpr const char* POSITIONAL_PAIRING_COMMENT = "paired by position";

    // Requests pair with the response carrying the same correlation id. Uncorrelated events
    // pair in order of arrival. Requests left without a response are not emitted.
    [[nodiscard]] nlohmann::ordered_json build(const std::deque<RequestEvent>& requests, const std::deque<ResponseEvent>& responses);

    [[nodiscard]] nlohmann::ordered_json to_json(const RequestEvent& evt);
    [[nodiscard]] nlohmann::ordered_json to_json(const ResponseEvent& evt);
}  // namespace network::har

#endif
