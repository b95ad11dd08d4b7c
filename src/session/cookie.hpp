#ifndef UNSAFE_FETCH_COOKIE_HPP
#define UNSAFE_FETCH_COOKIE_HPP

#include <optional>
#include <string>
#include <vector>

namespace session {
    inline constexpr double SESSION_COOKIE_EXPIRY = -1;

    // Cookie as handed over by the browser automation layer.
    struct Cookie {
        std::string name_;
        std::string value_;
        std::string domain_;
        std::string path_ = "/";
        double expires_ = SESSION_COOKIE_EXPIRY;  // seconds since epoch
        bool http_only_ = false;
        bool secure_ = false;
        std::string same_site_ = "Lax";

        bool operator==(const Cookie&) const = default;
    };

    struct SessionRecord {
        std::string name_;
        std::string saved_at_;
        std::vector<Cookie> cookies_;
        size_t cookie_count_ = 0;
        std::vector<std::string> domains_;
        std::optional<std::string> current_url_;
    };

    struct SessionInfo {
        std::string name_;
        size_t cookie_count_ = 0;
        std::optional<std::string> current_url_;
        std::string saved_at_;
    };
}  // namespace session

#endif
