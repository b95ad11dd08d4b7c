#ifndef UNSAFE_FETCH_STRING_UTILS_HPP
#define UNSAFE_FETCH_STRING_UTILS_HPP

#include <chrono>
#include <string>

namespace string_utils {
    bool ieq_prefix(const char* buf, size_t n, const char* key);

    std::string trim(std::string s);

    std::string to_lower(std::string s);

    // UTC, microsecond precision, e.g. 2025-11-01T12:30:45.123456Z
    std::string iso8601_utc(std::chrono::system_clock::time_point tp);

    // Cuts at a UTF-8 code point boundary.
    std::string truncate(const std::string& s, size_t max_chars);
}  // namespace string_utils

#endif
