#include "string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <string>

namespace string_utils {
    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_lower(std::string s) {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
        using namespace std::chrono;

        const auto since_epoch = tp.time_since_epoch();
        const auto secs = duration_cast<seconds>(since_epoch);
        auto micros = duration_cast<microseconds>(since_epoch - secs).count();
        if (micros < 0) {
            micros += 1'000'000;
        }

        const std::time_t tt = system_clock::to_time_t(system_clock::time_point{secs});
        std::tm utc{};
        gmtime_r(&tt, &utc);

        std::array<char, 32> date{};
        std::strftime(date.data(), date.size(), "%Y-%m-%dT%H:%M:%S", &utc);

        std::array<char, 16> frac{};
        std::snprintf(frac.data(), frac.size(), ".%06lldZ", static_cast<long long>(micros));

        return std::string(date.data()) + frac.data();
    }

    std::string truncate(const std::string &s, size_t max_chars) {
        size_t chars = 0;
        for (size_t i = 0; i < s.size(); ++i) {
            // count code points, not continuation bytes
            if ((static_cast<unsigned char>(s[i]) & 0xC0U) != 0x80U) {
                if (chars == max_chars) {
                    return s.substr(0, i);
                }
                ++chars;
            }
        }
        return s;
    }
}  // namespace string_utils
