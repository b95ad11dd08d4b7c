#include "text_decoding.hpp"

#include <cstdint>
#include <string>

namespace http::fetch {
    namespace {
        constexpr unsigned char CONTINUATION_MASK = 0xC0;
        constexpr unsigned char CONTINUATION_TAG = 0x80;

        bool is_continuation(unsigned char c) { return (c & CONTINUATION_MASK) == CONTINUATION_TAG; }
    }  // namespace

    bool is_valid_utf8(std::string_view bytes) {
        size_t i = 0;
        const size_t n = bytes.size();

        while (i < n) {
            const auto c = static_cast<unsigned char>(bytes[i]);

            if (c < 0x80) {
                ++i;
                continue;
            }

            size_t extra = 0;
            std::uint32_t cp = 0;
            std::uint32_t min_cp = 0;

            if ((c & 0xE0) == 0xC0) {
                extra = 1;
                cp = c & 0x1FU;
                min_cp = 0x80;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2;
                cp = c & 0x0FU;
                min_cp = 0x800;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3;
                cp = c & 0x07U;
                min_cp = 0x10000;
            } else {
                return false;
            }

            if (i + extra >= n) {
                return false;
            }

            for (size_t k = 1; k <= extra; ++k) {
                const auto cc = static_cast<unsigned char>(bytes[i + k]);
                if (!is_continuation(cc)) {
                    return false;
                }
                cp = (cp << 6U) | (cc & 0x3FU);
            }

            // overlong, surrogate and out-of-range sequences are invalid
            if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return false;
            }

            i += extra + 1;
        }

        return true;
    }

    std::string latin1_to_utf8(std::string_view bytes) {
        std::string out;
        out.reserve(bytes.size() * 2);

        for (const char ch : bytes) {
            const auto c = static_cast<unsigned char>(ch);
            if (c < 0x80) {
                out.push_back(static_cast<char>(c));
            } else {
                out.push_back(static_cast<char>(0xC0U | (c >> 6U)));
                out.push_back(static_cast<char>(0x80U | (c & 0x3FU)));
            }
        }

        return out;
    }

    std::string decode_body(std::string bytes) {
        if (is_valid_utf8(bytes)) {
            return bytes;
        }
        return latin1_to_utf8(bytes);
    }

    http::model::Headers decode_headers(http::model::Headers headers) {
        for (auto& [name, value] : headers) {
            value = decode_body(std::move(value));
        }
        return headers;
    }
}  // namespace http::fetch
