#ifndef UNSAFE_FETCH_TEXT_DECODING_HPP
#define UNSAFE_FETCH_TEXT_DECODING_HPP

#include <string>
#include <string_view>

#include "../model/model.hpp"

namespace http::fetch {
    [[nodiscard]] bool is_valid_utf8(std::string_view bytes);

    // Every byte maps to the code point of the same value, so this cannot fail.
    [[nodiscard]] std::string latin1_to_utf8(std::string_view bytes);

    // UTF-8 when the payload is valid UTF-8, Latin-1 otherwise. Always yields UTF-8 text.
    [[nodiscard]] std::string decode_body(std::string bytes);

    // Header values go through the same rule; names are left alone.
    [[nodiscard]] http::model::Headers decode_headers(http::model::Headers headers);
}  // namespace http::fetch

#endif
