
#ifndef UNSAFE_FETCH_CONSTANTS_HPP
#define UNSAFE_FETCH_CONSTANTS_HPP

#include <cstddef>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr long HTTP_ERROR_STATUS_FLOOR = 400;
    inline constexpr std::size_t DOWNLOAD_CHUNK_BYTES = 8 * 1024;
    inline constexpr std::size_t ERROR_BODY_PREVIEW_CHARS = 200;
    inline constexpr std::size_t FETCH_PREVIEW_CHARS = 1000;
    inline constexpr std::size_t BATCH_PREVIEW_CHARS = 500;
    inline constexpr std::size_t DEFAULT_SUMMARY_LIMIT = 10;
    inline constexpr std::size_t DEFAULT_RECORDER_CAPACITY = 10'000;
    inline constexpr const char* SESSION_FILE_EXT = ".json";
    inline constexpr const char* TEMP_FILE_EXT = ".tmp";
    inline constexpr const char* DEFAULT_SESSION_NAME = "default";
    inline constexpr const char* DEFAULT_TRACE_FILE = "network.har";
    inline constexpr const char* HAR_VERSION = "1.2";
    inline constexpr const char* CREATOR_NAME = "unsafe_fetch";
    inline constexpr const char* CREATOR_VERSION = "2.0";
    inline constexpr const char* DEFAULT_USER_AGENT = "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36";
}  // namespace constants

#endif
