#ifndef UNSAFE_FETCH_MODEL_HPP
#define UNSAFE_FETCH_MODEL_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <variant>

#include "../error/error_taxonomy.hpp"

namespace http::model {
    using Headers = std::map<std::string, std::string>;

    inline constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};

    struct FetchRequest {
        std::string url_;
        Headers headers_;
        std::optional<std::string> proxy_;
        std::chrono::milliseconds timeout_ = DEFAULT_TIMEOUT;
        bool verify_ssl_ = false;
    };

    struct FetchSuccess {
        std::string url_;  // post-redirect
        long status_ = 0;
        Headers headers_;
        std::string content_;
        std::size_t size_ = 0;
        std::chrono::milliseconds elapsed_{0};
        bool ssl_verified_ = false;
        std::size_t attempts_ = 0;
    };

    struct FetchFailure {
        http::error::ErrorKind kind_ = http::error::ErrorKind::CLIENT_PROTOCOL_FAILURE;
        std::optional<long> http_status_;
        std::string message_;
        std::string url_;
        std::chrono::milliseconds elapsed_{0};
        std::size_t attempts_ = 0;
    };

    using FetchResult = std::variant<FetchSuccess, FetchFailure>;

    struct DownloadRequest {
        FetchRequest fetch_;
        std::filesystem::path destination_;
        bool show_progress_ = true;
    };

    struct DownloadSuccess {
        std::string url_;
        long status_ = 0;
        std::filesystem::path output_path_;
        std::uint64_t bytes_written_ = 0;
        std::chrono::milliseconds elapsed_{0};
        std::size_t attempts_ = 0;
    };

    struct DownloadFailure {
        FetchFailure failure_;
        std::filesystem::path output_path_;
    };

    using DownloadResult = std::variant<DownloadSuccess, DownloadFailure>;

    template <typename Result>
    [[nodiscard]] bool succeeded(const Result& r) {
        return r.index() == 0;
    }

    [[nodiscard]] inline const FetchFailure* failure_of(const FetchResult& r) { return std::get_if<FetchFailure>(&r); }
    [[nodiscard]] inline const FetchSuccess* success_of(const FetchResult& r) { return std::get_if<FetchSuccess>(&r); }
}  // namespace http::model

#endif
