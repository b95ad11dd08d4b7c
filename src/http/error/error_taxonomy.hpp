#ifndef UNSAFE_FETCH_ERROR_TAXONOMY_HPP
#define UNSAFE_FETCH_ERROR_TAXONOMY_HPP

#include <curl/curl.h>

#include <optional>
#include <stdexcept>
#include <string>

namespace http::error {
    enum class ErrorKind {
        // transport-classified
        SSL_FAILURE,
        TIMEOUT,
        CONNECTION_FAILURE,
        CLIENT_PROTOCOL_FAILURE,
        // server-classified, carries the status code alongside
        HTTP_STATUS_FAILURE,
        // content-classified
        PARSE_FAILURE,
        // caller-initiated
        CANCELLED,
        // local storage
        IO_FAILURE,
    };

    [[nodiscard]] bool is_retryable(ErrorKind kind);

    [[nodiscard]] ErrorKind classify(CURLcode code);

    [[nodiscard]] std::optional<ErrorKind> classify_status(long status);

    [[nodiscard]] const char* to_string(ErrorKind kind);

    // Thrown by transports only; the fetch engine turns it into a failure value.
    struct TransportError : public std::runtime_error {
        ErrorKind kind_;
        explicit TransportError(ErrorKind kind, const std::string& msg);
    };
}  // namespace http::error

#endif
