#include "error_taxonomy.hpp"

#include <array>
#include <string>
#include <utility>

#include "../../utils/constants.hpp"

namespace http::error {
    namespace {
        constexpr std::array<std::pair<ErrorKind, const char*>, 8> KIND_NAMES = {{
            {ErrorKind::SSL_FAILURE, "SSLFailure"},
            {ErrorKind::TIMEOUT, "Timeout"},
            {ErrorKind::CONNECTION_FAILURE, "ConnectionFailure"},
            {ErrorKind::CLIENT_PROTOCOL_FAILURE, "ClientProtocolFailure"},
            {ErrorKind::HTTP_STATUS_FAILURE, "HTTPStatusFailure"},
            {ErrorKind::PARSE_FAILURE, "ParseFailure"},
            {ErrorKind::CANCELLED, "Cancelled"},
            {ErrorKind::IO_FAILURE, "IOFailure"},
        }};
    }  // namespace

    TransportError::TransportError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}

    bool is_retryable(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::TIMEOUT:
            case ErrorKind::CONNECTION_FAILURE:
            case ErrorKind::CLIENT_PROTOCOL_FAILURE:
            case ErrorKind::SSL_FAILURE:
                return true;
            case ErrorKind::HTTP_STATUS_FAILURE:
            case ErrorKind::PARSE_FAILURE:
            case ErrorKind::CANCELLED:
            case ErrorKind::IO_FAILURE:
                return false;
        }
        return false;
    }

    ErrorKind classify(CURLcode code) {
        switch (code) {
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_SSL_CERTPROBLEM:
            case CURLE_SSL_CIPHER:
            case CURLE_PEER_FAILED_VERIFICATION:
            case CURLE_SSL_ENGINE_NOTFOUND:
            case CURLE_SSL_ENGINE_SETFAILED:
            case CURLE_SSL_ENGINE_INITFAILED:
            case CURLE_SSL_CACERT_BADFILE:
            case CURLE_SSL_SHUTDOWN_FAILED:
            case CURLE_SSL_CRL_BADFILE:
            case CURLE_SSL_ISSUER_ERROR:
            case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
            case CURLE_SSL_INVALIDCERTSTATUS:
            case CURLE_USE_SSL_FAILED:
                return ErrorKind::SSL_FAILURE;

            case CURLE_OPERATION_TIMEDOUT:
                return ErrorKind::TIMEOUT;

            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_CONNECT:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_PARTIAL_FILE:
            case CURLE_PROXY:
                return ErrorKind::CONNECTION_FAILURE;

            case CURLE_ABORTED_BY_CALLBACK:
                return ErrorKind::CANCELLED;

            case CURLE_WRITE_ERROR:
                return ErrorKind::IO_FAILURE;

            default:
                return ErrorKind::CLIENT_PROTOCOL_FAILURE;
        }
    }

    std::optional<ErrorKind> classify_status(long status) {
        if (status >= constants::HTTP_ERROR_STATUS_FLOOR) {
            return ErrorKind::HTTP_STATUS_FAILURE;
        }
        return std::nullopt;
    }

    const char* to_string(ErrorKind kind) {
        for (const auto& [k, name] : KIND_NAMES) {
            if (k == kind) {
                return name;
            }
        }
        return "ClientProtocolFailure";
    }
}  // namespace http::error
