#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>

#include "../../utils/logging.hpp"

namespace http::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
        }

        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        version_ = info->version != nullptr ? info->version : "unknown";
        ssl_backend_ = info->ssl_version != nullptr ? info->ssl_version : "";

        if ((info->features & CURL_VERSION_SSL) == 0) {
            LOG_WARN("libcurl %s was built without TLS support, https:// URLs will fail", version_.c_str());
        }
        LOG_DEBUG("libcurl %s initialized (tls: %s)", version_.c_str(), ssl_backend_.empty() ? "none" : ssl_backend_.c_str());
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

}  // namespace http::client
