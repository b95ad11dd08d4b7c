#include "curl_share.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace http::client {
    namespace {
        void check(CURLSHcode rc) {
            if (rc != CURLSHE_OK) {
                throw std::runtime_error(std::string("curl_share_setopt failed: ") + curl_share_strerror(rc));
            }
        }
    }  // namespace

    CurlShare::CurlShare() : handle_(curl_share_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL share handle");
        }

        try {
            check(curl_share_setopt(handle_, CURLSHOPT_LOCKFUNC, &CurlShare::lock_cb));
            check(curl_share_setopt(handle_, CURLSHOPT_UNLOCKFUNC, &CurlShare::unlock_cb));
            check(curl_share_setopt(handle_, CURLSHOPT_USERDATA, this));

            share(CURL_LOCK_DATA_DNS);
            share(CURL_LOCK_DATA_SSL_SESSION);
            // CURL_LOCK_DATA_CONNECT is left out: libcurl does not support sharing live
            // connections between threads.
        } catch (const std::runtime_error&) {
            curl_share_cleanup(handle_);
            throw;
        }
    }

    CurlShare::~CurlShare() {
        if (handle_ != nullptr) {
            curl_share_cleanup(handle_);
        }
    }

    void CurlShare::share(curl_lock_data data) { check(curl_share_setopt(handle_, CURLSHOPT_SHARE, data)); }

    void CurlShare::lock_cb(CURL* /*handle*/, curl_lock_data data, curl_lock_access /*access*/, void* userptr) {
        auto* self = static_cast<CurlShare*>(userptr);
        self->locks_.at(static_cast<size_t>(data)).lock();
    }

    void CurlShare::unlock_cb(CURL* /*handle*/, curl_lock_data data, void* userptr) {
        auto* self = static_cast<CurlShare*>(userptr);
        self->locks_.at(static_cast<size_t>(data)).unlock();
    }

}  // namespace http::client
