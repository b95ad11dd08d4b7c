#ifndef UNSAFE_FETCH_CURL_SHARE_HPP
#define UNSAFE_FETCH_CURL_SHARE_HPP

#include <curl/curl.h>

#include <array>
#include <mutex>

namespace http::client {

    // One DNS/TLS-session cache shared by every CurlEasy an engine hands out.
    // libcurl calls back into lock()/unlock() from whichever thread uses an easy handle.
    class CurlShare {
       public:
        CurlShare();

        ~CurlShare();
        CurlShare(const CurlShare&) = delete;
        CurlShare& operator=(const CurlShare&) = delete;
        CurlShare(CurlShare&&) = delete;
        CurlShare& operator=(CurlShare&&) = delete;

        [[nodiscard]] CURLSH* handle() const { return handle_; }

       private:
        static void lock_cb(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
        static void unlock_cb(CURL* handle, curl_lock_data data, void* userptr);

        void share(curl_lock_data data);

        CURLSH* handle_{};
        std::array<std::mutex, CURL_LOCK_DATA_LAST> locks_;
    };

}  // namespace http::client

#endif
