#ifndef UNSAFE_FETCH_CURL_GLOBAL_HPP
#define UNSAFE_FETCH_CURL_GLOBAL_HPP

#include <string>

namespace http::client {

    // Owns curl_global_init/cleanup. Exactly one must outlive every CurlEasy and CurlShare.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] const std::string& version() const { return version_; }
        [[nodiscard]] const std::string& ssl_backend() const { return ssl_backend_; }

       private:
        std::string version_;
        std::string ssl_backend_;
    };

}  // namespace http::client

#endif
