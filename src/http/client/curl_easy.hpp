#ifndef UNSAFE_FETCH_CURL_EASY_HPP
#define UNSAFE_FETCH_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../fetch/cancellation.hpp"
#include "../model/model.hpp"
#include "curl_share.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    struct CurlOptions {
        std::string user_agent_;
        std::chrono::milliseconds connect_timeout_{10'000};
        long max_redirects_ = 10L;
    };

    class CurlEasy : public ITransport {
       public:
        CurlEasy(std::shared_ptr<CurlShare> share, CurlOptions options);

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        ResponseHead perform(const http::model::FetchRequest& req, IResponseSink& sink, const http::fetch::CancellationToken* cancel) override;

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void set_defaults_once();
        void prepare_for_new_request(const http::model::FetchRequest& req);
        void set_headers(const http::model::Headers& hs);
        void perform_throw();
        void emit_head();

        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);
        static int xferinfo_cb(void* userdata, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);

        // per-request scratch, reset by prepare_for_new_request
        ResponseHead head_;
        bool head_emitted_ = false;
        IResponseSink* sink_ = nullptr;
        const http::fetch::CancellationToken* cancel_ = nullptr;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
        std::shared_ptr<CurlShare> share_;
        CurlOptions options_;
    };
}  // namespace http::client

#endif
