#include "curl_easy.hpp"

#include <curl/curl.h>

#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/error_taxonomy.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long NO_PROGRESS = 0L;  // progress callback carries cancellation
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long HTTP_GET = 1L;
        static constexpr long VERIFY_PEER = 1L;
        static constexpr long VERIFY_HOST = 2L;
        static constexpr long NO_VERIFY = 0L;
        static constexpr const char* CUSTOM_REQUEST = nullptr;
        static constexpr const char* NO_PROXY = nullptr;
    };

    struct HeaderKeys {
        static constexpr const char* STATUS_LINE = "HTTP/";
        static constexpr const char* CONTENT_LENGTH = "content-length";
    };

    CurlEasy::CurlEasy(std::shared_ptr<CurlShare> share, CurlOptions options)
        : handle_(curl_easy_init()), share_(std::move(share)), options_(std::move(options)) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once();
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_defaults_once() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, options_.max_redirects_);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout_.count()));
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_XFERINFOFUNCTION, &CurlEasy::xferinfo_cb);
        setopt(CURLOPT_XFERINFODATA, static_cast<void*>(this));
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, static_cast<void*>(this));
        setopt(CURLOPT_WRITEFUNCTION, &CurlEasy::write_cb);
        setopt(CURLOPT_WRITEDATA, static_cast<void*>(this));

        if (!options_.user_agent_.empty()) {
            setopt(CURLOPT_USERAGENT, options_.user_agent_.c_str());
        }
        if (share_ != nullptr) {
            setopt(CURLOPT_SHARE, share_->handle());
        }
    }

    void CurlEasy::set_headers(const http::model::Headers& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& [name, value] : hs) {
            const std::string line = name + ": " + value;
            headers_ = curl_slist_append(headers_, line.c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::prepare_for_new_request(const http::model::FetchRequest& req) {
        // Clear per-request scratch
        head_ = ResponseHead{};
        head_emitted_ = false;
        error_buf_[0] = '\0';

        // Always set these per request (don't rely on old values)
        setopt(CURLOPT_URL, req.url_.c_str());
        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_CUSTOMREQUEST, CurlDefaults::CUSTOM_REQUEST);
        setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout_.count()));
        setopt(CURLOPT_PROXY, req.proxy_ ? req.proxy_->c_str() : CurlDefaults::NO_PROXY);

        if (req.verify_ssl_) {
            setopt(CURLOPT_SSL_VERIFYPEER, CurlDefaults::VERIFY_PEER);
            setopt(CURLOPT_SSL_VERIFYHOST, CurlDefaults::VERIFY_HOST);
        } else {
            setopt(CURLOPT_SSL_VERIFYPEER, CurlDefaults::NO_VERIFY);
            setopt(CURLOPT_SSL_VERIFYHOST, CurlDefaults::NO_VERIFY);
        }

        set_headers(req.headers_);
    }

    ResponseHead CurlEasy::perform(const http::model::FetchRequest& req, IResponseSink& sink, const http::fetch::CancellationToken* cancel) {
        sink_ = &sink;
        cancel_ = cancel;

        try {
            prepare_for_new_request(req);
        } catch (const std::runtime_error& e) {
            throw http::error::TransportError(http::error::ErrorKind::CLIENT_PROTOCOL_FAILURE, e.what());
        }

        LOG_DEBUG("-> GET %s", req.url_.c_str());
        perform_throw();

        // Bodiless responses never reach write_cb.
        emit_head();

        sink_ = nullptr;
        cancel_ = nullptr;
        return head_;
    }

    void CurlEasy::emit_head() {
        if (head_emitted_) {
            return;
        }
        head_emitted_ = true;

        char* eff = nullptr;
        if (curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &head_.status_) != CURLE_OK) {
            LOG_WARN("Response code unavailable");
        }
        if (curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff) != CURLE_OK) {
            eff = nullptr;
        }
        head_.effective_url_ = eff != nullptr ? eff : std::string{};

        sink_->on_head(head_);
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        // A new status line starts a new response (redirect hop); only the last one counts.
        if (string_utils::ieq_prefix(buffer, bytes, HeaderKeys::STATUS_LINE)) {
            self->head_.headers_.clear();
            self->head_.content_length_.reset();
            return bytes;
        }

        const std::string_view line(buffer, bytes);
        const size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            return bytes;
        }

        std::string name = string_utils::trim(std::string(line.substr(0, colon)));
        std::string value = string_utils::trim(std::string(line.substr(colon + 1)));

        if (string_utils::to_lower(name) == HeaderKeys::CONTENT_LENGTH) {
            char* end = nullptr;
            const unsigned long long length = std::strtoull(value.c_str(), &end, constants::BASE_10);
            if (end != value.c_str()) {
                self->head_.content_length_ = length;
            }
        }

        auto [it, inserted] = self->head_.headers_.emplace(std::move(name), value);
        if (!inserted) {
            it->second += ", " + value;
        }

        return bytes;
    }

    size_t CurlEasy::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t total = size * nmemb;

        self->emit_head();

        if (!self->sink_->on_body(std::string_view(ptr, total))) {
            return 0;  // CURLE_WRITE_ERROR
        }
        return total;
    }

    int CurlEasy::xferinfo_cb(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
        const auto* self = static_cast<CurlEasy*>(userdata);
        return (self->cancel_ != nullptr && self->cancel_->is_cancelled()) ? 1 : 0;
    }

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::perform_throw() {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK) {
            return;
        }

        sink_ = nullptr;
        cancel_ = nullptr;

        std::string err;
        if (error_buf_[0] != '\0') {
            err = error_buf_.data();
        } else {
            err = curl_easy_strerror(rc);
        }

        throw http::error::TransportError(http::error::classify(rc), err);
    }

}  // namespace http::client
