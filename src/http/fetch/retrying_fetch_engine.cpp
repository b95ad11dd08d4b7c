#include "retrying_fetch_engine.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "../../utils/constants.hpp"
#include "../../utils/logging.hpp"
#include "../../utils/string_utils.hpp"
#include "text_decoding.hpp"

using namespace std::chrono;

namespace http::fetch {
    namespace {
        using http::error::ErrorKind;

        long long to_ms(milliseconds d) { return static_cast<long long>(d.count()); }

        std::string http_status_message(long status, const std::string& preview) {
            std::string msg = "HTTP " + std::to_string(status);
            if (!preview.empty()) {
                msg += ": " + preview;
            }
            return msg;
        }

        class BufferSink : public http::client::IResponseSink {
           public:
            void on_head(const http::client::ResponseHead& head) override {
                if (head.content_length_) {
                    body_.reserve(static_cast<size_t>(*head.content_length_));
                }
            }

            bool on_body(std::string_view chunk) override {
                body_.append(chunk);
                return true;
            }

            std::string body_;
        };

        // Streams into the destination in fixed-size chunks; one sink per attempt.
        class FileSink : public http::client::IResponseSink {
           public:
            FileSink(const http::model::DownloadRequest& req, IProgressReporter* reporter, steady_clock::time_point started)
                : req_(req), reporter_(req.show_progress_ ? reporter : nullptr), started_(started) {}

            void on_head(const http::client::ResponseHead& head) override {
                if (http::error::classify_status(head.status_)) {
                    rejected_ = true;
                    return;
                }

                total_ = head.content_length_;

                std::error_code ec;
                if (req_.destination_.has_parent_path()) {
                    std::filesystem::create_directories(req_.destination_.parent_path(), ec);
                }

                out_.open(req_.destination_, std::ios::binary | std::ios::trunc);
                if (!out_) {
                    io_error_ = "open failed: " + req_.destination_.string();
                }
            }

            bool on_body(std::string_view chunk) override {
                if (rejected_) {
                    if (preview_.size() < constants::ERROR_BODY_PREVIEW_CHARS * 4) {
                        preview_.append(chunk.substr(0, constants::ERROR_BODY_PREVIEW_CHARS * 4 - preview_.size()));
                    }
                    return true;
                }
                if (io_error_) {
                    return false;
                }

                pending_.append(chunk);
                while (pending_.size() >= constants::DOWNLOAD_CHUNK_BYTES) {
                    if (!write_chunk(std::string_view(pending_).substr(0, constants::DOWNLOAD_CHUNK_BYTES))) {
                        return false;
                    }
                    pending_.erase(0, constants::DOWNLOAD_CHUNK_BYTES);
                }
                return true;
            }

            // Writes the short tail chunk and closes the file.
            bool finish() {
                if (rejected_ || io_error_) {
                    return !io_error_;
                }
                if (!out_.is_open()) {
                    // no head was delivered
                    return true;
                }
                if (!pending_.empty()) {
                    if (!write_chunk(pending_)) {
                        return false;
                    }
                    pending_.clear();
                }
                out_.close();
                if (out_.fail()) {
                    io_error_ = "close failed: " + req_.destination_.string();
                    return false;
                }
                return true;
            }

            [[nodiscard]] bool rejected() const { return rejected_; }
            [[nodiscard]] const std::optional<std::string>& io_error() const { return io_error_; }
            [[nodiscard]] const std::string& preview() const { return preview_; }
            [[nodiscard]] std::uint64_t bytes_written() const { return bytes_written_; }

           private:
            bool write_chunk(std::string_view chunk) {
                out_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
                if (!out_) {
                    io_error_ = "write failed: " + req_.destination_.string();
                    return false;
                }
                bytes_written_ += chunk.size();

                if (reporter_ != nullptr && total_ && *total_ > 0) {
                    reporter_->update(DownloadProgress{
                        .url_ = req_.fetch_.url_,
                        .filename_ = req_.destination_.filename().string(),
                        .total_bytes_ = *total_,
                        .downloaded_bytes_ = bytes_written_,
                        .elapsed_ = duration_cast<milliseconds>(steady_clock::now() - started_),
                    });
                }
                return true;
            }

            const http::model::DownloadRequest& req_;
            IProgressReporter* reporter_;
            steady_clock::time_point started_;
            std::optional<std::uint64_t> total_;
            std::ofstream out_;
            std::string pending_;
            std::string preview_;
            std::uint64_t bytes_written_ = 0;
            bool rejected_ = false;
            std::optional<std::string> io_error_;
        };
    }  // namespace

    milliseconds backoff_delay(const RetryPolicy& policy, size_t attempt_index) {
        const bool capped = policy.max_delay_.count() > 0;
        milliseconds delay = policy.retry_delay_;
        for (size_t i = 0; i < attempt_index; ++i) {
            if ((capped && delay >= policy.max_delay_) || delay > milliseconds::max() / 2) {
                break;
            }
            delay *= 2;
        }
        return capped ? std::min(delay, policy.max_delay_) : delay;
    }

    RetryingFetchEngine::RetryingFetchEngine(http::client::TransportFactory transport_factory, RetryPolicy policy, std::shared_ptr<CancellationToken> cancel)
        : transport_factory_(std::move(transport_factory)), policy_(policy), cancel_(std::move(cancel)) {
        if (transport_factory_ == nullptr) {
            throw std::invalid_argument("RetryingFetchEngine requires a transport factory");
        }
        if (policy_.max_retries_ == 0) {
            throw std::invalid_argument("max_retries must be at least 1");
        }
        if (cancel_ == nullptr) {
            cancel_ = std::make_shared<CancellationToken>();
        }

        sleeper_ = [token = cancel_](milliseconds delay) { return token->wait_for(delay); };

        LOG_INFO("Fetcher initialized (max retries: %zu, retry delay: %lld ms)", policy_.max_retries_, to_ms(policy_.retry_delay_));
    }

    void RetryingFetchEngine::set_attempt_observer(AttemptObserver observer) { observer_ = std::move(observer); }

    void RetryingFetchEngine::set_sleeper(Sleeper sleeper) {
        if (sleeper == nullptr) {
            throw std::invalid_argument("sleeper must not be empty");
        }
        sleeper_ = std::move(sleeper);
    }

    void RetryingFetchEngine::set_progress_reporter(std::shared_ptr<IProgressReporter> reporter) { progress_reporter_ = std::move(reporter); }

    EngineStats RetryingFetchEngine::stats() const {
        return EngineStats{
            .fetches_ = fetches_.load(),
            .downloads_ = downloads_.load(),
            .attempts_ = attempts_.load(),
            .successes_ = successes_.load(),
            .failures_ = failures_.load(),
        };
    }

    RetryingFetchEngine::AttemptOutcome RetryingFetchEngine::failed(ErrorKind kind, std::string message, std::optional<http::client::ResponseHead> head) {
        AttemptOutcome outcome;
        outcome.state_ = http::error::is_retryable(kind) ? AttemptState::RETRYABLE_FAILURE : AttemptState::NON_RETRYABLE_FAILURE;
        outcome.kind_ = kind;
        outcome.message_ = std::move(message);
        outcome.head_ = std::move(head);
        return outcome;
    }

    RetryingFetchEngine::AttemptOutcome RetryingFetchEngine::guarded_attempt(http::client::ITransport& transport, const AttemptFn& attempt) const {
        // Pipeline boundary: nothing thrown below this point reaches the caller.
        try {
            return attempt(transport);
        } catch (const http::error::TransportError& e) {
            return failed(e.kind_, e.what());
        } catch (const std::exception& e) {
            return failed(ErrorKind::CLIENT_PROTOCOL_FAILURE, e.what());
        } catch (...) {
            return failed(ErrorKind::CLIENT_PROTOCOL_FAILURE, "unknown exception");
        }
    }

    void RetryingFetchEngine::notify_observer(const http::model::FetchRequest& req, size_t attempt_index, system_clock::time_point started_at,
                                              const AttemptOutcome& outcome) const {
        if (observer_ == nullptr) {
            return;
        }

        AttemptRecord record;
        record.request_ = &req;
        record.attempt_index_ = attempt_index;
        record.started_at_ = started_at;
        record.response_ = outcome.head_;
        if (outcome.state_ != AttemptState::SUCCEEDED && outcome.kind_ != ErrorKind::HTTP_STATUS_FAILURE) {
            record.error_ = outcome.kind_;
            record.error_message_ = outcome.message_;
        }

        try {
            observer_(record);
        } catch (const std::exception& e) {
            LOG_WARN("attempt observer threw, ignoring: %s", e.what());
        } catch (...) {
            LOG_WARN("attempt observer threw a non-standard exception, ignoring");
        }
    }

    RetryingFetchEngine::LoopResult RetryingFetchEngine::run_attempts(const http::model::FetchRequest& req, const AttemptFn& attempt) {
        const auto started = steady_clock::now();
        LoopResult loop;

        std::unique_ptr<http::client::ITransport> transport;
        try {
            transport = transport_factory_();
        } catch (const std::exception& e) {
            loop.last_ = failed(ErrorKind::CLIENT_PROTOCOL_FAILURE, std::string("transport unavailable: ") + e.what());
        }
        if (transport == nullptr && loop.last_.message_.empty()) {
            loop.last_ = failed(ErrorKind::CLIENT_PROTOCOL_FAILURE, "transport unavailable");
        }

        AttemptState state = transport != nullptr ? AttemptState::ATTEMPTING : AttemptState::DONE;
        size_t attempt_index = 0;

        while (state != AttemptState::DONE) {
            switch (state) {
                case AttemptState::ATTEMPTING: {
                    if (cancel_->is_cancelled()) {
                        loop.last_ = failed(ErrorKind::CANCELLED, "cancelled before attempt " + std::to_string(attempt_index + 1));
                        state = AttemptState::DONE;
                        break;
                    }

                    LOG_DEBUG("Attempt %zu/%zu: %s", attempt_index + 1, policy_.max_retries_, req.url_.c_str());
                    const auto attempt_started = system_clock::now();
                    loop.last_ = guarded_attempt(*transport, attempt);
                    ++loop.attempts_;
                    ++attempts_;
                    notify_observer(req, attempt_index, attempt_started, loop.last_);

                    state = loop.last_.state_;
                    break;
                }

                case AttemptState::RETRYABLE_FAILURE:
                    LOG_WARN("%s on attempt %zu/%zu: %s", http::error::to_string(loop.last_.kind_), loop.attempts_, policy_.max_retries_,
                             loop.last_.message_.c_str());
                    state = loop.attempts_ < policy_.max_retries_ ? AttemptState::BACKOFF : AttemptState::DONE;
                    break;

                case AttemptState::BACKOFF: {
                    const milliseconds delay = backoff_delay(policy_, attempt_index);
                    LOG_INFO("Retrying in %lld ms...", to_ms(delay));
                    if (!sleeper_(delay) || cancel_->is_cancelled()) {
                        loop.last_ = failed(ErrorKind::CANCELLED, "cancelled during backoff");
                        state = AttemptState::DONE;
                        break;
                    }
                    ++attempt_index;
                    state = AttemptState::ATTEMPTING;
                    break;
                }

                case AttemptState::SUCCEEDED:
                case AttemptState::NON_RETRYABLE_FAILURE:
                case AttemptState::DONE:
                    state = AttemptState::DONE;
                    break;
            }
        }

        loop.elapsed_ = duration_cast<milliseconds>(steady_clock::now() - started);

        if (loop.last_.state_ == AttemptState::SUCCEEDED) {
            ++successes_;
        } else {
            ++failures_;
            if (loop.last_.state_ == AttemptState::RETRYABLE_FAILURE) {
                LOG_ERROR("All %zu attempts failed: %s", loop.attempts_, loop.last_.message_.c_str());
            }
        }

        return loop;
    }

    http::model::FetchFailure RetryingFetchEngine::to_failure(const http::model::FetchRequest& req, const LoopResult& loop) {
        return http::model::FetchFailure{
            .kind_ = loop.last_.kind_,
            .http_status_ = loop.last_.http_status_,
            .message_ = loop.last_.message_,
            .url_ = req.url_,
            .elapsed_ = loop.elapsed_,
            .attempts_ = loop.attempts_,
        };
    }

    http::model::FetchResult RetryingFetchEngine::fetch(const http::model::FetchRequest& req) {
        ++fetches_;
        LOG_INFO("Fetching: %s", req.url_.c_str());

        std::string body;

        const LoopResult loop = run_attempts(req, [&](http::client::ITransport& transport) {
            BufferSink sink;
            http::client::ResponseHead head = transport.perform(req, sink, cancel_.get());
            head.headers_ = decode_headers(std::move(head.headers_));

            if (auto kind = http::error::classify_status(head.status_)) {
                const std::string preview = string_utils::truncate(decode_body(std::move(sink.body_)), constants::ERROR_BODY_PREVIEW_CHARS);
                AttemptOutcome outcome = failed(*kind, http_status_message(head.status_, preview), std::move(head));
                outcome.http_status_ = outcome.head_->status_;
                return outcome;
            }

            body = std::move(sink.body_);
            AttemptOutcome outcome;
            outcome.state_ = AttemptState::SUCCEEDED;
            outcome.head_ = std::move(head);
            return outcome;
        });

        if (loop.last_.state_ != AttemptState::SUCCEEDED) {
            LOG_DEBUG("Fetch failed (%s): %s", http::error::to_string(loop.last_.kind_), loop.last_.message_.c_str());
            return to_failure(req, loop);
        }

        const http::client::ResponseHead& head = *loop.last_.head_;
        const size_t size = body.size();

        LOG_INFO("Success: %s (%ld) - %zu bytes in %lld ms", req.url_.c_str(), head.status_, size, to_ms(loop.elapsed_));

        return http::model::FetchSuccess{
            .url_ = head.effective_url_.empty() ? req.url_ : head.effective_url_,
            .status_ = head.status_,
            .headers_ = head.headers_,
            .content_ = decode_body(std::move(body)),
            .size_ = size,
            .elapsed_ = loop.elapsed_,
            .ssl_verified_ = req.verify_ssl_,
            .attempts_ = loop.attempts_,
        };
    }

    JsonFetchResult RetryingFetchEngine::fetch_json(const http::model::FetchRequest& req) {
        LOG_INFO("Fetching JSON: %s", req.url_.c_str());

        http::model::FetchResult result = fetch(req);
        if (auto* failure = std::get_if<http::model::FetchFailure>(&result)) {
            return std::move(*failure);
        }

        auto& success = std::get<http::model::FetchSuccess>(result);
        try {
            nlohmann::json parsed = nlohmann::json::parse(success.content_);
            LOG_DEBUG("JSON parsed successfully: %zu items", parsed.size());
            return JsonFetchSuccess{.fetch_ = std::move(success), .json_ = std::move(parsed)};
        } catch (const nlohmann::json::parse_error& e) {
            const std::string msg = std::string("JSON parse error: ") + e.what();
            LOG_ERROR("%s", msg.c_str());
            return http::model::FetchFailure{
                .kind_ = ErrorKind::PARSE_FAILURE,
                .http_status_ = success.status_,
                .message_ = msg,
                .url_ = req.url_,
                .elapsed_ = success.elapsed_,
                .attempts_ = success.attempts_,
            };
        }
    }

    http::model::DownloadResult RetryingFetchEngine::download(const http::model::DownloadRequest& req) {
        ++downloads_;
        LOG_INFO("Downloading: %s -> %s", req.fetch_.url_.c_str(), req.destination_.c_str());

        const auto started = steady_clock::now();
        std::uint64_t bytes_written = 0;

        const LoopResult loop = run_attempts(req.fetch_, [&](http::client::ITransport& transport) {
            FileSink sink(req, progress_reporter_.get(), started);

            http::client::ResponseHead head;
            try {
                head = transport.perform(req.fetch_, sink, cancel_.get());
            } catch (const http::error::TransportError& e) {
                // A refused write surfaces from libcurl as a generic write error; report the real cause.
                if (sink.io_error()) {
                    throw http::error::TransportError(ErrorKind::IO_FAILURE, *sink.io_error());
                }
                throw;
            }
            head.headers_ = decode_headers(std::move(head.headers_));

            if (sink.rejected()) {
                const std::string preview = string_utils::truncate(decode_body(sink.preview()), constants::ERROR_BODY_PREVIEW_CHARS);
                AttemptOutcome outcome = failed(ErrorKind::HTTP_STATUS_FAILURE, http_status_message(head.status_, preview), head);
                outcome.http_status_ = head.status_;
                return outcome;
            }

            if (!sink.finish()) {
                return failed(ErrorKind::IO_FAILURE, sink.io_error().value_or("write failed"), head);
            }

            bytes_written = sink.bytes_written();
            AttemptOutcome outcome;
            outcome.state_ = AttemptState::SUCCEEDED;
            outcome.head_ = std::move(head);
            return outcome;
        });

        if (loop.last_.state_ != AttemptState::SUCCEEDED) {
            LOG_ERROR("Download failed: %s", loop.last_.message_.c_str());
            return http::model::DownloadFailure{.failure_ = to_failure(req.fetch_, loop), .output_path_ = req.destination_};
        }

        LOG_INFO("Downloaded: %s (%llu bytes in %lld ms)", req.destination_.c_str(), static_cast<unsigned long long>(bytes_written), to_ms(loop.elapsed_));

        return http::model::DownloadSuccess{
            .url_ = req.fetch_.url_,
            .status_ = loop.last_.head_->status_,
            .output_path_ = req.destination_,
            .bytes_written_ = bytes_written,
            .elapsed_ = loop.elapsed_,
            .attempts_ = loop.attempts_,
        };
    }
}  // namespace http::fetch
