#ifndef UNSAFE_FETCH_RETRYING_FETCH_ENGINE_HPP
#define UNSAFE_FETCH_RETRYING_FETCH_ENGINE_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

#include "../client/interface.hpp"
#include "../error/error_taxonomy.hpp"
#include "../model/model.hpp"
#include "cancellation.hpp"
#include "progress.hpp"

namespace http::fetch {
    const long DEFAULT_RETRY_DELAY_MS = 1000;

    struct RetryPolicy {
        size_t max_retries_ = 3;  // total attempts, not re-attempts
        std::chrono::milliseconds retry_delay_{DEFAULT_RETRY_DELAY_MS};
        std::chrono::milliseconds max_delay_{0};  // 0 leaves the backoff uncapped
    };

    // retry_delay * 2^attempt_index; capped at max_delay when that is set
    [[nodiscard]] std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, size_t attempt_index);

    struct JsonFetchSuccess {
        http::model::FetchSuccess fetch_;
        nlohmann::json json_;
    };

    using JsonFetchResult = std::variant<JsonFetchSuccess, http::model::FetchFailure>;

    // What one attempt looked like on the wire, handed to the attempt observer.
    struct AttemptRecord {
        const http::model::FetchRequest* request_ = nullptr;
        size_t attempt_index_ = 0;
        std::chrono::system_clock::time_point started_at_;
        std::optional<http::client::ResponseHead> response_;
        std::optional<http::error::ErrorKind> error_;
        std::string error_message_;
    };

    using AttemptObserver = std::function<void(const AttemptRecord&)>;

    // Blocks for the given delay; returns false when the wait was cut short by cancellation.
    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    struct EngineStats {
        size_t fetches_ = 0;
        size_t downloads_ = 0;
        size_t attempts_ = 0;
        size_t successes_ = 0;
        size_t failures_ = 0;
    };

    class RetryingFetchEngine {
       public:
        RetryingFetchEngine(http::client::TransportFactory transport_factory, RetryPolicy policy,
                            std::shared_ptr<CancellationToken> cancel = std::make_shared<CancellationToken>());

        ~RetryingFetchEngine() = default;
        RetryingFetchEngine(const RetryingFetchEngine&) = delete;
        RetryingFetchEngine& operator=(const RetryingFetchEngine&) = delete;
        RetryingFetchEngine(RetryingFetchEngine&&) = delete;
        RetryingFetchEngine& operator=(RetryingFetchEngine&&) = delete;

        // Safe to call concurrently once configured.
        [[nodiscard]] http::model::FetchResult fetch(const http::model::FetchRequest& req);
        [[nodiscard]] JsonFetchResult fetch_json(const http::model::FetchRequest& req);
        [[nodiscard]] http::model::DownloadResult download(const http::model::DownloadRequest& req);

        // Configuration; not synchronized, call before issuing requests.
        void set_attempt_observer(AttemptObserver observer);
        void set_sleeper(Sleeper sleeper);
        void set_progress_reporter(std::shared_ptr<IProgressReporter> reporter);

        [[nodiscard]] const RetryPolicy& policy() const { return policy_; }
        [[nodiscard]] EngineStats stats() const;
        [[nodiscard]] const std::shared_ptr<CancellationToken>& cancellation() const { return cancel_; }

       private:
        enum class AttemptState { ATTEMPTING, SUCCEEDED, RETRYABLE_FAILURE, NON_RETRYABLE_FAILURE, BACKOFF, DONE };

        struct AttemptOutcome {
            AttemptState state_ = AttemptState::SUCCEEDED;
            std::optional<http::client::ResponseHead> head_;
            http::error::ErrorKind kind_ = http::error::ErrorKind::CLIENT_PROTOCOL_FAILURE;
            std::optional<long> http_status_;
            std::string message_;
        };

        struct LoopResult {
            AttemptOutcome last_;
            size_t attempts_ = 0;
            std::chrono::milliseconds elapsed_{0};
        };

        using AttemptFn = std::function<AttemptOutcome(http::client::ITransport&)>;

        LoopResult run_attempts(const http::model::FetchRequest& req, const AttemptFn& attempt);
        AttemptOutcome guarded_attempt(http::client::ITransport& transport, const AttemptFn& attempt) const;
        void notify_observer(const http::model::FetchRequest& req, size_t attempt_index, std::chrono::system_clock::time_point started_at,
                             const AttemptOutcome& outcome) const;

        static AttemptOutcome failed(http::error::ErrorKind kind, std::string message, std::optional<http::client::ResponseHead> head = std::nullopt);
        static http::model::FetchFailure to_failure(const http::model::FetchRequest& req, const LoopResult& loop);

        http::client::TransportFactory transport_factory_;
        RetryPolicy policy_;
        std::shared_ptr<CancellationToken> cancel_;
        AttemptObserver observer_;
        Sleeper sleeper_;
        std::shared_ptr<IProgressReporter> progress_reporter_;

        std::atomic<size_t> fetches_ = 0;
        std::atomic<size_t> downloads_ = 0;
        std::atomic<size_t> attempts_ = 0;
        std::atomic<size_t> successes_ = 0;
        std::atomic<size_t> failures_ = 0;
    };
}  // namespace http::fetch

#endif
