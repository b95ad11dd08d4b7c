#include "engine_tracing.hpp"

namespace network {
    void attach_recorder(http::fetch::RetryingFetchEngine& engine, NetworkRecorder& recorder) {
        engine.set_attempt_observer([&recorder](const http::fetch::AttemptRecord& attempt) {
            const CorrelationId id = recorder.next_correlation_id();

            recorder.record_request(RequestEvent{
                .id_ = id,
                .timestamp_ = attempt.started_at_,
                .method_ = "GET",
                .url_ = attempt.request_->url_,
                .headers_ = attempt.request_->headers_,
                .resource_type_ = ENGINE_RESOURCE_TYPE,
            });

            ResponseEvent resp{
                .id_ = id,
                .timestamp_ = std::chrono::system_clock::now(),
                .url_ = attempt.request_->url_,
            };
            if (attempt.response_) {
                resp.status_ = attempt.response_->status_;
                resp.headers_ = attempt.response_->headers_;
                if (!attempt.response_->effective_url_.empty()) {
                    resp.url_ = attempt.response_->effective_url_;
                }
            }
            if (attempt.error_) {
                resp.error_ = std::string(http::error::to_string(*attempt.error_)) + ": " + attempt.error_message_;
            }
            recorder.record_response(std::move(resp));
        });
    }
}  // namespace network
