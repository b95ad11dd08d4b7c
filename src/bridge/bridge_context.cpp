#include "bridge_context.hpp"

#include <stdexcept>

#include "../http/client/curl_easy.hpp"
#include "../network/engine_tracing.hpp"
#include "../utils/logging.hpp"

namespace bridge {

    //
    // BridgeContextBuilder implementation
    //

    BridgeContextBuilder::BridgeContextBuilder() : context_(std::make_unique<BridgeContext>(BridgeContext::Token{})) {}

    BridgeContextBuilder& BridgeContextBuilder::with_config(const config::BridgeConfig& config) {
        context_->config_ = config;
        return *this;
    }

    BridgeContextBuilder& BridgeContextBuilder::with_transport_factory(http::client::TransportFactory transport_factory) {
        transport_factory_ = std::move(transport_factory);
        return *this;
    }

    BridgeContextBuilder& BridgeContextBuilder::with_sleeper(http::fetch::Sleeper sleeper) {
        sleeper_ = std::move(sleeper);
        return *this;
    }

    BridgeContextBuilder& BridgeContextBuilder::with_progress_reporter(std::shared_ptr<http::fetch::IProgressReporter> reporter) {
        progress_reporter_ = std::move(reporter);
        return *this;
    }

    BridgeContextBuilder& BridgeContextBuilder::with_network_tracing(bool enabled) {
        network_tracing_ = enabled;
        return *this;
    }

    BridgeContextBuilder& BridgeContextBuilder::validate() {
        if (context_ == nullptr) {
            throw std::runtime_error("Builder already used");
        }
        config::validate(context_->config_);
        return *this;
    }

    std::unique_ptr<BridgeContext> BridgeContextBuilder::build() {
        validate();

        auto& ctx = *context_;
        const auto& cfg = ctx.config_;

        if (transport_factory_ == nullptr) {
            ctx.curl_global_ = std::make_unique<http::client::CurlGlobal>();
            ctx.curl_share_ = std::make_shared<http::client::CurlShare>();

            transport_factory_ = [share = ctx.curl_share_, options = http::client::CurlOptions{
                                                                .user_agent_ = cfg.user_agent_,
                                                                .connect_timeout_ = cfg.connect_timeout_,
                                                            }]() { return std::make_unique<http::client::CurlEasy>(share, options); };
        }

        ctx.cancel_ = std::make_shared<http::fetch::CancellationToken>();
        ctx.recorder_ = std::make_unique<network::NetworkRecorder>(cfg.recorder_capacity_);
        ctx.engine_ = std::make_unique<http::fetch::RetryingFetchEngine>(std::move(transport_factory_),
                                                                        http::fetch::RetryPolicy{
                                                                            .max_retries_ = cfg.max_retries_,
                                                                            .retry_delay_ = cfg.retry_delay_,
                                                                            .max_delay_ = cfg.max_delay_,
                                                                        },
                                                                        ctx.cancel_);
        if (sleeper_ != nullptr) {
            ctx.engine_->set_sleeper(std::move(sleeper_));
        }
        ctx.engine_->set_progress_reporter(progress_reporter_ != nullptr ? std::move(progress_reporter_)
                                                                         : std::make_shared<http::fetch::ConsoleProgressBar>());
        if (network_tracing_) {
            network::attach_recorder(*ctx.engine_, *ctx.recorder_);
        }

        ctx.batch_ = std::make_unique<http::fetch::BatchCoordinator>(ctx.engine_.get(), http::fetch::BatchOptions{.max_in_flight_ = cfg.max_in_flight_});
        ctx.sessions_ = std::make_unique<session::SessionStore>(cfg.session_dir_);

        LOG_INFO("Bridge ready (sessions: %s, downloads: %s, verify ssl: %s)", cfg.session_dir_.c_str(), cfg.download_dir_.c_str(),
                 cfg.verify_ssl_ ? "yes" : "no");

        return std::move(context_);
    }

    //
    // BridgeContext implementation
    //

    BridgeContext::~BridgeContext() { shutdown(); }

    http::model::FetchRequest BridgeContext::make_request(const std::string& url, http::model::Headers headers) const {
        return http::model::FetchRequest{
            .url_ = url,
            .headers_ = std::move(headers),
            .proxy_ = config_.proxy_,
            .timeout_ = config_.timeout_,
            .verify_ssl_ = config_.verify_ssl_,
        };
    }

    std::filesystem::path BridgeContext::resolve_download_path(const std::filesystem::path& path) const {
        return path.is_absolute() ? path : config_.download_dir_ / path;
    }

    std::filesystem::path BridgeContext::resolve_trace_path(const std::filesystem::path& path) const {
        return path.is_absolute() ? path : config_.log_dir_ / path;
    }

    void BridgeContext::shutdown() {
        if (shut_down_.exchange(true)) {
            return;
        }
        if (cancel_ != nullptr) {
            cancel_->cancel();
        }
        LOG_DEBUG("Bridge shut down");
    }
}  // namespace bridge
