#ifndef UNSAFE_FETCH_BRIDGE_CONTEXT_HPP
#define UNSAFE_FETCH_BRIDGE_CONTEXT_HPP

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

#include "../config/config.hpp"
#include "../http/client/curl_global.hpp"
#include "../http/client/curl_share.hpp"
#include "../http/client/interface.hpp"
#include "../http/fetch/batch_coordinator.hpp"
#include "../http/fetch/cancellation.hpp"
#include "../http/fetch/progress.hpp"
#include "../http/fetch/retrying_fetch_engine.hpp"
#include "../network/network_recorder.hpp"
#include "../session/session_store.hpp"

namespace bridge {
    // Everything one bridge process needs, created once and shut down explicitly.
    class BridgeContext {
        // Only BridgeContextBuilder can name this, so only it can construct a context.
        struct Token {
            explicit Token() = default;
        };

       public:
        explicit BridgeContext(Token /*unused*/) {}
        ~BridgeContext();
        BridgeContext(const BridgeContext&) = delete;
        BridgeContext& operator=(const BridgeContext&) = delete;
        BridgeContext(BridgeContext&&) = delete;
        BridgeContext& operator=(BridgeContext&&) = delete;

        [[nodiscard]] http::fetch::RetryingFetchEngine& engine() { return *engine_; }
        [[nodiscard]] const http::fetch::BatchCoordinator& batch() const { return *batch_; }
        [[nodiscard]] network::NetworkRecorder& recorder() { return *recorder_; }
        [[nodiscard]] const session::SessionStore& sessions() const { return *sessions_; }
        [[nodiscard]] const config::BridgeConfig& config() const { return config_; }

        // Proxy, timeout and TLS flag come from the configuration.
        [[nodiscard]] http::model::FetchRequest make_request(const std::string& url, http::model::Headers headers = {}) const;

        // Relative paths land under download_dir.
        [[nodiscard]] std::filesystem::path resolve_download_path(const std::filesystem::path& path) const;
        // Relative paths land under log_dir.
        [[nodiscard]] std::filesystem::path resolve_trace_path(const std::filesystem::path& path) const;

        // Cancels in-flight work; idempotent.
        void shutdown();
        [[nodiscard]] bool is_shut_down() const { return shut_down_; }

       private:
        friend class BridgeContextBuilder;

        config::BridgeConfig config_;
        std::unique_ptr<http::client::CurlGlobal> curl_global_;
        std::shared_ptr<http::client::CurlShare> curl_share_;
        std::shared_ptr<http::fetch::CancellationToken> cancel_;
        std::unique_ptr<network::NetworkRecorder> recorder_;
        std::unique_ptr<http::fetch::RetryingFetchEngine> engine_;
        std::unique_ptr<http::fetch::BatchCoordinator> batch_;
        std::unique_ptr<session::SessionStore> sessions_;
        std::atomic<bool> shut_down_ = false;
    };

    class BridgeContextBuilder {
       public:
        BridgeContextBuilder();

        BridgeContextBuilder& with_config(const config::BridgeConfig& config);
        // Replaces the libcurl transport; no curl runtime is started then.
        BridgeContextBuilder& with_transport_factory(http::client::TransportFactory transport_factory);
        BridgeContextBuilder& with_sleeper(http::fetch::Sleeper sleeper);
        BridgeContextBuilder& with_progress_reporter(std::shared_ptr<http::fetch::IProgressReporter> reporter);
        BridgeContextBuilder& with_network_tracing(bool enabled);
        BridgeContextBuilder& validate();
        std::unique_ptr<BridgeContext> build();

       private:
        std::unique_ptr<BridgeContext> context_;
        http::client::TransportFactory transport_factory_;
        http::fetch::Sleeper sleeper_;
        std::shared_ptr<http::fetch::IProgressReporter> progress_reporter_;
        bool network_tracing_ = true;
    };
}  // namespace bridge

#endif
