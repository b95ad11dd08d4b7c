#include "tool_dispatch.hpp"

#include <algorithm>
#include <utility>

#include "../network/har.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging.hpp"
#include "../utils/string_utils.hpp"

namespace tools {
    namespace {
        constexpr double MS_PER_S = 1000.0;
        constexpr size_t LISTED_DOMAINS = 3;

        double seconds(std::chrono::milliseconds d) { return static_cast<double>(d.count()) / MS_PER_S; }

        ToolResponse ok(nlohmann::ordered_json payload) { return ToolResponse{.is_error_ = false, .payload_ = std::move(payload)}; }

        ToolResponse error(std::string message) {
            return ToolResponse{.is_error_ = true, .payload_ = nlohmann::ordered_json{{"success", false}, {"error", std::move(message)}}};
        }

        ToolResponse from_store_error(const session::StoreError& e) {
            ToolResponse r = error(e.message_);
            r.payload_["error_type"] = session::to_string(e.kind_);
            return r;
        }

        nlohmann::ordered_json session_message(const session::SessionRecord& record) {
            std::string message = "Session loaded: " + record.name_ + "\n";
            message += "   Cookies: " + std::to_string(record.cookie_count_) + " from " + std::to_string(record.domains_.size()) + " domains\n";

            if (!record.domains_.empty()) {
                message += "   Domains: ";
                const size_t shown = std::min(LISTED_DOMAINS, record.domains_.size());
                for (size_t i = 0; i < shown; ++i) {
                    message += (i == 0 ? "" : ", ") + record.domains_[i];
                }
                if (record.domains_.size() > LISTED_DOMAINS) {
                    message += " +" + std::to_string(record.domains_.size() - LISTED_DOMAINS) + " more";
                }
                message += "\n";
            }
            if (record.current_url_) {
                message += "   Saved URL: " + *record.current_url_;
            }
            return message;
        }

        class Dispatcher {
           public:
            explicit Dispatcher(bridge::BridgeContext& context) : ctx_(context) {}

            ToolResponse operator()(const FetchCommand& cmd) const {
                auto result = ctx_.engine().fetch(ctx_.make_request(cmd.url_, cmd.headers_));
                return respond(to_json(result, constants::FETCH_PREVIEW_CHARS), http::model::succeeded(result));
            }

            ToolResponse operator()(const FetchJsonCommand& cmd) const {
                auto result = ctx_.engine().fetch_json(ctx_.make_request(cmd.url_, cmd.headers_));
                if (const auto* failure = std::get_if<http::model::FetchFailure>(&result)) {
                    return respond(to_json(*failure), false);
                }

                auto& success = std::get<http::fetch::JsonFetchSuccess>(result);
                nlohmann::ordered_json payload = to_json(http::model::FetchResult(success.fetch_), 0);
                payload.erase("content");
                payload.erase("content_truncated");
                payload["json"] = success.json_;
                return ok(std::move(payload));
            }

            ToolResponse operator()(const DownloadCommand& cmd) const {
                const auto destination = ctx_.resolve_download_path(cmd.filename_);
                auto result = ctx_.engine().download(http::model::DownloadRequest{
                    .fetch_ = ctx_.make_request(cmd.url_),
                    .destination_ = destination,
                    .show_progress_ = cmd.show_progress_,
                });

                if (const auto* failure = std::get_if<http::model::DownloadFailure>(&result)) {
                    nlohmann::ordered_json payload = to_json(failure->failure_);
                    payload["output_path"] = failure->output_path_.string();
                    return respond(std::move(payload), false);
                }

                const auto& success = std::get<http::model::DownloadSuccess>(result);
                return ok(nlohmann::ordered_json{
                    {"success", true},
                    {"url", success.url_},
                    {"status", success.status_},
                    {"output_path", success.output_path_.string()},
                    {"size", success.bytes_written_},
                    {"elapsed", seconds(success.elapsed_)},
                    {"attempts", success.attempts_},
                    {"message", "Downloaded " + std::to_string(success.bytes_written_) + " bytes to " + success.output_path_.string()},
                });
            }

            ToolResponse operator()(const BatchFetchCommand& cmd) const {
                const auto results = ctx_.batch().batch_fetch(cmd.urls_, ctx_.make_request(""));

                auto list = nlohmann::ordered_json::array();
                for (const auto& r : results) {
                    list.push_back(to_json(r, constants::BATCH_PREVIEW_CHARS));
                }
                return ok(nlohmann::ordered_json{{"results", std::move(list)}});
            }

            ToolResponse operator()(const SaveSessionCommand& cmd) const {
                auto saved = ctx_.sessions().save(cmd.cookies_, cmd.current_url_, cmd.name_);
                if (const auto* e = std::get_if<session::StoreError>(&saved)) {
                    return from_store_error(*e);
                }
                return ok(nlohmann::ordered_json{
                    {"success", true},
                    {"path", std::get<std::filesystem::path>(saved).string()},
                    {"message", "Session saved: " + cmd.name_},
                });
            }

            ToolResponse operator()(const LoadSessionCommand& cmd) const {
                auto loaded = ctx_.sessions().load(cmd.name_);
                if (const auto* e = std::get_if<session::StoreError>(&loaded)) {
                    return from_store_error(*e);
                }

                const auto& record = std::get<session::SessionRecord>(loaded);
                auto cookies = nlohmann::ordered_json::array();
                for (const auto& c : record.cookies_) {
                    cookies.push_back(nlohmann::ordered_json{
                        {"name", c.name_},           {"value", c.value_},        {"domain", c.domain_}, {"path", c.path_},
                        {"expires", c.expires_},     {"httpOnly", c.http_only_}, {"secure", c.secure_}, {"sameSite", c.same_site_},
                    });
                }

                nlohmann::ordered_json payload{
                    {"success", true},
                    {"message", session_message(record)},
                    {"name", record.name_},
                    {"saved_at", record.saved_at_},
                    {"cookie_count", record.cookie_count_},
                    {"domains", record.domains_},
                    {"saved_url", record.current_url_ ? nlohmann::ordered_json(*record.current_url_) : nlohmann::ordered_json(nullptr)},
                    {"cookies", std::move(cookies)},
                };
                // Navigation belongs to the browser layer; it only gets told where to go.
                if (cmd.auto_navigate_ && record.current_url_) {
                    payload["navigate_to"] = *record.current_url_;
                }
                return ok(std::move(payload));
            }

            ToolResponse operator()(const ListSessionsCommand&) const {
                auto sessions = nlohmann::ordered_json::array();
                for (const auto& info : ctx_.sessions().list_details()) {
                    sessions.push_back(nlohmann::ordered_json{
                        {"name", info.name_},
                        {"cookie_count", info.cookie_count_},
                        {"url", info.current_url_.value_or("N/A")},
                        {"saved_at", info.saved_at_},
                    });
                }
                return ok(nlohmann::ordered_json{{"sessions", std::move(sessions)}});
            }

            ToolResponse operator()(const DeleteSessionCommand& cmd) const {
                const bool deleted = ctx_.sessions().remove(cmd.name_);
                return ok(nlohmann::ordered_json{{"success", true}, {"deleted", deleted}, {"name", cmd.name_}});
            }

            ToolResponse operator()(const NetworkSummaryCommand& cmd) const {
                const auto summary = ctx_.recorder().summary(cmd.limit_.value_or(ctx_.config().summary_limit_));

                auto requests = nlohmann::ordered_json::array();
                for (const auto& r : summary.recent_requests_) {
                    requests.push_back(network::har::to_json(r));
                }
                auto responses = nlohmann::ordered_json::array();
                for (const auto& r : summary.recent_responses_) {
                    responses.push_back(network::har::to_json(r));
                }

                return ok(nlohmann::ordered_json{
                    {"total_requests", summary.total_requests_},
                    {"total_responses", summary.total_responses_},
                    {"failed_requests", summary.failed_responses_},
                    {"requests", std::move(requests)},
                    {"responses", std::move(responses)},
                });
            }

            ToolResponse operator()(const ClearNetworkCommand&) const {
                ctx_.recorder().clear();
                return ok(nlohmann::ordered_json{{"success", true}});
            }

            ToolResponse operator()(const ExportTraceCommand& cmd) const {
                if (!session::SessionStore::is_valid_name(cmd.filename_)) {
                    return error("invalid trace file name: '" + cmd.filename_ + "'");
                }
                const auto path = ctx_.resolve_trace_path(cmd.filename_);
                try {
                    ctx_.recorder().export_trace_to_file(path);
                } catch (const std::exception& e) {
                    LOG_ERROR("HAR export failed: %s", e.what());
                    return error(e.what());
                }
                return ok(nlohmann::ordered_json{{"success", true}, {"path", path.string()}});
            }

            ToolResponse operator()(const StatsCommand&) const {
                const auto& cfg = ctx_.config();
                const auto& policy = ctx_.engine().policy();
                const auto stats = ctx_.engine().stats();

                return ok(nlohmann::ordered_json{
                    {"max_retries", policy.max_retries_},
                    {"retry_delay", seconds(policy.retry_delay_)},
                    {"max_delay", seconds(policy.max_delay_)},
                    {"timeout", seconds(cfg.timeout_)},
                    {"proxy", cfg.proxy_.value_or("None")},
                    {"ssl_verification", cfg.verify_ssl_},
                    {"download_dir", cfg.download_dir_.string()},
                    {"fetches", stats.fetches_},
                    {"downloads", stats.downloads_},
                    {"attempts", stats.attempts_},
                    {"successes", stats.successes_},
                    {"failures", stats.failures_},
                });
            }

           private:
            static ToolResponse respond(nlohmann::ordered_json payload, bool succeeded) {
                return ToolResponse{.is_error_ = !succeeded, .payload_ = std::move(payload)};
            }

            bridge::BridgeContext& ctx_;
        };
    }  // namespace

    nlohmann::ordered_json to_json(const http::model::FetchFailure& failure) {
        nlohmann::ordered_json j{
            {"success", false},
            {"error", failure.message_},
            {"error_type", http::error::to_string(failure.kind_)},
            {"url", failure.url_},
            {"elapsed", seconds(failure.elapsed_)},
            {"attempts", failure.attempts_},
        };
        if (failure.http_status_) {
            j["status"] = *failure.http_status_;
        }
        return j;
    }

    nlohmann::ordered_json to_json(const http::model::FetchResult& result, size_t preview_chars) {
        if (const auto* failure = http::model::failure_of(result)) {
            return to_json(*failure);
        }

        const auto& s = *http::model::success_of(result);
        nlohmann::ordered_json j{
            {"success", true},
            {"url", s.url_},
            {"status", s.status_},
            {"headers", s.headers_},
        };

        const std::string preview = preview_chars == 0 ? s.content_ : string_utils::truncate(s.content_, preview_chars);
        j["content"] = preview;
        j["content_truncated"] = preview.size() < s.content_.size();
        j["size"] = s.size_;
        j["elapsed"] = seconds(s.elapsed_);
        j["ssl_verified"] = s.ssl_verified_;
        j["attempts"] = s.attempts_;
        return j;
    }

    ToolResponse dispatch(bridge::BridgeContext& context, const ToolCommand& command) {
        if (context.is_shut_down()) {
            return error("bridge is shut down");
        }
        return std::visit(Dispatcher(context), command);
    }

    ToolResponse call_tool(bridge::BridgeContext& context, std::string_view name, const nlohmann::json& args) {
        try {
            return dispatch(context, parse_tool_command(name, args));
        } catch (const ToolArgumentError& e) {
            LOG_WARN("Rejected %.*s call: %s", static_cast<int>(name.size()), name.data(), e.what());
            return error(e.what());
        }
    }
}  // namespace tools
