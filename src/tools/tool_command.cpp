#include "tool_command.hpp"

#include <algorithm>
#include <functional>
#include <utility>

namespace tools {
    namespace {
        std::string required_string(const nlohmann::json& args, const char* key) {
            auto it = args.find(key);
            if (it == args.end() || !it->is_string()) {
                throw ToolArgumentError(std::string("'") + key + "' must be a string");
            }
            return it->get<std::string>();
        }

        std::optional<std::string> optional_string(const nlohmann::json& args, const char* key) {
            auto it = args.find(key);
            if (it == args.end() || it->is_null()) {
                return std::nullopt;
            }
            if (!it->is_string()) {
                throw ToolArgumentError(std::string("'") + key + "' must be a string");
            }
            return it->get<std::string>();
        }

        bool optional_bool(const nlohmann::json& args, const char* key, bool fallback) {
            auto it = args.find(key);
            if (it == args.end() || it->is_null()) {
                return fallback;
            }
            if (!it->is_boolean()) {
                throw ToolArgumentError(std::string("'") + key + "' must be a boolean");
            }
            return it->get<bool>();
        }

        http::model::Headers optional_headers(const nlohmann::json& args) {
            http::model::Headers headers;
            auto it = args.find("headers");
            if (it == args.end() || it->is_null()) {
                return headers;
            }
            if (!it->is_object()) {
                throw ToolArgumentError("'headers' must be an object of strings");
            }
            for (const auto& [name, value] : it->items()) {
                if (!value.is_string()) {
                    throw ToolArgumentError("header '" + name + "' must be a string");
                }
                headers.emplace(name, value.get<std::string>());
            }
            return headers;
        }

        using CommandParser = std::function<ToolCommand(const nlohmann::json&)>;

        const std::vector<std::pair<std::string, CommandParser>>& parsers() {
            static const std::vector<std::pair<std::string, CommandParser>> all = {
                {"fetch_url", [](const nlohmann::json& a) -> ToolCommand { return FetchCommand{.url_ = required_string(a, "url"), .headers_ = optional_headers(a)}; }},
                {"fetch_json",
                 [](const nlohmann::json& a) -> ToolCommand { return FetchJsonCommand{.url_ = required_string(a, "url"), .headers_ = optional_headers(a)}; }},
                {"download_file",
                 [](const nlohmann::json& a) -> ToolCommand {
                     return DownloadCommand{
                         .url_ = required_string(a, "url"),
                         .filename_ = required_string(a, "filename"),
                         .show_progress_ = optional_bool(a, "show_progress", false),
                     };
                 }},
                {"batch_fetch",
                 [](const nlohmann::json& a) -> ToolCommand {
                     auto it = a.find("urls");
                     if (it == a.end() || !it->is_array()) {
                         throw ToolArgumentError("'urls' must be an array of strings");
                     }
                     BatchFetchCommand cmd;
                     for (const auto& url : *it) {
                         if (!url.is_string()) {
                             throw ToolArgumentError("'urls' must be an array of strings");
                         }
                         cmd.urls_.push_back(url.get<std::string>());
                     }
                     return cmd;
                 }},
                {"browser_save_session",
                 [](const nlohmann::json& a) -> ToolCommand {
                     SaveSessionCommand cmd;
                     cmd.name_ = optional_string(a, "name").value_or(constants::DEFAULT_SESSION_NAME);
                     cmd.current_url_ = optional_string(a, "current_url");
                     if (auto it = a.find("cookies"); it != a.end() && !it->is_null()) {
                         if (!it->is_array()) {
                             throw ToolArgumentError("'cookies' must be an array");
                         }
                         for (const auto& c : *it) {
                             cmd.cookies_.push_back(parse_cookie(c));
                         }
                     }
                     return cmd;
                 }},
                {"browser_load_session",
                 [](const nlohmann::json& a) -> ToolCommand {
                     return LoadSessionCommand{.name_ = required_string(a, "name"), .auto_navigate_ = optional_bool(a, "auto_navigate", false)};
                 }},
                {"browser_list_sessions", [](const nlohmann::json&) -> ToolCommand { return ListSessionsCommand{}; }},
                {"browser_delete_session", [](const nlohmann::json& a) -> ToolCommand { return DeleteSessionCommand{.name_ = required_string(a, "name")}; }},
                {"browser_network_summary",
                 [](const nlohmann::json& a) -> ToolCommand {
                     NetworkSummaryCommand cmd;
                     if (auto it = a.find("limit"); it != a.end() && !it->is_null()) {
                         if (!it->is_number_integer() || it->get<long long>() < 0) {
                             throw ToolArgumentError("'limit' must be a non-negative integer");
                         }
                         cmd.limit_ = it->get<size_t>();
                     }
                     return cmd;
                 }},
                {"browser_clear_network", [](const nlohmann::json&) -> ToolCommand { return ClearNetworkCommand{}; }},
                {"browser_export_har",
                 [](const nlohmann::json& a) -> ToolCommand {
                     return ExportTraceCommand{.filename_ = optional_string(a, "filename").value_or(constants::DEFAULT_TRACE_FILE)};
                 }},
                {"fetcher_stats", [](const nlohmann::json&) -> ToolCommand { return StatsCommand{}; }},
            };
            return all;
        }
    }  // namespace

    session::Cookie parse_cookie(const nlohmann::json& obj) {
        if (!obj.is_object()) {
            throw ToolArgumentError("cookie must be an object");
        }

        session::Cookie c;
        c.name_ = required_string(obj, "name");
        c.value_ = required_string(obj, "value");
        c.domain_ = optional_string(obj, "domain").value_or("");
        c.path_ = optional_string(obj, "path").value_or("/");
        if (auto it = obj.find("expires"); it != obj.end() && !it->is_null()) {
            if (!it->is_number()) {
                throw ToolArgumentError("cookie 'expires' must be a number");
            }
            c.expires_ = it->get<double>();
        }
        c.http_only_ = optional_bool(obj, "httpOnly", false);
        c.secure_ = optional_bool(obj, "secure", false);
        c.same_site_ = optional_string(obj, "sameSite").value_or("Lax");
        return c;
    }

    ToolCommand parse_tool_command(std::string_view name, const nlohmann::json& args) {
        const auto& all = parsers();
        auto it = std::ranges::find_if(all, [name](const auto& entry) { return entry.first == name; });
        if (it == all.end()) {
            throw ToolArgumentError("Unknown tool: " + std::string(name));
        }

        static const nlohmann::json empty_args = nlohmann::json::object();
        const nlohmann::json& effective = args.is_null() ? empty_args : args;
        if (!effective.is_object()) {
            throw ToolArgumentError("arguments for " + std::string(name) + " must be an object");
        }

        return it->second(effective);
    }

    const std::vector<std::string>& tool_names() {
        static const std::vector<std::string> names = [] {
            std::vector<std::string> out;
            for (const auto& entry : parsers()) {
                out.push_back(entry.first);
            }
            return out;
        }();
        return names;
    }
}  // namespace tools
