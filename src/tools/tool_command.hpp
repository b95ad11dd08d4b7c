#ifndef UNSAFE_FETCH_TOOL_COMMAND_HPP
#define UNSAFE_FETCH_TOOL_COMMAND_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../http/model/model.hpp"
#include "../session/cookie.hpp"
#include "../utils/constants.hpp"

namespace tools {
    struct FetchCommand {
        std::string url_;
        http::model::Headers headers_;
    };

    struct FetchJsonCommand {
        std::string url_;
        http::model::Headers headers_;
    };

    struct DownloadCommand {
        std::string url_;
        std::string filename_;
        bool show_progress_ = false;
    };

    struct BatchFetchCommand {
        std::vector<std::string> urls_;
    };

    struct SaveSessionCommand {
        std::string name_ = constants::DEFAULT_SESSION_NAME;
        std::vector<session::Cookie> cookies_;
        std::optional<std::string> current_url_;
    };

    struct LoadSessionCommand {
        std::string name_;
        bool auto_navigate_ = false;
    };

    struct ListSessionsCommand {};

    struct DeleteSessionCommand {
        std::string name_;
    };

    struct NetworkSummaryCommand {
        std::optional<size_t> limit_;
    };

    struct ClearNetworkCommand {};

    struct ExportTraceCommand {
        std::string filename_ = constants::DEFAULT_TRACE_FILE;
    };

    struct StatsCommand {};

    using ToolCommand = std::variant<FetchCommand, FetchJsonCommand, DownloadCommand, BatchFetchCommand, SaveSessionCommand, LoadSessionCommand,
                                     ListSessionsCommand, DeleteSessionCommand, NetworkSummaryCommand, ClearNetworkCommand, ExportTraceCommand, StatsCommand>;

    struct ToolArgumentError : public std::invalid_argument {
        using std::invalid_argument::invalid_argument;
    };

    // The one place a tool name becomes a typed command. Throws ToolArgumentError.
    [[nodiscard]] ToolCommand parse_tool_command(std::string_view name, const nlohmann::json& args);

    [[nodiscard]] const std::vector<std::string>& tool_names();

    [[nodiscard]] session::Cookie parse_cookie(const nlohmann::json& obj);
}  // namespace tools

#endif
