#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "src/bridge/bridge_context.hpp"
#include "src/config/config.hpp"
#include "src/tools/tool_dispatch.hpp"
#include "src/utils/logging.hpp"

namespace {
    const int EXIT_CONFIG_ERROR = 1;
    const int EXIT_OPERATION_FAILED = 2;

    void print_usage() {
        std::cerr << "Usage: unsafe_fetch [--config FILE] <command> [args]\n"
                  << "\n"
                  << "Commands:\n"
                  << "  fetch <url>                - Fetch URL content\n"
                  << "  json <url>                 - Fetch and parse JSON\n"
                  << "  download <url> <filename>  - Download file with progress\n"
                  << "  batch <url1> <url2> ...    - Fetch multiple URLs concurrently\n"
                  << "  sessions                   - List saved sessions\n"
                  << "  session-info <name>        - Show a saved session\n"
                  << "  delete-session <name>      - Delete a saved session\n"
                  << "  stats                      - Show fetcher statistics\n"
                  << "\n"
                  << "WARNING: TLS certificate verification is disabled unless UNSAFE_FETCH_VERIFY_SSL=1\n";
    }

    struct CliCall {
        std::string tool_;
        nlohmann::json args_ = nlohmann::json::object();
    };

    // Maps the command line onto a tool call; nullopt on a usage error.
    std::optional<CliCall> to_tool_call(const std::string& command, const std::vector<std::string>& args) {
        if (command == "fetch" && args.size() == 1) {
            return CliCall{.tool_ = "fetch_url", .args_ = {{"url", args[0]}}};
        }
        if (command == "json" && args.size() == 1) {
            return CliCall{.tool_ = "fetch_json", .args_ = {{"url", args[0]}}};
        }
        if (command == "download" && args.size() == 2) {
            return CliCall{.tool_ = "download_file", .args_ = {{"url", args[0]}, {"filename", args[1]}, {"show_progress", true}}};
        }
        if (command == "batch" && !args.empty()) {
            return CliCall{.tool_ = "batch_fetch", .args_ = {{"urls", args}}};
        }
        if (command == "sessions" && args.empty()) {
            return CliCall{.tool_ = "browser_list_sessions"};
        }
        if (command == "session-info" && args.size() == 1) {
            return CliCall{.tool_ = "browser_load_session", .args_ = {{"name", args[0]}}};
        }
        if (command == "delete-session" && args.size() == 1) {
            return CliCall{.tool_ = "browser_delete_session", .args_ = {{"name", args[0]}}};
        }
        if (command == "stats" && args.empty()) {
            return CliCall{.tool_ = "fetcher_stats"};
        }
        return std::nullopt;
    }
}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> argv_list(argv + 1, argv + argc);

    std::optional<std::filesystem::path> config_file;
    if (argv_list.size() >= 2 && argv_list[0] == "--config") {
        config_file = argv_list[1];
        argv_list.erase(argv_list.begin(), argv_list.begin() + 2);
    }

    if (argv_list.empty()) {
        print_usage();
        return EXIT_CONFIG_ERROR;
    }

    const std::string command = argv_list.front();
    const std::vector<std::string> args(argv_list.begin() + 1, argv_list.end());

    const auto call = to_tool_call(command, args);
    if (!call) {
        print_usage();
        return EXIT_CONFIG_ERROR;
    }

    std::unique_ptr<bridge::BridgeContext> context;
    try {
        const auto cfg = config::load(config_file, [](const char* name) { return std::getenv(name); });

        logging::Logger::instance().configure(logging::LoggerOptions{
            .level_ = cfg.log_level_,
            .file_path_ = cfg.log_file_.empty() || cfg.log_file_.is_absolute() ? cfg.log_file_ : cfg.log_dir_ / cfg.log_file_,
            .console_ = true,
        });

        context = bridge::BridgeContextBuilder().with_config(cfg).validate().build();
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    tools::ToolResponse response;
    try {
        response = tools::call_tool(*context, call->tool_, call->args_);
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return EXIT_OPERATION_FAILED;
    }
    context->shutdown();

    std::cout << response.payload_.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;

    if (response.is_error_) {
        std::cerr << "Error (" << response.payload_.value("error_type", std::string("ToolError")) << "): " << response.payload_.value("error", std::string())
                  << "\n";
        return EXIT_OPERATION_FAILED;
    }

    return 0;
}
