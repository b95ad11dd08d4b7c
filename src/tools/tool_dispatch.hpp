#ifndef UNSAFE_FETCH_TOOL_DISPATCH_HPP
#define UNSAFE_FETCH_TOOL_DISPATCH_HPP

#include <nlohmann/json.hpp>
#include <string_view>

#include "../bridge/bridge_context.hpp"
#include "tool_command.hpp"

namespace tools {
    struct ToolResponse {
        bool is_error_ = false;
        nlohmann::ordered_json payload_;
    };

    [[nodiscard]] ToolResponse dispatch(bridge::BridgeContext& context, const ToolCommand& command);

    // Parse then dispatch; bad arguments come back as an error response.
    [[nodiscard]] ToolResponse call_tool(bridge::BridgeContext& context, std::string_view name, const nlohmann::json& args);

    [[nodiscard]] nlohmann::ordered_json to_json(const http::model::FetchResult& result, size_t preview_chars);
    [[nodiscard]] nlohmann::ordered_json to_json(const http::model::FetchFailure& failure);
}  // namespace tools

#endif
