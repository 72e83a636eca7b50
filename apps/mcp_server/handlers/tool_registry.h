#pragma once

#include <nlohmann/json.hpp>

#include "../mcp_protocol.h"
#include "../server_context.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace ctxmcp::mcp::handlers {

// `arguments` is nullopt when the call omitted it or passed null.
using ToolHandler = std::function<ToolResult(const std::optional<nlohmann::json>& arguments,
                                             const ServerContext& ctx)>;

std::unordered_map<std::string, ToolHandler> build_tool_registry();

}  // namespace ctxmcp::mcp::handlers
