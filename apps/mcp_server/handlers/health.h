#pragma once

#include <nlohmann/json.hpp>

#include "../mcp_protocol.h"
#include "../server_context.h"
#include <optional>

namespace ctxmcp::mcp::handlers {

ToolResult handle_health(const std::optional<nlohmann::json>& arguments, const ServerContext& ctx);

}  // namespace ctxmcp::mcp::handlers
