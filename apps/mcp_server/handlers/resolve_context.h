#pragma once

#include <nlohmann/json.hpp>

#include "../mcp_protocol.h"
#include "../server_context.h"
#include <optional>

namespace ctxmcp::mcp::handlers {

// context.resolve {cache, query, budget}
//
// Order of checks: argument shape, budget sign (before any I/O), cache path.
// Manifest loading and selection then run on a detached worker raced against
// ctx.tool_timeout; a timeout or a throwing worker is reported as
// internal_error and the worker is abandoned.
//
// On success the single text block is the selection JSON plus one newline.
ToolResult handle_resolve_context(const std::optional<nlohmann::json>& arguments,
                                  const ServerContext& ctx);

}  // namespace ctxmcp::mcp::handlers
