#pragma once

#include "config.h"
#include <string>

namespace ctxmcp::mcp {

// validate_mcp_server_config checks startup preconditions for the MCP server.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - every flag and environment value parsed cleanly
// - a cache root is configured (--cache-root or CONTEXT_CACHE_ROOT)
// - the tool timeout is within [1s, kMaxToolTimeout]
//
// The cache root is not required to exist yet; a missing root surfaces per
// call as cache_missing / io_error.
[[nodiscard]] std::string validate_mcp_server_config(const McpServerConfig& config);

}  // namespace ctxmcp::mcp
