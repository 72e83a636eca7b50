#pragma once

namespace ctxmcp::core {

// kServerName is reported in the initialize handshake and startup banner.
constexpr const char* kServerName = "context-mcp";

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.1.0";

// MCP protocol revision announced by initialize.
constexpr const char* kProtocolVersion = "2024-11-05";

}  // namespace ctxmcp::core
