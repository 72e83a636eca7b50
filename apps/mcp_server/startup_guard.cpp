#include "startup_guard.h"

namespace ctxmcp::mcp {

std::string validate_mcp_server_config(const McpServerConfig& config) {
  if (!config.args_valid) {
    return "Error: invalid command-line arguments or environment (see messages above).";
  }

  if (!config.cache_root.has_value() || config.cache_root->empty()) {
    return "Error: a cache root is required.\n"
           "       Pass --cache-root <dir> or set CONTEXT_CACHE_ROOT.";
  }

  if (config.tool_timeout.count() <= 0 || config.tool_timeout > kMaxToolTimeout) {
    return "Error: tool timeout must be between 1 and " +
           std::to_string(kMaxToolTimeout.count()) + " seconds.";
  }

  return "";
}

}  // namespace ctxmcp::mcp
