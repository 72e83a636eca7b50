#include "health.h"

namespace ctxmcp::mcp::handlers {

ToolResult handle_health(const std::optional<nlohmann::json>& /*arguments*/,
                         const ServerContext& /*ctx*/) {
  return ToolResult::text(R"({"status":"ok"})");
}

}  // namespace ctxmcp::mcp::handlers
