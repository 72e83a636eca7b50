#include "tool_registry.h"

#include "health.h"
#include "inspect_cache.h"
#include "list_caches.h"
#include "resolve_context.h"

namespace ctxmcp::mcp::handlers {

std::unordered_map<std::string, ToolHandler> build_tool_registry() {
  return {
      {"context.resolve", handle_resolve_context},
      {"context.list_caches", handle_list_caches},
      {"context.inspect_cache", handle_inspect_cache},
      // Liveness check; callable but not advertised in tools/list.
      {"health", handle_health},
  };
}

}  // namespace ctxmcp::mcp::handlers
