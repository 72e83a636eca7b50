#pragma once

#include "ctxmcp/cache/context_engine.h"

#include <chrono>
#include <filesystem>
#include <memory>

namespace ctxmcp::mcp {

// ServerContext holds the process-lifetime, read-only state passed to every
// method and tool handler. The engine is shared so that a resolve worker
// abandoned after a timeout keeps it alive.
struct ServerContext {
  std::filesystem::path cache_root;                    // NOLINT(readability-identifier-naming)
  std::chrono::milliseconds tool_timeout;              // NOLINT(readability-identifier-naming)
  std::shared_ptr<const cache::IContextEngine> engine;  // NOLINT(readability-identifier-naming)
};

}  // namespace ctxmcp::mcp
