#include "ctxmcp/cache/context_engine.h"

namespace ctxmcp::cache {

core::McpErrorCode to_mcp_error_code(const EngineErrorKind kind) {
  switch (kind) {
    case EngineErrorKind::kInvalidQuery:
      return core::McpErrorCode::kInvalidQuery;
    case EngineErrorKind::kCorruptCache:
      return core::McpErrorCode::kCacheInvalid;
    case EngineErrorKind::kIo:
      return core::McpErrorCode::kIoError;
    case EngineErrorKind::kInvalidInput:
    case EngineErrorKind::kInternal:
      return core::McpErrorCode::kInternalError;
  }
  return core::McpErrorCode::kInternalError;
}

}  // namespace ctxmcp::cache
