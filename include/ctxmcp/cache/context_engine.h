#pragma once

#include "ctxmcp/cache/cache_manifest.h"
#include "ctxmcp/cache/document.h"
#include "ctxmcp/cache/selection_result.h"
#include "ctxmcp/core/mcp_error.h"
#include "ctxmcp/core/result.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace ctxmcp::cache {

// ContextCache is the handle passed to select(): a cache directory plus its
// already-decoded manifest.
struct ContextCache {
  std::filesystem::path root;  // NOLINT(readability-identifier-naming)
  CacheManifest manifest;      // NOLINT(readability-identifier-naming)
};

enum class EngineErrorKind {
  kInvalidQuery,  // query unusable for selection
  kInvalidInput,  // build input rejected (e.g. duplicate ids)
  kCorruptCache,  // cache files missing or undecodable
  kIo,            // OS-level read/write failure
  kInternal,
};

struct EngineError {
  EngineErrorKind kind;  // NOLINT(readability-identifier-naming)
  std::string detail;    // NOLINT(readability-identifier-naming)
};

// Maps an engine failure onto the wire taxonomy.
[[nodiscard]] core::McpErrorCode to_mcp_error_code(EngineErrorKind kind);

// IContextEngine is the selection / cache-build capability consumed by the
// protocol layer. The server only calls select(); build() is used by the
// offline builder and by tests.
//
// Implementations must be deterministic: identical cache bytes, query and
// budget produce identical results. select() may run on a worker thread that
// outlives the request, so it must not touch per-request state.
class IContextEngine {
 public:
  virtual ~IContextEngine() = default;

  virtual core::Result<ContextCache, EngineError> build(
      const std::vector<Document>& documents, const std::filesystem::path& output_dir) = 0;

  [[nodiscard]] virtual core::Result<SelectionResult, EngineError> select(
      const ContextCache& cache, const std::string& query, std::size_t budget) const = 0;

 protected:
  IContextEngine() = default;
  IContextEngine(const IContextEngine&) = default;
  IContextEngine& operator=(const IContextEngine&) = default;
  IContextEngine(IContextEngine&&) = default;
  IContextEngine& operator=(IContextEngine&&) = default;
};

}  // namespace ctxmcp::cache
