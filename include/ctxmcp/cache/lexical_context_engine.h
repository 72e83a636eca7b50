#pragma once

#include "ctxmcp/cache/context_engine.h"
#include "ctxmcp/core/clock.h"

#include <memory>

namespace ctxmcp::cache {

// LexicalContextEngine is the default on-disk engine.
//
// Cache layout written by build():
//   manifest.json               pretty-printed CacheManifest
//   index.json                  {"cache_version", "documents": {id: file}}
//   documents/<sha256(id)>.json {"id", "version", "source", "content", "tokens"}
//
// select() scores each document by the fraction of distinct query terms it
// contains (ASCII-lowercased alphanumeric tokens, length >= 2), ranks by score
// descending then id ascending, and admits documents greedily while the token
// budget allows.
class LexicalContextEngine final : public IContextEngine {
 public:
  LexicalContextEngine();
  explicit LexicalContextEngine(std::unique_ptr<core::IClock> clock);

  core::Result<ContextCache, EngineError> build(const std::vector<Document>& documents,
                                                const std::filesystem::path& output_dir) override;

  [[nodiscard]] core::Result<SelectionResult, EngineError> select(
      const ContextCache& cache, const std::string& query, std::size_t budget) const override;

 private:
  std::unique_ptr<core::IClock> clock_;
};

}  // namespace ctxmcp::cache
