#include "list_caches.h"

#include "ctxmcp/cache/cache_manifest.h"
#include "ctxmcp/core/mcp_error.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace ctxmcp::mcp::handlers {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct CacheEntry {
  std::string path;
  bool has_manifest;
};

ToolResult io_error(const std::string& what, const std::error_code& ec) {
  std::cerr << what << ": " << ec.message() << "\n";
  return ToolResult::from_mcp_error(core::canonical_error(core::McpErrorCode::kIoError));
}

}  // namespace

ToolResult handle_list_caches(const std::optional<json>& /*arguments*/, const ServerContext& ctx) {
  const fs::path& root = ctx.cache_root;

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return ToolResult::from_mcp_error(core::canonical_error(core::McpErrorCode::kCacheMissing));
  }

  fs::directory_iterator it(root, ec);
  if (ec) {
    return io_error("Cannot read cache root", ec);
  }

  std::vector<CacheEntry> caches;
  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      return io_error("Error reading directory entry", ec);
    }

    // Immediate subdirectories only; symlinks to directories are skipped.
    const auto entry_status = it->symlink_status(ec);
    if (ec) {
      return io_error("Cannot read file type", ec);
    }
    if (!fs::is_directory(entry_status)) {
      continue;
    }

    // Existence check only; a symlinked manifest counts as absent.
    const auto manifest_status = fs::symlink_status(it->path() / cache::kManifestFileName, ec);
    bool has_manifest = false;
    if (manifest_status.type() == fs::file_type::not_found) {
      ec.clear();
    } else if (ec) {
      return io_error("Cannot stat manifest", ec);
    } else {
      has_manifest = fs::is_regular_file(manifest_status);
    }

    caches.push_back(CacheEntry{it->path().filename().string(), has_manifest});
  }
  if (ec) {
    return io_error("Error reading directory entry", ec);
  }

  // Byte-wise order: locale-independent and deterministic.
  std::sort(caches.begin(), caches.end(),
            [](const CacheEntry& a, const CacheEntry& b) { return a.path < b.path; });

  json listed = json::array();
  for (const auto& cache : caches) {
    listed.push_back({{"path", cache.path}, {"has_manifest", cache.has_manifest}});
  }
  return ToolResult::text(dump_compact(json{{"caches", listed}}));
}

}  // namespace ctxmcp::mcp::handlers
