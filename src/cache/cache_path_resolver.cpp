#include "ctxmcp/cache/cache_path_resolver.h"

#include <algorithm>
#include <iostream>
#include <system_error>

namespace ctxmcp::cache {

namespace fs = std::filesystem;

namespace {

using PathResult = core::Result<fs::path, core::McpError>;

PathResult cache_missing() {
  return PathResult::err(core::canonical_error(core::McpErrorCode::kCacheMissing));
}

// Component-wise containment: "/a/bc" is not inside "/a/b".
bool is_strictly_inside(const fs::path& candidate, const fs::path& root) {
  auto root_it = root.begin();
  auto cand_it = candidate.begin();
  for (; root_it != root.end(); ++root_it, ++cand_it) {
    if (cand_it == candidate.end() || *cand_it != *root_it) {
      return false;
    }
  }
  // A trailing empty component (root ending in '/') counts as no extra depth.
  return std::any_of(cand_it, candidate.end(), [](const fs::path& p) { return !p.empty(); });
}

}  // namespace

bool is_rejected_cache_name(const std::string_view cache_name) {
  return cache_name.empty() || cache_name.find("..") != std::string_view::npos ||
         cache_name.front() == '/' || cache_name.front() == '\\';
}

PathResult resolve_cache_path(const fs::path& cache_root, const std::string_view cache_name) {
  if (is_rejected_cache_name(cache_name)) {
    return cache_missing();
  }

  std::error_code ec;
  const fs::path canonical = fs::canonical(cache_root / fs::path(cache_name), ec);
  if (ec) {
    return cache_missing();
  }

  const fs::path root_canonical = fs::canonical(cache_root, ec);
  if (ec) {
    std::cerr << "Cache root not accessible: " << cache_root.string() << ": " << ec.message()
              << "\n";
    return PathResult::err(core::canonical_error(core::McpErrorCode::kIoError));
  }

  if (!is_strictly_inside(canonical, root_canonical)) {
    return cache_missing();
  }

  if (!fs::is_directory(canonical, ec) || ec) {
    return cache_missing();
  }

  return PathResult::ok(canonical);
}

}  // namespace ctxmcp::cache
