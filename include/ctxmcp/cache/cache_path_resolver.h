#pragma once

#include "ctxmcp/core/mcp_error.h"
#include "ctxmcp/core/result.h"

#include <filesystem>
#include <string_view>

namespace ctxmcp::cache {

// resolve_cache_path maps a client-supplied cache name to a canonical
// directory strictly inside cache_root.
//
// Every client-attributable failure (traversal markers, leading slash or
// backslash, nonexistent path, symlink escaping the root, non-directory)
// collapses to kCacheMissing so callers cannot map the filesystem.
// Only a failure to canonicalize the trusted root itself is kIoError; its
// detail goes to stderr, never to the client.
//
// Names are checked textually before any filesystem access.
[[nodiscard]] core::Result<std::filesystem::path, core::McpError> resolve_cache_path(
    const std::filesystem::path& cache_root, std::string_view cache_name);

// is_rejected_cache_name is the textual pre-check: empty, contains "..", or
// starts with '/' or '\\'.
[[nodiscard]] bool is_rejected_cache_name(std::string_view cache_name);

}  // namespace ctxmcp::cache
