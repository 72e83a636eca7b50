#pragma once

#include "ctxmcp/cache/context_engine.h"
#include "ctxmcp/cache/document.h"
#include "ctxmcp/core/result.h"

#include <filesystem>
#include <string>
#include <vector>

namespace ctxmcp::apps {

// collect_documents walks source_dir recursively and returns one Document per
// regular file, ordered by id. Symlinks are not followed. The id and source of
// each document are its '/'-separated path relative to source_dir.
[[nodiscard]] core::Result<std::vector<cache::Document>, std::string> collect_documents(
    const std::filesystem::path& source_dir);

// build_cache_from_directory collects source_dir and builds a cache into
// output_dir. Returns the cache_version on success.
[[nodiscard]] core::Result<std::string, std::string> build_cache_from_directory(
    cache::IContextEngine& engine, const std::filesystem::path& source_dir,
    const std::filesystem::path& output_dir);

}  // namespace ctxmcp::apps
