#include "inspect_cache.h"

#include "ctxmcp/cache/cache_manifest.h"
#include "ctxmcp/cache/cache_path_resolver.h"
#include "ctxmcp/core/mcp_error.h"

#include "tool_args.h"
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace ctxmcp::mcp::handlers {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kToolName = "context.inspect_cache";

struct InspectReport {
  std::string cache_version;
  std::uint64_t document_count{0};
  std::uint64_t total_bytes{0};
  bool valid{false};
};

// Sum of regular-file sizes directly inside dir; symlinks are not followed.
bool total_bytes_non_recursive(const fs::path& dir, std::uint64_t& total, std::error_code& ec) {
  total = 0;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    return false;
  }
  for (const fs::directory_iterator end; it != end; it.increment(ec)) {
    const auto status = it->symlink_status(ec);
    if (ec) {
      return false;
    }
    if (!fs::is_regular_file(status)) {
      continue;
    }
    const auto size = it->file_size(ec);
    if (ec) {
      return false;
    }
    total += size;
  }
  return !ec;
}

}  // namespace

ToolResult handle_inspect_cache(const std::optional<json>& arguments, const ServerContext& ctx) {
  if (!arguments.has_value()) {
    return ToolResult::error(missing_arguments_message(kToolName));
  }
  if (!arguments->is_object()) {
    return ToolResult::error(invalid_arguments_message(kToolName, "expected an object"));
  }
  const auto cache_name = get_string_field(arguments.value(), "cache");
  if (!cache_name.has_value()) {
    return ToolResult::error(invalid_arguments_message(kToolName, cache_name.error()));
  }

  const auto cache_path = cache::resolve_cache_path(ctx.cache_root, cache_name.value());
  if (!cache_path.has_value()) {
    return ToolResult::from_mcp_error(cache_path.error());
  }

  InspectReport report;
  const auto manifest = cache::read_manifest_json(cache_path.value());
  if (manifest.has_value()) {
    const json& doc = manifest.value();
    if (doc.is_object() && doc.contains("cache_version") && doc["cache_version"].is_string() &&
        doc.contains("document_count") && doc["document_count"].is_number_unsigned()) {
      report.cache_version = doc["cache_version"].get<std::string>();
      report.document_count = doc["document_count"].get<std::uint64_t>();
      report.valid = true;
    }
  } else if (manifest.error().kind == cache::ManifestReadError::kIo) {
    std::cerr << "Cannot read manifest: " << manifest.error().detail << "\n";
    return ToolResult::from_mcp_error(core::canonical_error(core::McpErrorCode::kIoError));
  }
  // kNotFound and kMalformed degrade to valid=false below.

  if (report.valid) {
    std::error_code ec;
    if (!total_bytes_non_recursive(cache_path.value(), report.total_bytes, ec)) {
      std::cerr << "Error computing total_bytes: " << ec.message() << "\n";
      report.valid = false;
    }
  }
  if (!report.valid) {
    report = InspectReport{};
  }

  return ToolResult::text(dump_compact(json{
      {"cache_version", report.cache_version},
      {"document_count", report.document_count},
      {"total_bytes", report.total_bytes},
      {"valid", report.valid},
  }));
}

}  // namespace ctxmcp::mcp::handlers
