#include "resolve_context.h"

#include "ctxmcp/cache/cache_manifest.h"
#include "ctxmcp/cache/cache_path_resolver.h"
#include "ctxmcp/core/execution_guard.h"
#include "ctxmcp/core/mcp_error.h"
#include "ctxmcp/core/result.h"

#include "tool_args.h"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace ctxmcp::mcp::handlers {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kToolName = "context.resolve";

using SelectOutcome = core::Result<std::string, core::McpError>;

struct ResolveContextParams {
  std::string cache;
  std::string query;
  std::int64_t budget;
};

core::Result<ResolveContextParams, ArgsError> decode_params(const json& args) {
  using DecodeResult = core::Result<ResolveContextParams, ArgsError>;
  if (!args.is_object()) {
    return DecodeResult::err("expected an object");
  }
  auto cache = get_string_field(args, "cache");
  if (!cache.has_value()) {
    return DecodeResult::err(cache.error());
  }
  auto query = get_string_field(args, "query");
  if (!query.has_value()) {
    return DecodeResult::err(query.error());
  }
  auto budget = get_integer_field(args, "budget");
  if (!budget.has_value()) {
    return DecodeResult::err(budget.error());
  }
  return DecodeResult::ok(ResolveContextParams{cache.value(), query.value(), budget.value()});
}

SelectOutcome fail(const core::McpErrorCode code) {
  return SelectOutcome::err(core::canonical_error(code));
}

// Runs on the worker thread. Takes everything by value: it may outlive the request.
SelectOutcome load_and_select(const std::shared_ptr<const cache::IContextEngine>& engine,
                              const fs::path& cache_path, const std::string& query,
                              const std::size_t budget) {
  auto manifest = cache::load_manifest(cache_path);
  if (!manifest.has_value()) {
    const auto& failure = manifest.error();
    switch (failure.kind) {
      case cache::ManifestReadError::kNotFound:
        // The directory passed validation, so a missing manifest is structural.
        std::cerr << "Cannot read manifest: " << failure.detail << "\n";
        return fail(core::McpErrorCode::kCacheInvalid);
      case cache::ManifestReadError::kMalformed:
        std::cerr << "Invalid manifest: " << failure.detail << "\n";
        return fail(core::McpErrorCode::kCacheInvalid);
      case cache::ManifestReadError::kIo:
        std::cerr << "Cannot read manifest: " << failure.detail << "\n";
        return fail(core::McpErrorCode::kIoError);
    }
    return fail(core::McpErrorCode::kInternalError);
  }

  const cache::ContextCache handle{cache_path, manifest.value()};
  auto selection = engine->select(handle, query, budget);
  if (!selection.has_value()) {
    std::cerr << "Selection failed: " << selection.error().detail << "\n";
    return fail(cache::to_mcp_error_code(selection.error().kind));
  }

  return SelectOutcome::ok(dump_compact(cache::selection_to_json(selection.value())) + "\n");
}

}  // namespace

ToolResult handle_resolve_context(const std::optional<json>& arguments, const ServerContext& ctx) {
  if (!arguments.has_value()) {
    return ToolResult::error(missing_arguments_message(kToolName));
  }
  auto params = decode_params(arguments.value());
  if (!params.has_value()) {
    return ToolResult::error(invalid_arguments_message(kToolName, params.error()));
  }

  if (params.value().budget < 0) {
    return ToolResult::from_mcp_error(core::canonical_error(core::McpErrorCode::kInvalidBudget));
  }
  const auto budget = static_cast<std::size_t>(params.value().budget);

  auto cache_path = cache::resolve_cache_path(ctx.cache_root, params.value().cache);
  if (!cache_path.has_value()) {
    return ToolResult::from_mcp_error(cache_path.error());
  }

  auto work = [engine = ctx.engine, path = cache_path.value(), query = params.value().query,
               budget]() { return load_and_select(engine, path, query, budget); };

  auto outcome = core::run_with_timeout<SelectOutcome>(std::move(work), ctx.tool_timeout);
  if (!outcome.has_value()) {
    const auto& failure = outcome.error();
    if (failure.kind == core::GuardFailure::kTimedOut) {
      std::cerr << "context.resolve: " << failure.detail << "\n";
    } else {
      std::cerr << "context.resolve worker failed: " << failure.detail << "\n";
    }
    return ToolResult::from_mcp_error(core::canonical_error(core::McpErrorCode::kInternalError));
  }

  const SelectOutcome& selected = outcome.value();
  if (!selected.has_value()) {
    return ToolResult::from_mcp_error(selected.error());
  }
  return ToolResult::text(selected.value());
}

}  // namespace ctxmcp::mcp::handlers
