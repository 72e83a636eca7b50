#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace ctxmcp::core {

// McpErrorCode is the closed set of domain failures a tool call can report.
// Wire names are snake_case and frozen (error schema v0).
enum class McpErrorCode {
  kCacheMissing,
  kCacheInvalid,
  kInvalidQuery,
  kInvalidBudget,
  kIoError,
  kInternalError,
};

// JSON-RPC 2.0 error codes.
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// McpError is the structured domain error: {"code": "<kind>", "message": "<text>"}.
struct McpError {
  McpErrorCode code;    // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)

  bool operator==(const McpError&) const = default;
};

// Wire name of a code, e.g. kCacheMissing -> "cache_missing".
[[nodiscard]] std::string_view error_code_name(McpErrorCode code);

// Inverse of error_code_name(); nullopt for unknown names.
[[nodiscard]] std::optional<McpErrorCode> parse_error_code(std::string_view name);

// Fixed message for a code. Never varies by call site.
[[nodiscard]] std::string_view canonical_message(McpErrorCode code);

// Input-validation kinds map to -32602, server-side kinds to -32603.
[[nodiscard]] int json_rpc_code(McpErrorCode code);

// Builds the error with its canonical message.
[[nodiscard]] McpError canonical_error(McpErrorCode code);

// {"error": {"code": ..., "message": ...}}
[[nodiscard]] nlohmann::json error_to_json(const McpError& error);

}  // namespace ctxmcp::core
