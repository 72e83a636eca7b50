#pragma once

#include "ctxmcp/core/mcp_error.h"
#include "ctxmcp/core/result.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ctxmcp::mcp {

// JSON-RPC 2.0 request. An absent id marks a notification.
// A present id is a number, a string, or null, and is echoed verbatim.
struct JsonRpcRequest {
  std::string jsonrpc{"2.0"};               // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> id;         // NOLINT(readability-identifier-naming)
  std::string method;                       // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> params;     // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool is_notification() const { return !id.has_value(); }
};

// Protocol-level error object.
struct JsonRpcError {
  int code;                            // NOLINT(readability-identifier-naming)
  std::string message;                 // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> data;  // NOLINT(readability-identifier-naming)

  static JsonRpcError parse_error();
  static JsonRpcError invalid_request(std::string message = "Invalid Request");
  static JsonRpcError method_not_found(const std::string& method);
  static JsonRpcError invalid_params(std::string detail);
  static JsonRpcError internal_error(std::string detail);

  // Domain error rendered at protocol level: numeric code from the taxonomy,
  // canonical message, and the structured error object in `data`.
  static JsonRpcError from_mcp_error(const core::McpError& error);
};

// Exactly one of result / error is set.
struct JsonRpcResponse {
  std::optional<nlohmann::json> id;      // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> result;  // NOLINT(readability-identifier-naming)
  std::optional<JsonRpcError> error;     // NOLINT(readability-identifier-naming)

  static JsonRpcResponse success(std::optional<nlohmann::json> id, nlohmann::json result);
  static JsonRpcResponse failure(std::optional<nlohmann::json> id, JsonRpcError error);
};

struct ToolResultContent {
  std::string type{"text"};  // NOLINT(readability-identifier-naming)
  std::string text;          // NOLINT(readability-identifier-naming)
};

// MCP tool result, carried inside a successful JSON-RPC response.
// A tool-level failure sets is_error; it is not a protocol error.
struct ToolResult {
  std::vector<ToolResultContent> content;  // NOLINT(readability-identifier-naming)
  bool is_error{false};                    // NOLINT(readability-identifier-naming)

  static ToolResult text(std::string text);
  static ToolResult error(std::string text);

  // Domain error rendered at tool level: the single text block is the
  // compact JSON error object plus a trailing newline.
  static ToolResult from_mcp_error(const core::McpError& error);
};

[[nodiscard]] nlohmann::json tool_result_to_json(const ToolResult& result);
[[nodiscard]] nlohmann::json response_to_json(const JsonRpcResponse& response);

// Compact single-line JSON, no trailing newline. Invalid UTF-8 inside string
// values is replaced with U+FFFD instead of throwing.
[[nodiscard]] std::string serialize_response(const JsonRpcResponse& response);
[[nodiscard]] std::string dump_compact(const nlohmann::json& value);

// Why a frame could not become a request. `respond` is false when the frame
// was recognisably a notification, which must never receive an error.
struct RequestParseFailure {
  JsonRpcError error;                  // NOLINT(readability-identifier-naming)
  std::optional<nlohmann::json> id;    // NOLINT(readability-identifier-naming)
  bool respond{true};                  // NOLINT(readability-identifier-naming)
  std::string detail;                  // NOLINT(readability-identifier-naming) for stderr
};

// parse_request decodes one trimmed frame.
// - not JSON                      -> parse error (-32700), no id
// - not an object, bad "jsonrpc",
//   missing/non-string "method",
//   id not number/string/null     -> invalid request (-32600)
[[nodiscard]] core::Result<JsonRpcRequest, RequestParseFailure> parse_request(
    std::string_view frame);

}  // namespace ctxmcp::mcp
