#include "mcp_protocol.h"

#include <utility>

namespace ctxmcp::mcp {

using json = nlohmann::json;

JsonRpcError JsonRpcError::parse_error() {
  return JsonRpcError{core::kParseError, "Parse error", std::nullopt};
}

JsonRpcError JsonRpcError::invalid_request(std::string message) {
  return JsonRpcError{core::kInvalidRequest, std::move(message), std::nullopt};
}

JsonRpcError JsonRpcError::method_not_found(const std::string& method) {
  return JsonRpcError{core::kMethodNotFound, "Method not found: " + method, std::nullopt};
}

JsonRpcError JsonRpcError::invalid_params(std::string detail) {
  return JsonRpcError{core::kInvalidParams, std::move(detail), std::nullopt};
}

JsonRpcError JsonRpcError::internal_error(std::string detail) {
  return JsonRpcError{core::kInternalError, std::move(detail), std::nullopt};
}

JsonRpcError JsonRpcError::from_mcp_error(const core::McpError& error) {
  return JsonRpcError{core::json_rpc_code(error.code), error.message, core::error_to_json(error)};
}

JsonRpcResponse JsonRpcResponse::success(std::optional<json> id, json result) {
  return JsonRpcResponse{std::move(id), std::move(result), std::nullopt};
}

JsonRpcResponse JsonRpcResponse::failure(std::optional<json> id, JsonRpcError error) {
  return JsonRpcResponse{std::move(id), std::nullopt, std::move(error)};
}

ToolResult ToolResult::text(std::string text) {
  return ToolResult{{ToolResultContent{"text", std::move(text)}}, false};
}

ToolResult ToolResult::error(std::string text) {
  return ToolResult{{ToolResultContent{"text", std::move(text)}}, true};
}

ToolResult ToolResult::from_mcp_error(const core::McpError& error) {
  return ToolResult::error(dump_compact(core::error_to_json(error)) + "\n");
}

json tool_result_to_json(const ToolResult& result) {
  json content = json::array();
  for (const auto& block : result.content) {
    content.push_back({{"type", block.type}, {"text", block.text}});
  }

  json out{{"content", content}};
  if (result.is_error) {
    out["isError"] = true;
  }
  return out;
}

json response_to_json(const JsonRpcResponse& response) {
  json out;
  out["jsonrpc"] = "2.0";
  if (response.id.has_value()) {
    out["id"] = response.id.value();
  }

  if (response.error.has_value()) {
    const JsonRpcError& error = response.error.value();
    out["error"] = {
        {"code", error.code},
        {"message", error.message},
    };
    if (error.data.has_value()) {
      out["error"]["data"] = error.data.value();
    }
  } else {
    out["result"] = response.result.value_or(json::object());
  }
  return out;
}

std::string dump_compact(const json& value) {
  return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string serialize_response(const JsonRpcResponse& response) {
  return dump_compact(response_to_json(response));
}

core::Result<JsonRpcRequest, RequestParseFailure> parse_request(const std::string_view frame) {
  using ParseResult = core::Result<JsonRpcRequest, RequestParseFailure>;

  json doc = json::parse(frame.begin(), frame.end(), nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return ParseResult::err(
        RequestParseFailure{JsonRpcError::parse_error(), std::nullopt, true, "invalid JSON"});
  }

  if (!doc.is_object()) {
    return ParseResult::err(RequestParseFailure{JsonRpcError::invalid_request(), std::nullopt,
                                                true, "request is not a JSON object"});
  }

  std::optional<json> id;
  if (doc.contains("id")) {
    const json& raw_id = doc["id"];
    if (!raw_id.is_number() && !raw_id.is_string() && !raw_id.is_null()) {
      return ParseResult::err(RequestParseFailure{JsonRpcError::invalid_request(), std::nullopt,
                                                  true, "id must be a number, string or null"});
    }
    id = raw_id;
  }

  const bool has_method = doc.contains("method") && doc["method"].is_string();
  // No id plus a method name: the sender expects no reply, even to an error.
  const bool respond = id.has_value() || !has_method;

  if (!doc.contains("jsonrpc") || !doc["jsonrpc"].is_string() || doc["jsonrpc"] != "2.0") {
    return ParseResult::err(RequestParseFailure{JsonRpcError::invalid_request(), id, respond,
                                                "jsonrpc must be \"2.0\""});
  }
  if (!has_method) {
    return ParseResult::err(RequestParseFailure{JsonRpcError::invalid_request(), id, respond,
                                                "method must be a string"});
  }

  JsonRpcRequest request;
  request.jsonrpc = "2.0";
  request.id = std::move(id);
  request.method = doc["method"].get<std::string>();
  if (doc.contains("params") && !doc["params"].is_null()) {
    request.params = doc["params"];
  }
  return ParseResult::ok(std::move(request));
}

}  // namespace ctxmcp::mcp
