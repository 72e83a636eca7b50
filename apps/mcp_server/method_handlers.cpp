#include "method_handlers.h"

#include "ctxmcp/core/version.h"

#include "handlers/tool_registry.h"
#include <exception>
#include <iostream>

namespace ctxmcp::mcp {

using json = nlohmann::json;

namespace {

json build_tool_catalog() {
  json tools = json::array();

  tools.push_back({
      {"name", "context.resolve"},
      {"description", "Resolve context from a cache using a query and token budget"},
      {"inputSchema",
       {
           {"type", "object"},
           {"required", json::array({"cache", "query", "budget"})},
           {"properties",
            {
                {"cache",
                 {{"type", "string"},
                  {"description", "Cache directory name (relative to the server's cache root)"}}},
                {"query",
                 {{"type", "string"}, {"description", "Search query for context selection"}}},
                {"budget",
                 {{"type", "integer"},
                  {"description", "Maximum token budget for selected context"},
                  {"minimum", 0}}},
            }},
       }},
  });

  tools.push_back({
      {"name", "context.list_caches"},
      {"description", "List available context caches under the server's cache root"},
      {"inputSchema",
       {
           {"type", "object"},
           {"properties", json::object()},
       }},
  });

  tools.push_back({
      {"name", "context.inspect_cache"},
      {"description", "Inspect cache structure, metadata, and validity"},
      {"inputSchema",
       {
           {"type", "object"},
           {"required", json::array({"cache"})},
           {"properties",
            {
                {"cache",
                 {{"type", "string"},
                  {"description", "Cache directory name (relative to the server's cache root)"}}},
            }},
       }},
  });

  return json{{"tools", tools}};
}

}  // namespace

std::optional<JsonRpcResponse> handle_initialize(const JsonRpcRequest& req,
                                                 const ServerContext& /*ctx*/) {
  return JsonRpcResponse::success(
      req.id, json{
                  {"protocolVersion", core::kProtocolVersion},
                  {"capabilities", {{"tools", json::object()}}},
                  {"serverInfo", {{"name", core::kServerName}, {"version", core::kBuildVersion}}},
              });
}

std::optional<JsonRpcResponse> handle_initialized_notification(const JsonRpcRequest& /*req*/,
                                                               const ServerContext& /*ctx*/) {
  return std::nullopt;
}

std::optional<JsonRpcResponse> handle_ping(const JsonRpcRequest& req, const ServerContext& /*ctx*/) {
  return JsonRpcResponse::success(req.id, json::object());
}

const json& tool_catalog() {
  static const json kCatalog = build_tool_catalog();
  return kCatalog;
}

std::optional<JsonRpcResponse> handle_tools_list(const JsonRpcRequest& req,
                                                 const ServerContext& /*ctx*/) {
  return JsonRpcResponse::success(req.id, tool_catalog());
}

std::optional<JsonRpcResponse> handle_tools_call(const JsonRpcRequest& req, const ServerContext& ctx) {
  if (!req.params.has_value()) {
    return JsonRpcResponse::failure(req.id,
                                    JsonRpcError::invalid_params("Missing params for tools/call"));
  }

  const json& params = req.params.value();
  if (!params.is_object()) {
    return JsonRpcResponse::failure(
        req.id, JsonRpcError::invalid_params("Invalid tools/call params: expected an object"));
  }
  if (!params.contains("name") || !params["name"].is_string()) {
    return JsonRpcResponse::failure(
        req.id,
        JsonRpcError::invalid_params("Invalid tools/call params: missing string field `name`"));
  }

  const std::string tool_name = params["name"].get<std::string>();
  std::optional<json> arguments;
  if (params.contains("arguments") && !params["arguments"].is_null()) {
    arguments = params["arguments"];
  }

  static const auto tool_registry = handlers::build_tool_registry();

  ToolResult result;
  auto it = tool_registry.find(tool_name);
  if (it == tool_registry.end()) {
    result = ToolResult::error("Unknown tool: " + tool_name);
  } else {
    try {
      result = it->second(arguments, ctx);
    } catch (const std::exception& e) {
      std::cerr << "Tool " << tool_name << " failed: " << e.what() << "\n";
      result = ToolResult::from_mcp_error(core::canonical_error(core::McpErrorCode::kInternalError));
    }
  }

  return JsonRpcResponse::success(req.id, tool_result_to_json(result));
}

MethodRegistry build_method_registry() {
  return {
      {"initialize", handle_initialize},
      {"notifications/initialized", handle_initialized_notification},
      {"ping", handle_ping},
      {"tools/list", handle_tools_list},
      {"tools/call", handle_tools_call},
  };
}

std::optional<JsonRpcResponse> dispatch_request(const JsonRpcRequest& req, const ServerContext& ctx,
                                                const MethodRegistry& registry) {
  auto it = registry.find(req.method);
  if (it == registry.end()) {
    return JsonRpcResponse::failure(req.id, JsonRpcError::method_not_found(req.method));
  }
  return it->second(req, ctx);
}

}  // namespace ctxmcp::mcp
