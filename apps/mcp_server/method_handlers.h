#pragma once

#include <nlohmann/json.hpp>

#include "mcp_protocol.h"
#include "server_context.h"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace ctxmcp::mcp {

// A method handler returns nullopt when the method never produces a response.
using MethodHandler =
    std::function<std::optional<JsonRpcResponse>(const JsonRpcRequest& req, const ServerContext& ctx)>;
using MethodRegistry = std::unordered_map<std::string, MethodHandler>;

std::optional<JsonRpcResponse> handle_initialize(const JsonRpcRequest& req, const ServerContext& ctx);
std::optional<JsonRpcResponse> handle_initialized_notification(const JsonRpcRequest& req,
                                                               const ServerContext& ctx);
std::optional<JsonRpcResponse> handle_ping(const JsonRpcRequest& req, const ServerContext& ctx);
std::optional<JsonRpcResponse> handle_tools_list(const JsonRpcRequest& req, const ServerContext& ctx);
std::optional<JsonRpcResponse> handle_tools_call(const JsonRpcRequest& req, const ServerContext& ctx);

// Static catalog describing the advertised tools. Identical on every call.
const nlohmann::json& tool_catalog();

MethodRegistry build_method_registry();

// Exact-match routing; unknown methods yield method-not-found.
std::optional<JsonRpcResponse> dispatch_request(const JsonRpcRequest& req, const ServerContext& ctx,
                                                const MethodRegistry& registry);

}  // namespace ctxmcp::mcp
