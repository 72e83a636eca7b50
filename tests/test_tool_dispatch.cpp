#include "ctxmcp/cache/lexical_context_engine.h"
#include "ctxmcp/core/mcp_error.h"

#include <catch2/catch_test_macros.hpp>

#include "method_handlers.h"
#include "test_support.h"
#include <memory>
#include <set>
#include <string>

using namespace ctxmcp;
using namespace ctxmcp::mcp;
using json = nlohmann::json;
using ctxmcp::testing::ScopedTempDir;

namespace {

JsonRpcRequest make_request(const std::string& method, std::optional<json> params = std::nullopt) {
  JsonRpcRequest req;
  req.id = 1;
  req.method = method;
  req.params = std::move(params);
  return req;
}

struct Fixture {
  ScopedTempDir root;
  ServerContext ctx{root.path(), std::chrono::seconds{30},
                    std::make_shared<cache::LexicalContextEngine>()};
  MethodRegistry registry = build_method_registry();

  JsonRpcResponse call(const JsonRpcRequest& req) const {
    auto response = dispatch_request(req, ctx, registry);
    REQUIRE(response.has_value());
    return response.value();
  }
};

}  // namespace

TEST_CASE("initialize announces server identity", "[mcp][dispatch]") {
  Fixture fx;
  const auto response = fx.call(make_request("initialize", json::object()));
  REQUIRE(response.result.has_value());
  const auto& result = response.result.value();
  CHECK(result["protocolVersion"] == "2024-11-05");
  CHECK(result["serverInfo"]["name"] == "context-mcp");
  CHECK(result["capabilities"].contains("tools"));
}

TEST_CASE("notifications/initialized produces no response", "[mcp][dispatch]") {
  Fixture fx;
  JsonRpcRequest req;
  req.method = "notifications/initialized";
  CHECK_FALSE(dispatch_request(req, fx.ctx, fx.registry).has_value());
}

TEST_CASE("ping returns an empty object", "[mcp][dispatch]") {
  Fixture fx;
  const auto response = fx.call(make_request("ping"));
  REQUIRE(response.result.has_value());
  CHECK(response.result.value() == json::object());
}

TEST_CASE("unknown method is method-not-found", "[mcp][dispatch]") {
  Fixture fx;
  const auto response = fx.call(make_request("resources/list"));
  REQUIRE(response.error.has_value());
  CHECK(response.error->code == core::kMethodNotFound);
  CHECK(response.error->message == "Method not found: resources/list");
}

TEST_CASE("tools/list advertises the catalog", "[mcp][dispatch][tools]") {
  Fixture fx;
  const auto first = fx.call(make_request("tools/list"));
  const auto second = fx.call(make_request("tools/list"));
  REQUIRE(first.result.has_value());
  CHECK(first.result.value() == second.result.value());

  std::set<std::string> names;
  for (const auto& tool : first.result.value()["tools"]) {
    names.insert(tool["name"].get<std::string>());
    CHECK(tool["inputSchema"]["type"] == "object");
  }
  CHECK(names == std::set<std::string>{"context.resolve", "context.list_caches",
                                       "context.inspect_cache"});

  const auto& resolve = first.result.value()["tools"][0];
  CHECK(resolve["name"] == "context.resolve");
  CHECK(resolve["inputSchema"]["properties"]["budget"]["minimum"] == 0);
  CHECK(resolve["inputSchema"]["required"] == json::array({"cache", "query", "budget"}));
}

TEST_CASE("tools/call parameter errors are protocol errors", "[mcp][dispatch][tools]") {
  Fixture fx;

  SECTION("missing params") {
    const auto response = fx.call(make_request("tools/call"));
    REQUIRE(response.error.has_value());
    CHECK(response.error->code == core::kInvalidParams);
  }

  SECTION("params not an object") {
    const auto response = fx.call(make_request("tools/call", json::array()));
    REQUIRE(response.error.has_value());
    CHECK(response.error->code == core::kInvalidParams);
  }

  SECTION("name not a string") {
    const auto response = fx.call(make_request("tools/call", json{{"name", 3}}));
    REQUIRE(response.error.has_value());
    CHECK(response.error->code == core::kInvalidParams);
  }
}

TEST_CASE("tools/call routes to tools", "[mcp][dispatch][tools]") {
  Fixture fx;

  SECTION("unknown tool is a tool-level error") {
    const auto response = fx.call(make_request("tools/call", json{{"name", "context.delete"}}));
    REQUIRE(response.result.has_value());
    const auto& result = response.result.value();
    CHECK(result["isError"] == true);
    CHECK(result["content"][0]["text"] == "Unknown tool: context.delete");
  }

  SECTION("health is callable though not advertised") {
    const auto response = fx.call(make_request("tools/call", json{{"name", "health"}}));
    REQUIRE(response.result.has_value());
    const auto& result = response.result.value();
    CHECK_FALSE(result.contains("isError"));
    CHECK(json::parse(result["content"][0]["text"].get<std::string>()) ==
          json{{"status", "ok"}});
  }

  SECTION("resolve against a missing cache") {
    const auto response = fx.call(make_request(
        "tools/call",
        json{{"name", "context.resolve"},
             {"arguments", {{"cache", "missing-dir"}, {"query", "q"}, {"budget", 5}}}}));
    REQUIRE(response.result.has_value());
    const auto& result = response.result.value();
    CHECK(result["isError"] == true);
    const auto error = json::parse(result["content"][0]["text"].get<std::string>());
    CHECK(error["error"]["code"] == "cache_missing");
    CHECK(error["error"]["message"] == "Cache does not exist");
  }

  SECTION("list_caches with null arguments") {
    const auto response = fx.call(make_request(
        "tools/call", json{{"name", "context.list_caches"}, {"arguments", nullptr}}));
    REQUIRE(response.result.has_value());
    CHECK_FALSE(response.result.value().contains("isError"));
  }
}
