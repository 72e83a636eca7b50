#include "ctxmcp/cache/lexical_context_engine.h"
#include "ctxmcp/core/mcp_error.h"

#include <catch2/catch_test_macros.hpp>

#include "frame_reader.h"
#include "server_loop.h"
#include "test_support.h"
#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace ctxmcp;
using namespace ctxmcp::mcp;
using json = nlohmann::json;
using ctxmcp::testing::ScopedTempDir;

namespace {

constexpr const char* kInitialize =
    R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})";
constexpr const char* kInitialized = R"({"jsonrpc":"2.0","method":"notifications/initialized"})";

struct LoopRun {
  LoopExit exit;
  std::vector<json> responses;
  std::string raw;
};

LoopRun run(const std::string& input) {
  ScopedTempDir root;
  const ServerContext ctx{root.path(), std::chrono::seconds{30},
                          std::make_shared<cache::LexicalContextEngine>()};
  std::istringstream in(input);
  std::ostringstream out;

  LoopRun result{run_server_loop(ctx, in, out), {}, out.str()};

  std::istringstream lines(result.raw);
  std::string line;
  while (std::getline(lines, line)) {
    result.responses.push_back(json::parse(line));
  }
  return result;
}

std::string handshake() {
  return std::string(kInitialize) + "\n" + kInitialized + "\n";
}

}  // namespace

TEST_CASE("server loop completes the handshake", "[mcp][loop]") {
  const auto result = run(handshake() + R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" + "\n");

  CHECK(result.exit == LoopExit::kEndOfInput);
  REQUIRE(result.responses.size() == 2);
  CHECK(result.responses[0]["id"] == 1);
  CHECK(result.responses[0]["result"]["protocolVersion"] == "2024-11-05");
  CHECK(result.responses[1]["id"] == 2);
  CHECK(result.responses[1]["result"]["tools"].size() == 3);
}

TEST_CASE("server loop writes one line per response", "[mcp][loop]") {
  const auto result = run(handshake() + R"({"jsonrpc":"2.0","id":"p","method":"ping"})" + "\n");
  REQUIRE(result.responses.size() == 2);
  CHECK(result.raw.back() == '\n');
  CHECK(std::count(result.raw.begin(), result.raw.end(), '\n') == 2);
  CHECK(result.responses[1]["id"] == "p");
}

TEST_CASE("server loop rejects requests before initialize", "[mcp][loop][handshake]") {
  const auto result = run(std::string(R"({"jsonrpc":"2.0","id":5,"method":"tools/list"})") + "\n" +
                          kInitialized + "\n" + kInitialize + "\n");

  // tools/list is rejected, the early notification is dropped, initialize succeeds.
  REQUIRE(result.responses.size() == 2);
  CHECK(result.responses[0]["id"] == 5);
  CHECK(result.responses[0]["error"]["code"] == core::kInvalidRequest);
  CHECK(result.responses[0]["error"]["message"] == "Server not initialized");
  CHECK(result.responses[1]["id"] == 1);
  CHECK(result.responses[1].contains("result"));
}

TEST_CASE("server loop answers in arrival order", "[mcp][loop]") {
  std::string input = handshake();
  for (int id = 10; id < 15; ++id) {
    input += R"({"jsonrpc":"2.0","id":)" + std::to_string(id) + R"(,"method":"ping"})" + "\n";
  }
  const auto result = run(input);
  REQUIRE(result.responses.size() == 6);
  for (int i = 1; i < 6; ++i) {
    CHECK(result.responses[static_cast<std::size_t>(i)]["id"] == 9 + i);
  }
}

TEST_CASE("server loop transport failures", "[mcp][loop][transport]") {
  SECTION("invalid JSON is a parse error without id") {
    const auto result = run(handshake() + "{oops\n");
    REQUIRE(result.responses.size() == 2);
    CHECK(result.responses[1]["error"]["code"] == core::kParseError);
    CHECK_FALSE(result.responses[1].contains("id"));
  }

  SECTION("invalid UTF-8 is a parse error") {
    const auto result = run(handshake() + "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"p\xFF\"}\n");
    REQUIRE(result.responses.size() == 2);
    CHECK(result.responses[1]["error"]["code"] == core::kParseError);
  }

  SECTION("oversized frame is answered and the stream continues") {
    const std::string huge(kMaxFrameBytes + 1, 'a');
    const auto result =
        run(handshake() + huge + "\n" + R"({"jsonrpc":"2.0","id":9,"method":"ping"})" + "\n");
    REQUIRE(result.responses.size() == 3);
    CHECK(result.responses[1]["error"]["code"] == core::kParseError);
    CHECK(result.responses[2]["id"] == 9);
  }

  SECTION("blank lines are skipped") {
    const auto result = run("\n   \n\t\r\n" + handshake());
    REQUIRE(result.responses.size() == 1);
    CHECK(result.responses[0]["id"] == 1);
  }

  SECTION("empty input ends cleanly") {
    const auto result = run("");
    CHECK(result.exit == LoopExit::kEndOfInput);
    CHECK(result.raw.empty());
  }
}

TEST_CASE("server loop never answers notifications", "[mcp][loop]") {
  const auto result = run(handshake() + R"({"jsonrpc":"2.0","method":"ping"})" + "\n" +
                          R"({"jsonrpc":"2.0","method":"no/such/method"})" + "\n" +
                          R"({"jsonrpc":"1.0","method":"ping"})" + "\n");
  REQUIRE(result.responses.size() == 1);
  CHECK(result.responses[0]["id"] == 1);
}

TEST_CASE("server loop reports unknown methods", "[mcp][loop]") {
  const auto result = run(handshake() + R"({"jsonrpc":"2.0","id":4,"method":"nope"})" + "\n");
  REQUIRE(result.responses.size() == 2);
  CHECK(result.responses[1]["error"]["code"] == core::kMethodNotFound);
}

TEST_CASE("server loop tool error through the full stack", "[mcp][loop][tools]") {
  const auto result = run(
      handshake() +
      R"({"jsonrpc":"2.0","id":8,"method":"tools/call","params":{"name":"context.resolve","arguments":{"cache":"missing-dir","query":"q","budget":3}}})" +
      "\n");
  REQUIRE(result.responses.size() == 2);
  const auto& tool_result = result.responses[1]["result"];
  CHECK(tool_result["isError"] == true);
  const auto error = json::parse(tool_result["content"][0]["text"].get<std::string>());
  CHECK(error["error"]["code"] == "cache_missing");
}

TEST_CASE("server loop stops when output fails", "[mcp][loop]") {
  ScopedTempDir root;
  const ServerContext ctx{root.path(), std::chrono::seconds{30},
                          std::make_shared<cache::LexicalContextEngine>()};
  std::istringstream in(handshake());
  std::ostringstream out;
  out.setstate(std::ios::badbit);

  CHECK(run_server_loop(ctx, in, out) == LoopExit::kOutputFailed);
}
