#include "ctxmcp/cache/lexical_context_engine.h"
#include "ctxmcp/core/clock.h"

#include <catch2/catch_test_macros.hpp>

#include "handlers/resolve_context.h"
#include "test_support.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace ctxmcp;
using namespace ctxmcp::mcp;
using json = nlohmann::json;
using ctxmcp::testing::ScopedTempDir;
using ctxmcp::testing::write_text;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

// Engine stub whose select() behaviour is chosen per test.
class StubEngine final : public cache::IContextEngine {
 public:
  enum class Mode { kSleep, kThrow, kInvalidQuery };

  explicit StubEngine(Mode mode) : mode_(mode) {}

  core::Result<cache::ContextCache, cache::EngineError> build(
      const std::vector<cache::Document>& /*documents*/, const fs::path& /*output_dir*/) override {
    return core::Result<cache::ContextCache, cache::EngineError>::err(
        {cache::EngineErrorKind::kInternal, "not supported"});
  }

  [[nodiscard]] core::Result<cache::SelectionResult, cache::EngineError> select(
      const cache::ContextCache& /*cache*/, const std::string& /*query*/,
      std::size_t /*budget*/) const override {
    calls_->fetch_add(1);
    switch (mode_) {
      case Mode::kSleep:
        std::this_thread::sleep_for(2s);
        break;
      case Mode::kThrow:
        throw std::runtime_error("selection blew up");
      case Mode::kInvalidQuery:
        return core::Result<cache::SelectionResult, cache::EngineError>::err(
            {cache::EngineErrorKind::kInvalidQuery, "bad query"});
    }
    return core::Result<cache::SelectionResult, cache::EngineError>::ok(cache::SelectionResult{});
  }

  [[nodiscard]] int calls() const { return calls_->load(); }

 private:
  Mode mode_;
  std::shared_ptr<std::atomic<int>> calls_ = std::make_shared<std::atomic<int>>(0);
};

struct Fixture {
  Fixture() {
    const fs::path src = root.path() / "docs";
    cache::LexicalContextEngine builder(std::make_unique<core::FixedClock>("2026-01-01T00:00:00Z"));
    const auto built = builder.build(
        {
            cache::make_document("a.md", "a.md", "cache invalidation strategies"),
            cache::make_document("b.md", "b.md", "budgeted cache selection"),
            cache::make_document("c.md", "c.md", "nothing relevant"),
        },
        src);
    REQUIRE(built.has_value());
  }

  [[nodiscard]] ServerContext context(std::shared_ptr<const cache::IContextEngine> engine,
                                      std::chrono::milliseconds timeout = 30s) const {
    return ServerContext{root.path(), timeout, std::move(engine)};
  }

  [[nodiscard]] ServerContext lexical() const {
    return context(std::make_shared<cache::LexicalContextEngine>());
  }

  ScopedTempDir root;
};

std::string error_code_of(const ToolResult& result) {
  REQUIRE(result.is_error);
  REQUIRE(result.content.size() == 1);
  return json::parse(result.content[0].text)["error"]["code"].get<std::string>();
}

}  // namespace

TEST_CASE("context.resolve selects documents", "[mcp][tools][resolve]") {
  Fixture fx;
  const auto result = handlers::handle_resolve_context(
      json{{"cache", "docs"}, {"query", "cache"}, {"budget", 1000}}, fx.lexical());
  REQUIRE_FALSE(result.is_error);
  REQUIRE(result.content.size() == 1);

  const std::string& text = result.content[0].text;
  REQUIRE_FALSE(text.empty());
  CHECK(text.back() == '\n');

  const auto payload = json::parse(text);
  REQUIRE(payload["documents"].size() == 2);
  CHECK(payload["documents"][0]["id"] == "a.md");
  CHECK(payload["documents"][1]["id"] == "b.md");
  CHECK(payload["selection"]["budget"] == 1000);
  CHECK(payload["selection"]["documents_considered"] == 3);
}

TEST_CASE("context.resolve is deterministic across calls", "[mcp][tools][resolve][determinism]") {
  Fixture fx;
  const json args{{"cache", "docs"}, {"query", "cache selection"}, {"budget", 8}};
  const auto first = handlers::handle_resolve_context(args, fx.lexical());
  const auto second = handlers::handle_resolve_context(args, fx.lexical());
  REQUIRE_FALSE(first.is_error);
  CHECK(first.content[0].text == second.content[0].text);
}

TEST_CASE("context.resolve with zero budget selects nothing", "[mcp][tools][resolve]") {
  Fixture fx;
  const auto result = handlers::handle_resolve_context(
      json{{"cache", "docs"}, {"query", "cache"}, {"budget", 0}}, fx.lexical());
  REQUIRE_FALSE(result.is_error);
  const auto payload = json::parse(result.content[0].text);
  CHECK(payload["documents"].empty());
  CHECK(payload["selection"]["tokens_used"] == 0);
}

TEST_CASE("context.resolve negative budget fails before any I/O", "[mcp][tools][resolve]") {
  // The cache root does not exist; a filesystem lookup would yield cache_missing.
  auto engine = std::make_shared<StubEngine>(StubEngine::Mode::kInvalidQuery);
  const ServerContext ctx{"/nonexistent/ctxmcp/root", 30s, engine};

  const auto result = handlers::handle_resolve_context(
      json{{"cache", "missing-dir"}, {"query", "q"}, {"budget", -1}}, ctx);
  CHECK(error_code_of(result) == "invalid_budget");
  CHECK(engine->calls() == 0);
}

TEST_CASE("context.resolve unknown cache is cache_missing", "[mcp][tools][resolve]") {
  Fixture fx;
  const auto result = handlers::handle_resolve_context(
      json{{"cache", "missing-dir"}, {"query", "q"}, {"budget", 10}}, fx.lexical());
  CHECK(error_code_of(result) == "cache_missing");
}

TEST_CASE("context.resolve rejects cache names outside the root", "[mcp][tools][resolve]") {
  Fixture fx;
  auto engine = std::make_shared<StubEngine>(StubEngine::Mode::kInvalidQuery);
  const auto ctx = fx.context(engine);

  for (const char* name : {"../x", "..", "/etc", "docs/../docs"}) {
    CAPTURE(name);
    const auto result = handlers::handle_resolve_context(
        json{{"cache", name}, {"query", "cache"}, {"budget", 10}}, ctx);
    CHECK(error_code_of(result) == "cache_missing");
  }
  CHECK(engine->calls() == 0);
}

TEST_CASE("context.resolve cache without manifest is cache_invalid", "[mcp][tools][resolve]") {
  Fixture fx;
  fs::create_directories(fx.root.path() / "empty");
  const auto result = handlers::handle_resolve_context(
      json{{"cache", "empty"}, {"query", "q"}, {"budget", 10}}, fx.lexical());
  CHECK(error_code_of(result) == "cache_invalid");
}

TEST_CASE("context.resolve corrupt manifest is cache_invalid", "[mcp][tools][resolve]") {
  Fixture fx;
  write_text(fx.root.path() / "docs" / "manifest.json", "{\"cache_version\":");
  const auto result = handlers::handle_resolve_context(
      json{{"cache", "docs"}, {"query", "cache"}, {"budget", 10}}, fx.lexical());
  CHECK(error_code_of(result) == "cache_invalid");
}

TEST_CASE("context.resolve blank query is invalid_query", "[mcp][tools][resolve]") {
  Fixture fx;
  const auto result = handlers::handle_resolve_context(
      json{{"cache", "docs"}, {"query", "  "}, {"budget", 10}}, fx.lexical());
  CHECK(error_code_of(result) == "invalid_query");
}

TEST_CASE("context.resolve maps engine failures", "[mcp][tools][resolve]") {
  Fixture fx;

  SECTION("timeout is internal_error and returns promptly") {
    auto engine = std::make_shared<StubEngine>(StubEngine::Mode::kSleep);
    const auto start = std::chrono::steady_clock::now();
    const auto result = handlers::handle_resolve_context(
        json{{"cache", "docs"}, {"query", "cache"}, {"budget", 10}}, fx.context(engine, 100ms));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(error_code_of(result) == "internal_error");
    CHECK(elapsed < 1500ms);
  }

  SECTION("throwing engine is internal_error") {
    auto engine = std::make_shared<StubEngine>(StubEngine::Mode::kThrow);
    const auto result = handlers::handle_resolve_context(
        json{{"cache", "docs"}, {"query", "cache"}, {"budget", 10}}, fx.context(engine));
    CHECK(error_code_of(result) == "internal_error");
  }

  SECTION("engine invalid query maps through") {
    auto engine = std::make_shared<StubEngine>(StubEngine::Mode::kInvalidQuery);
    const auto result = handlers::handle_resolve_context(
        json{{"cache", "docs"}, {"query", "cache"}, {"budget", 10}}, fx.context(engine));
    CHECK(error_code_of(result) == "invalid_query");
  }
}

TEST_CASE("context.resolve argument errors are tool errors", "[mcp][tools][resolve]") {
  Fixture fx;

  SECTION("missing arguments") {
    const auto result = handlers::handle_resolve_context(std::nullopt, fx.lexical());
    REQUIRE(result.is_error);
    CHECK(result.content[0].text == "Missing arguments for context.resolve");
  }

  SECTION("budget must be an integer") {
    const auto result = handlers::handle_resolve_context(
        json{{"cache", "docs"}, {"query", "cache"}, {"budget", "ten"}}, fx.lexical());
    REQUIRE(result.is_error);
    CHECK(result.content[0].text ==
          "Invalid arguments for context.resolve: field `budget` must be an integer");
  }

  SECTION("query is required") {
    const auto result = handlers::handle_resolve_context(
        json{{"cache", "docs"}, {"budget", 10}}, fx.lexical());
    REQUIRE(result.is_error);
    CHECK(result.content[0].text ==
          "Invalid arguments for context.resolve: missing field `query`");
  }
}
