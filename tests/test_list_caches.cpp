#include "ctxmcp/cache/lexical_context_engine.h"

#include <catch2/catch_test_macros.hpp>

#include "handlers/list_caches.h"
#include "test_support.h"
#include <filesystem>
#include <memory>

using namespace ctxmcp;
using namespace ctxmcp::mcp;
using json = nlohmann::json;
using ctxmcp::testing::ScopedTempDir;
using ctxmcp::testing::write_text;

namespace fs = std::filesystem;

namespace {

ServerContext context_for(const fs::path& root) {
  return ServerContext{root, std::chrono::seconds{30},
                       std::make_shared<cache::LexicalContextEngine>()};
}

}  // namespace

TEST_CASE("context.list_caches lists immediate subdirectories", "[mcp][tools][list_caches]") {
  ScopedTempDir root;
  fs::create_directories(root.path() / "beta");
  fs::create_directories(root.path() / "alpha" / "nested");
  fs::create_directories(root.path() / "Zulu");
  write_text(root.path() / "alpha" / "manifest.json", "{}");
  write_text(root.path() / "stray.txt", "ignored");

  const auto result = handlers::handle_list_caches(std::nullopt, context_for(root.path()));
  REQUIRE_FALSE(result.is_error);
  REQUIRE(result.content.size() == 1);

  const auto payload = json::parse(result.content[0].text);
  const auto& caches = payload["caches"];
  REQUIRE(caches.size() == 3);

  // Byte-wise order: uppercase sorts first.
  CHECK(caches[0]["path"] == "Zulu");
  CHECK(caches[1]["path"] == "alpha");
  CHECK(caches[2]["path"] == "beta");
  CHECK(caches[0]["has_manifest"] == false);
  CHECK(caches[1]["has_manifest"] == true);
  CHECK(caches[2]["has_manifest"] == false);
}

TEST_CASE("context.list_caches skips symlinked directories", "[mcp][tools][list_caches]") {
  ScopedTempDir root;
  ScopedTempDir elsewhere;
  fs::create_directories(root.path() / "real");

  std::error_code ec;
  fs::create_directory_symlink(elsewhere.path(), root.path() / "linked", ec);
  if (ec) {
    SKIP("symlinks unavailable: " << ec.message());
  }

  const auto result = handlers::handle_list_caches(std::nullopt, context_for(root.path()));
  REQUIRE_FALSE(result.is_error);
  const auto caches = json::parse(result.content[0].text)["caches"];
  REQUIRE(caches.size() == 1);
  CHECK(caches[0]["path"] == "real");
}

TEST_CASE("context.list_caches on an empty root", "[mcp][tools][list_caches]") {
  ScopedTempDir root;
  const auto result = handlers::handle_list_caches(std::nullopt, context_for(root.path()));
  REQUIRE_FALSE(result.is_error);
  CHECK(result.content[0].text == R"({"caches":[]})");
}

TEST_CASE("context.list_caches with a missing root is cache_missing", "[mcp][tools][list_caches]") {
  ScopedTempDir scratch;
  const auto result =
      handlers::handle_list_caches(std::nullopt, context_for(scratch.path() / "absent"));
  REQUIRE(result.is_error);
  const auto error = json::parse(result.content[0].text);
  CHECK(error["error"]["code"] == "cache_missing");
}

TEST_CASE("context.list_caches treats a symlinked manifest as absent",
          "[mcp][tools][list_caches]") {
  ScopedTempDir root;
  ScopedTempDir elsewhere;
  fs::create_directories(root.path() / "linked_manifest");
  write_text(elsewhere.path() / "manifest.json", "{}");

  std::error_code ec;
  fs::create_symlink(elsewhere.path() / "manifest.json",
                     root.path() / "linked_manifest" / "manifest.json", ec);
  if (ec) {
    SKIP("symlinks unavailable: " << ec.message());
  }

  const auto result = handlers::handle_list_caches(std::nullopt, context_for(root.path()));
  REQUIRE_FALSE(result.is_error);
  const auto caches = json::parse(result.content[0].text)["caches"];
  REQUIRE(caches.size() == 1);
  CHECK(caches[0]["path"] == "linked_manifest");
  CHECK(caches[0]["has_manifest"] == false);
}
