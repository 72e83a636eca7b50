#include "ctxmcp/core/execution_guard.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace ctxmcp::core;
using namespace std::chrono_literals;

TEST_CASE("run_with_timeout returns the worker's value", "[core][guard]") {
  const auto result = run_with_timeout<int>([] { return 42; }, 1000ms);
  REQUIRE(result.has_value());
  CHECK(result.value() == 42);
}

TEST_CASE("run_with_timeout reports an elapsed deadline", "[core][guard]") {
  auto finished = std::make_shared<std::atomic<bool>>(false);

  const auto start = std::chrono::steady_clock::now();
  const auto result = run_with_timeout<int>(
      [finished] {
        std::this_thread::sleep_for(500ms);
        finished->store(true);
        return 1;
      },
      50ms);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == GuardFailure::kTimedOut);
  CHECK(elapsed < 450ms);

  // The abandoned worker still runs to completion on its own.
  std::this_thread::sleep_for(700ms);
  CHECK(finished->load());
}

TEST_CASE("run_with_timeout converts exceptions to kWorkerFailed", "[core][guard]") {
  const auto result = run_with_timeout<int>(
      []() -> int { throw std::runtime_error("engine exploded"); }, 1000ms);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().kind == GuardFailure::kWorkerFailed);
  CHECK(result.error().detail == "engine exploded");
}
