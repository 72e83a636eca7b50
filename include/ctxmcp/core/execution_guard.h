#pragma once

#include "ctxmcp/core/result.h"

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace ctxmcp::core {

enum class GuardFailure {
  kTimedOut,      // deadline elapsed; the worker was abandoned
  kWorkerFailed,  // the worker terminated by throwing
};

struct GuardError {
  GuardFailure kind;   // NOLINT(readability-identifier-naming)
  std::string detail;  // NOLINT(readability-identifier-naming)
};

// run_with_timeout executes work on a detached worker thread and waits at most
// `timeout` for its value.
//
// On timeout the worker is not cancelled; it keeps running until it returns and
// its result is discarded. Everything `work` captures must therefore stay valid
// for as long as the worker may run: capture by value or through shared_ptr.
//
// An exception thrown by `work` is reported as kWorkerFailed, never rethrown.
template <typename T>
Result<T, GuardError> run_with_timeout(std::function<T()> work,
                                       const std::chrono::milliseconds timeout) {
  auto promise = std::make_shared<std::promise<T>>();
  std::future<T> future = promise->get_future();

  try {
    std::thread worker([promise, work = std::move(work)]() {
      try {
        promise->set_value(work());
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
    });
    worker.detach();
  } catch (const std::system_error& e) {
    return Result<T, GuardError>::err(
        GuardError{GuardFailure::kWorkerFailed, std::string{"cannot start worker: "} + e.what()});
  }

  if (future.wait_for(timeout) != std::future_status::ready) {
    return Result<T, GuardError>::err(GuardError{
        GuardFailure::kTimedOut,
        "operation timed out after " + std::to_string(timeout.count()) + " ms"});
  }

  try {
    return Result<T, GuardError>::ok(future.get());
  } catch (const std::exception& e) {
    return Result<T, GuardError>::err(GuardError{GuardFailure::kWorkerFailed, e.what()});
  } catch (...) {
    return Result<T, GuardError>::err(
        GuardError{GuardFailure::kWorkerFailed, "worker threw a non-standard exception"});
  }
}

}  // namespace ctxmcp::core
