#include "config.h"

#include "shared/arg_parser.h"

#include <charconv>
#include <cstdlib>
#include <iostream>
#include <vector>

namespace ctxmcp::mcp {

namespace {

constexpr const char* kCacheRootEnv = "CONTEXT_CACHE_ROOT";
constexpr const char* kTimeoutEnv = "CONTEXT_TOOL_TIMEOUT_SECS";

// Tracks which settings came from flags so the environment does not override them.
struct ParseState {
  McpServerConfig config;
  bool timeout_from_flag{false};
};

bool handle_cache_root(ParseState& state, const std::string& value) {
  if (value.empty()) {
    std::cerr << "Invalid --cache-root: value is empty\n";
    return false;
  }
  state.config.cache_root = value;
  return true;
}

bool handle_timeout_secs(ParseState& state, const std::string& value) {
  const auto timeout = parse_timeout_secs(value);
  if (!timeout.has_value()) {
    std::cerr << "Invalid --timeout-secs: " << value << " (must be an integer from 1 to "
              << kMaxToolTimeout.count() << ")\n";
    return false;
  }
  state.config.tool_timeout = timeout.value();
  state.timeout_from_flag = true;
  return true;
}

std::vector<apps::Option<ParseState>> build_option_registry() {
  return {
      {"--cache-root", true, "Root directory containing context caches (env: CONTEXT_CACHE_ROOT)",
       handle_cache_root},
      {"--timeout-secs", true,
       "Maximum seconds per context.resolve call, 1-86400, default 30 "
       "(env: CONTEXT_TOOL_TIMEOUT_SECS)",
       handle_timeout_secs},
  };
}

std::optional<std::string> process_env(const std::string& name) {
  const char* value = std::getenv(name.c_str());  // NOLINT(concurrency-mt-unsafe)
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string{value};
}

}  // namespace

std::optional<std::chrono::seconds> parse_timeout_secs(const std::string& value) {
  long long secs = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, secs);
  if (value.empty() || ec != std::errc{} || ptr != last || secs <= 0 ||
      secs > kMaxToolTimeout.count()) {
    return std::nullopt;
  }
  return std::chrono::seconds{secs};
}

McpServerConfig parse_args(int argc, char* argv[], const EnvLookup& env) {
  auto parsed = apps::parse_options(argc, argv, build_option_registry());
  ParseState& state = parsed.config;
  state.config.args_valid = parsed.ok;
  state.config.show_help = parsed.help;

  if (!state.config.cache_root.has_value()) {
    const auto root = env(kCacheRootEnv);
    if (root.has_value() && !root->empty()) {
      state.config.cache_root = root;
    }
  }

  if (!state.timeout_from_flag) {
    const auto raw = env(kTimeoutEnv);
    if (raw.has_value()) {
      const auto timeout = parse_timeout_secs(raw.value());
      if (timeout.has_value()) {
        state.config.tool_timeout = timeout.value();
      } else {
        std::cerr << kTimeoutEnv << " must be an integer from 1 to " << kMaxToolTimeout.count()
                  << ", got: " << raw.value() << "\n";
        state.config.args_valid = false;
      }
    }
  }

  return state.config;
}

McpServerConfig parse_args(int argc, char* argv[]) {
  return parse_args(argc, argv, process_env);
}

void print_usage(const std::string& program) {
  apps::print_usage(std::cerr, program, build_option_registry());
}

}  // namespace ctxmcp::mcp
