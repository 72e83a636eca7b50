#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace ctxmcp::mcp {

constexpr std::chrono::seconds kDefaultToolTimeout{30};
// Upper bound for the tool timeout (one day); keeps deadline arithmetic in range.
constexpr std::chrono::seconds kMaxToolTimeout{86400};

// McpServerConfig holds all parsed startup settings for the MCP server.
// Loaded once in main() and never mutated afterwards.
struct McpServerConfig {
  std::optional<std::string> cache_root;  // NOLINT(readability-identifier-naming) required
  std::chrono::milliseconds tool_timeout{  // NOLINT(readability-identifier-naming)
                                         kDefaultToolTimeout};
  // False when any flag or environment value was rejected during parsing.
  bool args_valid{true};  // NOLINT(readability-identifier-naming)
  bool show_help{false};  // NOLINT(readability-identifier-naming)
};

// Looks up an environment variable; nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

// parse_timeout_secs accepts a decimal integer number of seconds in
// [1, kMaxToolTimeout].
[[nodiscard]] std::optional<std::chrono::seconds> parse_timeout_secs(const std::string& value);

// parse_args reads --cache-root and --timeout-secs. Settings not given on the
// command line fall back to CONTEXT_CACHE_ROOT and CONTEXT_TOOL_TIMEOUT_SECS.
McpServerConfig parse_args(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                           const EnvLookup& env);

// Same, reading the process environment.
McpServerConfig parse_args(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

void print_usage(const std::string& program);

}  // namespace ctxmcp::mcp
