#pragma once

#include <functional>
#include <iostream>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ctxmcp::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
// handler returns false when the value is rejected; it reports the reason itself.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;        // NOLINT(readability-identifier-naming)
  bool ok{true};        // NOLINT(readability-identifier-naming) false if any flag was rejected
  bool help{false};     // NOLINT(readability-identifier-naming) --help / -h seen
};

// parse_options walks argv[start..argc-1] and dispatches each recognised flag
// to its handler. Unknown flags, missing values and rejected values are
// reported to stderr and clear `ok`; parsing continues so every problem is
// reported in one pass.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), true, false};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg == "--help" || arg == "-h") {
      parsed.help = true;
      continue;
    }

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.ok = false;
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        std::cerr << "Option " << arg << " requires a value\n";
        parsed.ok = false;
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    if (!opt->handler(parsed.config, value)) {
      parsed.ok = false;
    }
  }

  return parsed;
}

template <typename Config>
void print_usage(std::ostream& os, const std::string& program,
                 const std::vector<Option<Config>>& options) {
  os << "Usage: " << program << " [options]\n";
  for (const auto& opt : options) {
    os << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
       << opt.description << "\n";
  }
}

}  // namespace ctxmcp::apps
