#include "ctxmcp/cache/lexical_context_engine.h"
#include "ctxmcp/core/clock.h"

#include "cache_build_logic.h"
#include "shared/arg_parser.h"
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct CacheBuildCliConfig {
  std::optional<std::string> source_dir;
  std::optional<std::string> output_dir;
};

}  // namespace

// context_cache_build --source <dir> --output <dir>
// Prints the cache_version of the written cache on stdout. When SOURCE_DATE_EPOCH
// is set, the manifest's created_at is pinned to it.
int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<ctxmcp::apps::Option<CacheBuildCliConfig>> options = {
      {"--source", true, "Directory of source documents (walked recursively)",
       [](CacheBuildCliConfig& c, const std::string& v) {
         c.source_dir = v;
         return true;
       }},
      {"--output", true, "Directory the cache is written to (created if missing)",
       [](CacheBuildCliConfig& c, const std::string& v) {
         c.output_dir = v;
         return true;
       }},
  };
  const auto parsed = ctxmcp::apps::parse_options(argc, argv, options);

  if (parsed.help) {
    ctxmcp::apps::print_usage(std::cout, argv[0], options);
    return 0;
  }
  if (!parsed.ok) {
    ctxmcp::apps::print_usage(std::cerr, argv[0], options);
    return 1;
  }
  if (!parsed.config.source_dir.has_value() || !parsed.config.output_dir.has_value()) {
    std::cerr << "Error: --source and --output are required\n";
    ctxmcp::apps::print_usage(std::cerr, argv[0], options);
    return 1;
  }

  std::optional<std::string> source_date_epoch;
  if (const char* value = std::getenv("SOURCE_DATE_EPOCH")) {  // NOLINT(concurrency-mt-unsafe)
    source_date_epoch = value;
  }
  ctxmcp::cache::LexicalContextEngine engine(ctxmcp::core::make_build_clock(source_date_epoch));
  const auto result = ctxmcp::apps::build_cache_from_directory(
      engine, parsed.config.source_dir.value(), parsed.config.output_dir.value());
  if (!result.has_value()) {
    std::cerr << "Error: " << result.error() << "\n";
    return 1;
  }

  std::cout << result.value() << "\n";
  return 0;
}
