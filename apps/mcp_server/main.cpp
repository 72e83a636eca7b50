#include "ctxmcp/cache/lexical_context_engine.h"
#include "ctxmcp/core/version.h"

#include "config.h"
#include "server_context.h"
#include "server_loop.h"
#include "startup_guard.h"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

using namespace ctxmcp;

int main(int argc, char* argv[]) {
  auto config = mcp::parse_args(argc, argv);

  if (config.show_help) {
    mcp::print_usage(argv[0]);
    return 0;
  }

  // Validate config before emitting any startup output so no partial messages appear on error.
  const std::string config_error = mcp::validate_mcp_server_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  // A closed stdout must surface as a failed write, not a signal.
  std::signal(SIGPIPE, SIG_IGN);

  const std::filesystem::path cache_root = config.cache_root.value();

  std::cerr << core::kServerName << " MCP Server v" << core::kBuildVersion << "\n";
  std::cerr << "Cache root:   " << cache_root.string() << "\n";
  std::cerr << "Tool timeout: "
            << std::chrono::duration_cast<std::chrono::seconds>(config.tool_timeout).count()
            << "s\n";
  {
    std::error_code ec;
    if (!std::filesystem::is_directory(cache_root, ec)) {
      std::cerr << "WARNING: cache root is not an accessible directory. Every cache lookup\n"
                   "         will fail until it is created.\n";
    }
  }
  std::cerr << "Listening on stdio for JSON-RPC requests...\n";

  mcp::ServerContext ctx{cache_root, config.tool_timeout,
                         std::make_shared<cache::LexicalContextEngine>()};

  const auto exit = mcp::run_server_loop(ctx, std::cin, std::cout);
  if (exit == mcp::LoopExit::kOutputFailed) {
    std::cerr << "Fatal: failed to write response to stdout\n";
    return 1;
  }
  return 0;
}
