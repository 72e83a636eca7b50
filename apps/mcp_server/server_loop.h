#pragma once

#include "server_context.h"
#include <istream>
#include <ostream>

namespace ctxmcp::mcp {

enum class LoopExit {
  kEndOfInput,    // clean shutdown
  kOutputFailed,  // a response could not be written; fatal
};

// run_server_loop reads newline-delimited JSON-RPC frames from `in` and writes
// one JSON document plus '\n' per response to `out`, flushing after each.
// Requests are handled one at a time in arrival order. Diagnostics go to stderr.
LoopExit run_server_loop(const ServerContext& ctx, std::istream& in, std::ostream& out);

}  // namespace ctxmcp::mcp
