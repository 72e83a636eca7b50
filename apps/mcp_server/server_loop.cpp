#include "server_loop.h"

#include "ctxmcp/core/normalization.h"

#include <nlohmann/json.hpp>

#include "frame_reader.h"
#include "handshake_gate.h"
#include "mcp_protocol.h"
#include "method_handlers.h"
#include <iostream>
#include <string>

namespace ctxmcp::mcp {

namespace {

bool write_response(std::ostream& out, const JsonRpcResponse& response) {
  out << serialize_response(response) << '\n' << std::flush;
  return static_cast<bool>(out);
}

}  // namespace

LoopExit run_server_loop(const ServerContext& ctx, std::istream& in, std::ostream& out) {
  const auto method_registry = build_method_registry();
  HandshakeGate gate;
  FrameReader reader(in);

  for (;;) {
    Frame frame = reader.next();
    if (frame.status == FrameStatus::kEndOfInput) {
      break;
    }

    if (frame.status == FrameStatus::kOversized) {
      std::cerr << "Message too large (limit " << kMaxFrameBytes << " bytes)\n";
      if (!write_response(out, JsonRpcResponse::failure(std::nullopt, JsonRpcError::parse_error()))) {
        return LoopExit::kOutputFailed;
      }
      continue;
    }

    if (!core::is_valid_utf8(frame.bytes)) {
      std::cerr << "Parse error: frame is not valid UTF-8\n";
      if (!write_response(out, JsonRpcResponse::failure(std::nullopt, JsonRpcError::parse_error()))) {
        return LoopExit::kOutputFailed;
      }
      continue;
    }

    const auto trimmed = core::trim(frame.bytes);
    if (trimmed.empty()) {
      continue;
    }

    auto parsed = parse_request(trimmed);
    if (!parsed.has_value()) {
      const auto& failure = parsed.error();
      std::cerr << "Rejected frame: " << failure.detail << "\n";
      if (failure.respond &&
          !write_response(out, JsonRpcResponse::failure(failure.id, failure.error))) {
        return LoopExit::kOutputFailed;
      }
      continue;
    }

    const JsonRpcRequest& request = parsed.value();
    std::cerr << "Received: " << request.method << "\n";

    switch (gate.admit(request)) {
      case GateVerdict::kDropSilently:
        continue;
      case GateVerdict::kRejectWithError:
        if (!write_response(out, JsonRpcResponse::failure(
                                     request.id,
                                     JsonRpcError::invalid_request("Server not initialized")))) {
          return LoopExit::kOutputFailed;
        }
        continue;
      case GateVerdict::kAdmit:
        break;
    }

    const auto response = dispatch_request(request, ctx, method_registry);
    gate.mark_routed(request);

    // Notifications never receive a reply, even when the handler produced one.
    if (response.has_value() && !request.is_notification() &&
        !write_response(out, response.value())) {
      return LoopExit::kOutputFailed;
    }
  }

  std::cerr << "MCP Server shutting down\n";
  return LoopExit::kEndOfInput;
}

}  // namespace ctxmcp::mcp
