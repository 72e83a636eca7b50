#include "handshake_gate.h"

namespace ctxmcp::mcp {

namespace {

constexpr const char* kInitializeMethod = "initialize";

}  // namespace

GateVerdict HandshakeGate::admit(const JsonRpcRequest& request) const {
  if (state_ == SessionState::kReady || request.method == kInitializeMethod) {
    return GateVerdict::kAdmit;
  }
  return request.is_notification() ? GateVerdict::kDropSilently : GateVerdict::kRejectWithError;
}

void HandshakeGate::mark_routed(const JsonRpcRequest& request) {
  if (request.method == kInitializeMethod) {
    state_ = SessionState::kReady;
  }
}

}  // namespace ctxmcp::mcp
