#pragma once

#include "mcp_protocol.h"

namespace ctxmcp::mcp {

enum class SessionState {
  kUninitialized,
  kReady,  // terminal for the life of the connection
};

enum class GateVerdict {
  kAdmit,          // route to the dispatcher
  kRejectWithError,  // answer "Server not initialized" (-32600)
  kDropSilently,     // notification before the handshake; no reply
};

// HandshakeGate enforces that only `initialize` is routed before the session
// is ready. One instance per connection; the server loop owns it.
//
// Ordering: admit() is evaluated before dispatch, and mark_routed() flips the
// state after an `initialize` request has been routed, whatever its result.
// A `notifications/initialized` that arrives before `initialize` is therefore
// dropped (or rejected if it carries an id); one that arrives after is
// admitted and produces no response.
class HandshakeGate {
 public:
  [[nodiscard]] GateVerdict admit(const JsonRpcRequest& request) const;

  // Call after the dispatcher has handled an admitted request.
  void mark_routed(const JsonRpcRequest& request);

  [[nodiscard]] SessionState state() const { return state_; }

 private:
  SessionState state_{SessionState::kUninitialized};
};

}  // namespace ctxmcp::mcp
