#pragma once

#include <cstddef>
#include <istream>
#include <string>

namespace ctxmcp::mcp {

// Per-message ceiling on the transport (1 MiB).
constexpr std::size_t kMaxFrameBytes = 1024 * 1024;

enum class FrameStatus {
  kLine,        // bytes holds one frame without its terminator
  kOversized,   // frame exceeded the ceiling; its bytes were discarded
  kEndOfInput,  // no bytes left
};

struct Frame {
  FrameStatus status;  // NOLINT(readability-identifier-naming)
  std::string bytes;   // NOLINT(readability-identifier-naming)
};

// FrameReader splits a byte stream into newline-terminated frames.
// A final frame without a terminator is still delivered. Memory use is
// bounded by max_bytes: the tail of an oversized frame is skipped unread.
class FrameReader {
 public:
  explicit FrameReader(std::istream& in, std::size_t max_bytes = kMaxFrameBytes);

  [[nodiscard]] Frame next();

 private:
  std::istream& in_;
  std::size_t max_bytes_;
};

}  // namespace ctxmcp::mcp
