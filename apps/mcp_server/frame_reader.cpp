#include "frame_reader.h"

#include <streambuf>
#include <utility>

namespace ctxmcp::mcp {

FrameReader::FrameReader(std::istream& in, const std::size_t max_bytes)
    : in_(in), max_bytes_(max_bytes) {}

Frame FrameReader::next() {
  using traits = std::char_traits<char>;

  std::streambuf* buf = in_.rdbuf();
  if (buf == nullptr) {
    return Frame{FrameStatus::kEndOfInput, {}};
  }

  std::string bytes;
  bool any_read = false;
  bool oversized = false;

  for (;;) {
    const traits::int_type ch = buf->sbumpc();
    if (traits::eq_int_type(ch, traits::eof())) {
      in_.setstate(std::ios::eofbit);
      break;
    }
    any_read = true;
    if (traits::to_char_type(ch) == '\n') {
      break;
    }
    if (oversized) {
      continue;
    }
    if (bytes.size() == max_bytes_) {
      oversized = true;
      bytes.clear();
      bytes.shrink_to_fit();
      continue;
    }
    bytes.push_back(traits::to_char_type(ch));
  }

  if (!any_read) {
    return Frame{FrameStatus::kEndOfInput, {}};
  }
  if (oversized) {
    return Frame{FrameStatus::kOversized, {}};
  }
  return Frame{FrameStatus::kLine, std::move(bytes)};
}

}  // namespace ctxmcp::mcp
