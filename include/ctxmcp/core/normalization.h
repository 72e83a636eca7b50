#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ctxmcp::core {

// Deterministic ASCII-only text utilities. Locale-independent and
// byte-stable across platforms and compilers.

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

// tokenize_ascii splits input on non-alphanumeric delimiters into tokens.
// - A-Z folded to a-z via explicit char math (no std::tolower)
// - Non-alphanumeric bytes (including all non-ASCII) act as delimiters
// - Tokens shorter than min_length are dropped
// - Returns tokens in encounter order (caller sorts if needed)
inline std::vector<std::string> tokenize_ascii(const std::string_view input,
                                               const std::size_t min_length = 2) {
  std::vector<std::string> tokens;
  std::string current;

  const auto flush = [&]() {
    if (current.size() >= min_length) {
      tokens.push_back(current);
    }
    current.clear();
  };

  for (const char ch : input) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
      current.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      current.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      flush();
    }
  }
  flush();

  return tokens;
}

// unique_tokens returns tokenize_ascii() output sorted and de-duplicated.
inline std::vector<std::string> unique_tokens(const std::string_view input) {
  auto tokens = tokenize_ascii(input);
  std::sort(tokens.begin(), tokens.end());
  tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
  return tokens;
}

// trim removes leading and trailing ASCII whitespace.
inline std::string_view trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }
  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }
  return input.substr(start, end - start);
}

// is_valid_utf8 reports whether input is well-formed UTF-8 (RFC 3629):
// no overlong forms, no surrogates, nothing above U+10FFFF.
inline bool is_valid_utf8(const std::string_view input) {
  std::size_t i = 0;
  while (i < input.size()) {
    const auto lead = static_cast<unsigned char>(input[i]);
    if (lead < 0x80u) {
      ++i;
      continue;
    }

    std::size_t extra = 0;
    unsigned char lower = 0x80u;
    unsigned char upper = 0xBFu;
    if (lead >= 0xC2u && lead <= 0xDFu) {
      extra = 1;
    } else if (lead >= 0xE0u && lead <= 0xEFu) {
      extra = 2;
      if (lead == 0xE0u) {
        lower = 0xA0u;
      } else if (lead == 0xEDu) {
        upper = 0x9Fu;
      }
    } else if (lead >= 0xF0u && lead <= 0xF4u) {
      extra = 3;
      if (lead == 0xF0u) {
        lower = 0x90u;
      } else if (lead == 0xF4u) {
        upper = 0x8Fu;
      }
    } else {
      return false;
    }

    if (i + extra >= input.size()) {
      return false;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
      const auto cont = static_cast<unsigned char>(input[i + k]);
      const unsigned char lo = (k == 1) ? lower : 0x80u;
      const unsigned char hi = (k == 1) ? upper : 0xBFu;
      if (cont < lo || cont > hi) {
        return false;
      }
    }
    i += extra + 1;
  }
  return true;
}

}  // namespace ctxmcp::core
