#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "detail.hpp"

namespace jsonv {

namespace detail {

constexpr std::uint32_t kReplacementChar = 0xFFFDu;

// Length of the well-formed UTF-8 sequence at p, or 0 if it is not one
// (truncated, overlong, surrogate or beyond U+10FFFF).
inline std::size_t utf8_sequence_len(const char* p, std::size_t n) noexcept {
  const auto b0 = static_cast<unsigned char>(p[0]);
  if (b0 < 0x80u) return 1;

  std::size_t len = 0;
  std::uint32_t cp = 0;
  if ((b0 & 0xE0u) == 0xC0u) {
    len = 2;
    cp = b0 & 0x1Fu;
  } else if ((b0 & 0xF0u) == 0xE0u) {
    len = 3;
    cp = b0 & 0x0Fu;
  } else if ((b0 & 0xF8u) == 0xF0u) {
    len = 4;
    cp = b0 & 0x07u;
  } else {
    return 0;
  }
  if (len > n) return 0;

  for (std::size_t k = 1; k < len; ++k) {
    const auto b = static_cast<unsigned char>(p[k]);
    if ((b & 0xC0u) != 0x80u) return 0;
    cp = (cp << 6) | (b & 0x3Fu);
  }

  static constexpr std::uint32_t kMin[5] = {0, 0, 0x80u, 0x800u, 0x10000u};
  if (cp < kMin[len]) return 0;
  if (cp > 0x10FFFFu) return 0;
  if (cp >= 0xD800u && cp <= 0xDFFFu) return 0;
  return len;
}

// True when the string body can be used as-is.
inline bool needs_no_decoding(std::string_view body) noexcept {
  std::size_t i = 0;
  while (i < body.size()) {
    const auto uc = static_cast<unsigned char>(body[i]);
    if (uc == '\\' || uc == '"' || uc < 0x20u) return false;
    if (uc < 0x80u) {
      ++i;
      continue;
    }
    const std::size_t len = utf8_sequence_len(body.data() + i, body.size() - i);
    if (len == 0) return false;
    i += len;
  }
  return true;
}

template <class Out>
inline bool decode_string_body(std::string_view body, Out& out) {
  using value_type = typename Out::value_type;
  out.clear();
  out.reserve(body.size());

  const char* p = body.data();
  const std::size_t n = body.size();
  std::size_t i = 0;
  while (i < n) {
    const char c = p[i];
    const auto uc = static_cast<unsigned char>(c);

    if (c == '\\') {
      if (i + 1 >= n) return false;
      const char esc = p[i + 1];
      i += 2;
      switch (esc) {
        case '"': out.push_back(static_cast<value_type>('"')); break;
        case '\\': out.push_back(static_cast<value_type>('\\')); break;
        case '/': out.push_back(static_cast<value_type>('/')); break;
        case '\'': out.push_back(static_cast<value_type>('\'')); break;
        case 'b': out.push_back(static_cast<value_type>('\b')); break;
        case 'f': out.push_back(static_cast<value_type>('\f')); break;
        case 'n': out.push_back(static_cast<value_type>('\n')); break;
        case 'r': out.push_back(static_cast<value_type>('\r')); break;
        case 't': out.push_back(static_cast<value_type>('\t')); break;
        case 'u': {
          std::uint32_t cp = 0;
          if (i + 4 > n || !parse_u4_unsafe(p + i, cp)) return false;
          i += 4;
          if (cp >= 0xD800u && cp <= 0xDBFFu) {
            // try to pair with a following low surrogate
            std::uint32_t low = 0;
            if (i + 6 <= n && p[i] == '\\' && p[i + 1] == 'u' && parse_u4_unsafe(p + i + 2, low) &&
                low >= 0xDC00u && low <= 0xDFFFu) {
              i += 6;
              cp = 0x10000u + (((cp - 0xD800u) << 10) | (low - 0xDC00u));
            } else {
              cp = kReplacementChar;
            }
          } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
            cp = kReplacementChar;
          }
          append_utf8(out, cp);
          break;
        }
        default:
          return false;
      }
      continue;
    }

    // raw quotes and control characters are not allowed inside a string
    if (c == '"' || uc < 0x20u) return false;

    if (uc < 0x80u) {
      out.push_back(static_cast<value_type>(c));
      ++i;
      continue;
    }

    const std::size_t len = utf8_sequence_len(p + i, n - i);
    if (len == 0) {
      append_utf8(out, kReplacementChar);
      ++i;
      continue;
    }
    for (std::size_t k = 0; k < len; ++k) out.push_back(static_cast<value_type>(p[i + k]));
    i += len;
  }
  return true;
}

inline bool string_body(std::string_view quoted, std::string_view& body) noexcept {
  if (quoted.size() < 2 || quoted.front() != '"' || quoted.back() != '"') return false;
  body = quoted.substr(1, quoted.size() - 2);
  return true;
}

} // namespace detail

// Decodes a quoted string token (quotes included). When the body holds no
// escapes, quotes, control characters or invalid UTF-8, `out` refers to the
// body inside `quoted` and nothing is copied; otherwise it refers to
// `scratch`. Unpaired surrogates and invalid UTF-8 become U+FFFD.
inline bool unquote(std::string_view quoted, std::string_view& out, std::string& scratch) {
  std::string_view body;
  if (!detail::string_body(quoted, body)) return false;
  if (detail::needs_no_decoding(body)) {
    out = body;
    return true;
  }
  if (!detail::decode_string_body(body, scratch)) return false;
  out = scratch;
  return true;
}

inline bool unquote(std::string_view quoted, std::string& out) {
  std::string_view body;
  if (!detail::string_body(quoted, body)) return false;
  if (detail::needs_no_decoding(body)) {
    out.assign(body.data(), body.size());
    return true;
  }
  return detail::decode_string_body(body, out);
}

inline bool unquote_bytes(std::string_view quoted, std::vector<std::uint8_t>& out) {
  std::string_view body;
  if (!detail::string_body(quoted, body)) return false;
  if (detail::needs_no_decoding(body)) {
    out.assign(body.begin(), body.end());
    return true;
  }
  return detail::decode_string_body(body, out);
}

} // namespace jsonv
