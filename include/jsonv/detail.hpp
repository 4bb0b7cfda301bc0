#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace jsonv {
namespace detail {

inline bool is_ws(char c) noexcept {
  return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

inline int hex_val(char c) noexcept {
  const unsigned char uc = static_cast<unsigned char>(c);
  if (uc >= static_cast<unsigned char>('0') && uc <= static_cast<unsigned char>('9')) {
    return static_cast<int>(uc - static_cast<unsigned char>('0'));
  }
  const unsigned char lc = static_cast<unsigned char>(uc | 0x20u); // ASCII to-lower
  if (lc >= static_cast<unsigned char>('a') && lc <= static_cast<unsigned char>('f')) {
    return 10 + static_cast<int>(lc - static_cast<unsigned char>('a'));
  }
  return -1;
}

inline char ascii_lower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool equal_fold(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (ascii_lower(a[i]) != ascii_lower(b[i])) return false;
  }
  return true;
}

template <class Out>
inline void append_utf8(Out& out, std::uint32_t cp) {
  using value_type = typename Out::value_type;
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<value_type>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<value_type>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<value_type>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<value_type>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<value_type>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<value_type>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<value_type>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<value_type>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<value_type>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<value_type>(0x80u | (cp & 0x3Fu)));
  }
}

inline bool parse_u4_unsafe(const char* p, std::uint32_t& out_cp) noexcept {
  const int h0 = hex_val(p[0]);
  const int h1 = hex_val(p[1]);
  const int h2 = hex_val(p[2]);
  const int h3 = hex_val(p[3]);
  if ((h0 | h1 | h2 | h3) < 0) return false;
  out_cp = (static_cast<std::uint32_t>(h0) << 12) |
           (static_cast<std::uint32_t>(h1) << 8) |
           (static_cast<std::uint32_t>(h2) << 4) |
           static_cast<std::uint32_t>(h3);
  return true;
}

inline double parse_double(std::string_view token) {
  // token is not NUL-terminated; avoid heap alloc for typical short numbers.
  constexpr std::size_t kStackCap = 128;
  if (token.size() < kStackCap) {
    char buf[kStackCap];
    if (!token.empty()) std::memcpy(buf, token.data(), token.size());
    buf[token.size()] = '\0';
    return std::strtod(buf, nullptr);
  }
  return std::strtod(std::string(token).c_str(), nullptr);
}

enum class int_parse { ok, not_integer, out_of_range };

// Parses a scanner-validated number token as a signed 64-bit integer.
inline int_parse parse_int64(std::string_view token, std::int64_t& out) noexcept {
  std::size_t i = 0;
  bool neg = false;
  if (i < token.size() && token[i] == '-') {
    neg = true;
    ++i;
  }
  if (i >= token.size()) return int_parse::not_integer;

  std::uint64_t acc = 0;
  bool overflow = false;
  for (; i < token.size(); ++i) {
    const char c = token[i];
    if (!is_digit(c)) return int_parse::not_integer;
    const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
    if (!overflow) {
      if (acc > (std::numeric_limits<std::uint64_t>::max() - d) / 10u) {
        overflow = true;
      } else {
        acc = acc * 10u + d;
      }
    }
  }
  if (overflow) return int_parse::out_of_range;

  const std::uint64_t limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  if (neg) {
    if (acc > limit + 1u) return int_parse::out_of_range;
    out = (acc == limit + 1u) ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(acc);
    return int_parse::ok;
  }
  if (acc > limit) return int_parse::out_of_range;
  out = static_cast<std::int64_t>(acc);
  return int_parse::ok;
}

template <class T, class = void>
struct is_streamable : std::false_type {};
template <class T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

// Display text for values echoed back in messages.
template <class T>
inline std::string to_text(const T& v) {
  if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
    // int8_t and uint8_t would stream as characters
    if constexpr (std::is_signed_v<T>) {
      return std::to_string(static_cast<long long>(v));
    } else {
      return std::to_string(static_cast<unsigned long long>(v));
    }
  } else if constexpr (is_streamable<T>::value) {
    std::ostringstream os;
    os << std::boolalpha << v;
    return os.str();
  } else {
    return "?";
  }
}

} // namespace detail
} // namespace jsonv
