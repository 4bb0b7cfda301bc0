#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "detail.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "reader.hpp"

// Config: number of bytes requested from the reader per refill.
// Override by defining JSONV_READ_LEN before including this header.
#ifndef JSONV_READ_LEN
  #define JSONV_READ_LEN 512
#endif

namespace jsonv {

enum class token_type {
  io_error = 0, // the reader failed

  object_begin,
  object_end,
  array_begin,
  array_end,
  item_sep, // ',' in arrays and objects
  prop_sep, // ':' between a property name and its value
  string,
  number,
  literal_true,
  literal_false,
  literal_null,

  end,        // no more data
  parse_error // the bytes are there but malformed
};

// Text used when reporting tokens back to clients.
inline const char* to_string(token_type t) noexcept {
  switch (t) {
    case token_type::object_begin: return "{";
    case token_type::object_end: return "}";
    case token_type::array_begin: return "[";
    case token_type::array_end: return "]";
    case token_type::item_sep: return ",";
    case token_type::prop_sep: return ":";
    case token_type::string: return "string";
    case token_type::number: return "number";
    case token_type::literal_true: return "true";
    case token_type::literal_false: return "false";
    case token_type::literal_null: return "null";
    case token_type::end: return "End of input";
    case token_type::parse_error: return "Parse Error";
    case token_type::io_error: break;
  }
  return "IO Error";
}

inline bool is_value_start(token_type t) noexcept {
  switch (t) {
    case token_type::object_begin:
    case token_type::array_begin:
    case token_type::string:
    case token_type::number:
    case token_type::literal_true:
    case token_type::literal_false:
    case token_type::literal_null:
      return true;
    default:
      return false;
  }
}

// `text` borrows the scanner's buffer and is only valid until the next call
// on that scanner. Strings keep their surrounding quotes and escapes.
struct token {
  token_type type{token_type::io_error};
  std::string_view text;
};

struct scanner_options {
  std::size_t read_len{JSONV_READ_LEN};
  // Deepest nesting skip_value/read_raw_value will follow.
  std::size_t max_depth{256};
};

// Pulls bytes from a reader and splits them into JSON tokens.
//
// The buffer grows on demand; bytes before the read cursor are discarded by
// sliding the unread tail to the front when that frees enough room. A reader
// error or end of input is sticky: the reader is never called again.
class scanner {
public:
  explicit scanner(reader& r, scanner_options opt = {}) : r_(&r), opt_(opt) {
    if (opt_.read_len == 0) opt_.read_len = JSONV_READ_LEN;
  }

  scanner(const scanner&) = delete;
  scanner& operator=(const scanner&) = delete;

  // Consumes the next token. On io_error/end/parse_error, last_error()
  // holds the details.
  token read_token() {
    if (!skip_space()) return fail_token();

    const char first = buf_[roff_];
    switch (first) {
      case '{': return consume(1, token_type::object_begin);
      case '}': return consume(1, token_type::object_end);
      case '[': return consume(1, token_type::array_begin);
      case ']': return consume(1, token_type::array_end);
      case ',': return consume(1, token_type::item_sep);
      case ':': return consume(1, token_type::prop_sep);
      case 't': return read_literal("true", token_type::literal_true);
      case 'f': return read_literal("false", token_type::literal_false);
      case 'n': return read_literal("null", token_type::literal_null);
      case '"': return read_string();
      default: break;
    }
    if (first == '-' || detail::is_digit(first)) return read_number();
    return parse_fail("Unexpected character " + describe_byte(first) + ", expected a JSON value");
  }

  // Identifies the next token from its first byte without consuming it.
  token_type peek_token() {
    if (!skip_space()) return fail_token().type;
    switch (buf_[roff_]) {
      case '{': return token_type::object_begin;
      case '}': return token_type::object_end;
      case '[': return token_type::array_begin;
      case ']': return token_type::array_end;
      case ',': return token_type::item_sep;
      case ':': return token_type::prop_sep;
      case 't': return token_type::literal_true;
      case 'f': return token_type::literal_false;
      case 'n': return token_type::literal_null;
      case '"': return token_type::string;
      default: break;
    }
    const char c = buf_[roff_];
    if (c == '-' || detail::is_digit(c)) return token_type::number;
    err_ = make_error(error_code::parse_error, "Unexpected character " + describe_byte(c) + ", expected a JSON value", rcount_);
    return token_type::parse_error;
  }

  // Consumes one complete value (scalar, object or array) without
  // interpreting it.
  error skip_value() { return skip_value_impl(nullptr, 0); }

  // Like skip_value, but writes a compact copy of the value's text to `out`.
  error read_raw_value(std::string& out) {
    out.clear();
    return skip_value_impl(&out, 0);
  }

  // Continues an already-opened container: skips everything up to and
  // including the matching close token. `open` is the token just consumed.
  error skip_rest(token_type open) {
    if (open == token_type::object_begin) return skip_object(nullptr, 1);
    if (open == token_type::array_begin) return skip_array(nullptr, 1);
    return {};
  }

  // Succeeds when only whitespace remains in the input.
  error expect_end() {
    if (skip_space()) {
      return make_error(error_code::trailing_characters,
                        "Unexpected " + describe_byte(buf_[roff_]) + " after the end of the document", rcount_);
    }
    if (rstatus_ == read_status::error) {
      fail_token();
      return err_;
    }
    return {};
  }

  // Builds the fatal error for a token that does not fit the grammar.
  // Error tokens keep the scanner's own error.
  error unexpected(const token& t, std::string_view expected) const {
    if (t.type == token_type::io_error || t.type == token_type::end || t.type == token_type::parse_error) return err_;
    std::string msg = "Expected ";
    msg.append(expected.data(), expected.size());
    msg += " not ";
    msg += to_string(t.type);
    return make_error(error_code::parse_error, std::move(msg), rcount_);
  }

  const error& last_error() const noexcept { return err_; }
  std::size_t consumed() const noexcept { return rcount_; }
  std::size_t buffer_capacity() const noexcept { return buf_.size(); }

private:
  enum class num_state { neg, zero, int_digits, dot, frac, exp, exp_sign, exp_digits, done, fail };

  static constexpr int kMaxEmptyReads = 100;

  reader* r_;
  scanner_options opt_;
  std::vector<char> buf_; // size() is the capacity
  std::size_t len_{0};    // write end
  std::size_t roff_{0};   // next byte to process
  std::size_t rcount_{0}; // bytes consumed in total
  read_status rstatus_{read_status::ok};
  std::string rmsg_;
  error err_;

  static std::string describe_byte(char c) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc >= 0x20 && uc < 0x7F) return std::string("'") + c + "'";
    static const char* hex = "0123456789ABCDEF";
    std::string s = "byte 0x";
    s.push_back(hex[uc >> 4]);
    s.push_back(hex[uc & 0xF]);
    return s;
  }

  token consume(std::size_t n, token_type type) {
    token t;
    t.type = type;
    t.text = std::string_view(buf_.data() + roff_, n);
    roff_ += n;
    rcount_ += n;
    return t;
  }

  // Called once the reader has nothing more to give.
  token fail_token() {
    token t;
    t.text = std::string_view(buf_.data() + roff_, len_ - roff_);
    if (rstatus_ == read_status::error) {
      t.type = token_type::io_error;
      err_ = make_error(error_code::io_error, rmsg_, rcount_);
    } else {
      t.type = token_type::end;
      err_ = make_error(error_code::end_of_input, "Unexpected end of input", rcount_);
    }
    return t;
  }

  token parse_fail(std::string msg) {
    err_ = make_error(error_code::parse_error, std::move(msg), rcount_);
    token t;
    t.type = token_type::parse_error;
    t.text = std::string_view(buf_.data() + roff_, len_ - roff_);
    return t;
  }

  // Reads up to another read_len bytes, making room first.
  bool fill_buffer() {
    if (rstatus_ != read_status::ok) return false;

    if (buf_.size() - len_ < opt_.read_len) {
      const std::size_t used = len_ - roff_;
      if (buf_.size() - used >= opt_.read_len) {
        // enough room once the consumed prefix is dropped
        if (used != 0) std::memmove(buf_.data(), buf_.data() + roff_, used);
        JSONV_TRACE("scanner compacted buffer, kept {} of {} bytes", used, len_);
      } else {
        std::vector<char> grown(2 * buf_.size() + opt_.read_len);
        if (used != 0) std::memcpy(grown.data(), buf_.data() + roff_, used);
        buf_.swap(grown);
        JSONV_TRACE("scanner buffer grown to {} bytes", buf_.size());
      }
      len_ = used;
      roff_ = 0;
    }

    for (int empty_reads = 0;;) {
      const std::size_t avail = buf_.size() - len_;
      read_result rr = r_->read(buf_.data() + len_, avail);
      const std::size_t n = std::min(rr.n, avail);
      len_ += n;
      if (rr.status != read_status::ok) {
        rstatus_ = rr.status;
        rmsg_ = std::move(rr.message);
        if (rstatus_ == read_status::error && rmsg_.empty()) rmsg_ = "read failed";
      }
      if (n != 0) return true;
      if (rstatus_ != read_status::ok) return false;
      if (++empty_reads >= kMaxEmptyReads) {
        rstatus_ = read_status::error;
        rmsg_ = "reader returned no data and no error";
        return false;
      }
    }
  }

  bool at_least(std::size_t count) {
    while (len_ - roff_ < count) {
      if (!fill_buffer()) return false;
    }
    return true;
  }

  // Moves the cursor to the next non-space byte; false when none is left.
  bool skip_space() {
    for (;;) {
      while (roff_ < len_ && detail::is_ws(buf_[roff_])) {
        ++roff_;
        ++rcount_;
      }
      if (roff_ < len_) return true;
      if (!fill_buffer()) return false;
    }
  }

  token read_literal(std::string_view lit, token_type type) {
    if (!at_least(lit.size())) {
      if (rstatus_ == read_status::error) return fail_token();
      const std::size_t have = len_ - roff_;
      if (std::memcmp(buf_.data() + roff_, lit.data(), have) != 0) {
        return parse_fail("Expected '" + std::string(lit) + "'");
      }
      return fail_token();
    }
    if (std::memcmp(buf_.data() + roff_, lit.data(), lit.size()) != 0) {
      return parse_fail("Expected '" + std::string(lit) + "'");
    }
    return consume(lit.size(), type);
  }

  token read_string() {
    // offset 0 is the opening quote
    std::size_t offset = 1;
    for (;;) {
      while (roff_ + offset < len_) {
        const char c = buf_[roff_ + offset];
        if (c == '"') return consume(offset + 1, token_type::string);
        if (c == '\\') {
          // the next byte is escaped, whatever it is
          offset += 2;
          continue;
        }
        ++offset;
      }
      if (!fill_buffer()) return fail_token();
    }
  }

  static num_state step(num_state s, char c, const char*& msg) noexcept {
    const bool digit = detail::is_digit(c);
    switch (s) {
      case num_state::neg:
        if (c == '0') return num_state::zero;
        if (digit) return num_state::int_digits;
        msg = "expected digit in number literal";
        return num_state::fail;
      case num_state::zero:
        if (c == '.') return num_state::dot;
        if (c == 'e' || c == 'E') return num_state::exp;
        if (digit) {
          msg = "unexpected digit after leading zero in number literal";
          return num_state::fail;
        }
        return num_state::done;
      case num_state::int_digits:
        if (digit) return num_state::int_digits;
        if (c == '.') return num_state::dot;
        if (c == 'e' || c == 'E') return num_state::exp;
        return num_state::done;
      case num_state::dot:
        if (digit) return num_state::frac;
        msg = "expected digit after decimal point in number literal";
        return num_state::fail;
      case num_state::frac:
        if (digit) return num_state::frac;
        if (c == 'e' || c == 'E') return num_state::exp;
        return num_state::done;
      case num_state::exp:
        if (digit) return num_state::exp_digits;
        if (c == '+' || c == '-') return num_state::exp_sign;
        msg = "expected digit or sign after 'e' in number literal";
        return num_state::fail;
      case num_state::exp_sign:
        if (digit) return num_state::exp_digits;
        msg = "expected digit after exponent sign in number literal";
        return num_state::fail;
      case num_state::exp_digits:
        if (digit) return num_state::exp_digits;
        return num_state::done;
      case num_state::done:
      case num_state::fail:
        break;
    }
    msg = "malformed number literal";
    return num_state::fail;
  }

  token read_number() {
    const char first = buf_[roff_];
    num_state state = first == '-' ? num_state::neg : (first == '0' ? num_state::zero : num_state::int_digits);
    const char* msg = nullptr;

    std::size_t offset = 1;
    for (;;) {
      if (roff_ + offset >= len_) {
        if (!fill_buffer()) break;
        continue;
      }
      state = step(state, buf_[roff_ + offset], msg);
      if (state == num_state::fail) return parse_fail(msg);
      if (state == num_state::done) return consume(offset, token_type::number);
      ++offset;
    }

    if (rstatus_ == read_status::error) return fail_token();
    // Out of input mid-literal: a delimiter forces the machine to resolve.
    state = step(state, ' ', msg);
    if (state == num_state::done) return consume(offset, token_type::number);
    return parse_fail(msg);
  }

  static void append(std::string* out, std::string_view s) {
    if (out) out->append(s.data(), s.size());
  }

  error skip_value_impl(std::string* out, std::size_t depth) {
    if (depth > opt_.max_depth) {
      return make_error(error_code::nesting_too_deep, "Nesting deeper than " + std::to_string(opt_.max_depth), rcount_);
    }
    const token t = read_token();
    switch (t.type) {
      case token_type::string:
      case token_type::number:
      case token_type::literal_true:
      case token_type::literal_false:
      case token_type::literal_null:
        append(out, t.text);
        return {};
      case token_type::object_begin:
        append(out, t.text);
        return skip_object(out, depth + 1);
      case token_type::array_begin:
        append(out, t.text);
        return skip_array(out, depth + 1);
      default:
        return unexpected(t, "a value");
    }
  }

  // '{' has been consumed. A ',' directly before '}' is tolerated, the same
  // way the object schema tolerates it.
  error skip_object(std::string* out, std::size_t depth) {
    if (depth > opt_.max_depth) {
      return make_error(error_code::nesting_too_deep, "Nesting deeper than " + std::to_string(opt_.max_depth), rcount_);
    }
    for (;;) {
      token t = read_token();
      if (t.type == token_type::object_end) {
        if (out && !out->empty() && out->back() == ',') out->pop_back();
        append(out, t.text);
        return {};
      }
      if (t.type != token_type::string) return unexpected(t, "object property name or '}'");
      append(out, t.text);

      t = read_token();
      if (t.type != token_type::prop_sep) return unexpected(t, "':'");
      append(out, t.text);

      if (auto e = skip_value_impl(out, depth)) return e;

      t = read_token();
      if (t.type == token_type::object_end) {
        append(out, t.text);
        return {};
      }
      if (t.type != token_type::item_sep) return unexpected(t, "',' or '}'");
      append(out, t.text);
    }
  }

  // '[' has been consumed.
  error skip_array(std::string* out, std::size_t depth) {
    if (depth > opt_.max_depth) {
      return make_error(error_code::nesting_too_deep, "Nesting deeper than " + std::to_string(opt_.max_depth), rcount_);
    }
    const token_type next = peek_token();
    if (next == token_type::array_end) {
      append(out, read_token().text);
      return {};
    }
    for (;;) {
      if (auto e = skip_value_impl(out, depth)) return e;
      const token t = read_token();
      if (t.type == token_type::array_end) {
        append(out, t.text);
        return {};
      }
      if (t.type != token_type::item_sep) return unexpected(t, "',' or ']'");
      append(out, t.text);
    }
  }
};

} // namespace jsonv
