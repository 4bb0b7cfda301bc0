#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace jsonv {

// Fatal (structural) failures. Validation problems are never reported here;
// they are collected as invalid_data records instead.
enum class error_code {
  ok = 0,
  end_of_input,
  io_error,
  parse_error,
  nesting_too_deep,
  trailing_characters,
  bad_destination,
  missing_field,
  bad_default,
  unsupported_type
};

inline const char* to_string(error_code code) noexcept {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::end_of_input: return "end of input";
    case error_code::io_error: return "io error";
    case error_code::parse_error: return "parse error";
    case error_code::nesting_too_deep: return "nesting too deep";
    case error_code::trailing_characters: return "trailing characters";
    case error_code::bad_destination: return "bad destination";
    case error_code::missing_field: return "missing field";
    case error_code::bad_default: return "bad default";
    case error_code::unsupported_type: return "unsupported type";
  }
  return "unknown";
}

struct error {
  error_code code{error_code::ok};
  std::string message;
  // Bytes consumed from the input when the error was raised.
  std::size_t offset{0};

  explicit operator bool() const noexcept { return code != error_code::ok; }
};

inline error make_error(error_code code, std::string message, std::size_t offset = 0) {
  error e;
  e.code = code;
  e.message = std::move(message);
  e.offset = offset;
  return e;
}

// One semantic rule violation, located by a slash-delimited path.
struct invalid_data {
  std::string path;
  std::string message;

  friend bool operator==(const invalid_data& a, const invalid_data& b) {
    return a.path == b.path && a.message == b.message;
  }
  friend bool operator!=(const invalid_data& a, const invalid_data& b) { return !(a == b); }
};

using validation_errors = std::vector<invalid_data>;

// Outcome of decoding one document.
//  - err set: the input was broken (syntax, transport, destination mismatch).
//  - invalid non-empty: the input was valid JSON but broke schema rules.
struct parse_result {
  error err;
  validation_errors invalid;

  bool ok() const noexcept { return !err && invalid.empty(); }
  bool is_validation_failure() const noexcept { return !err && !invalid.empty(); }
};

// Thrown by the *_or_throw construction helpers when a schema cannot be bound.
class prepare_error : public std::runtime_error {
public:
  explicit prepare_error(error e)
      : std::runtime_error("jsonv: " + std::string(to_string(e.code)) + ": " + e.message), err_(std::move(e)) {}

  const error& err() const noexcept { return err_; }

private:
  error err_;
};

} // namespace jsonv
