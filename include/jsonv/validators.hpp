#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "detail.hpp"
#include "type_desc.hpp"

namespace jsonv {

// Validator capabilities. Each check returns the client-facing message when
// the value is rejected and nothing when it is accepted. Validators are
// shared by every parse running on a schema and must not keep state.

class string_validator {
public:
  virtual ~string_validator() = default;
  virtual std::optional<std::string> validate_string(std::string_view s) const = 0;
};

class bytes_validator {
public:
  virtual ~bytes_validator() = default;
  virtual std::optional<std::string> validate_bytes(const std::vector<std::uint8_t>& b) const = 0;
};

class slice_validator {
public:
  virtual ~slice_validator() = default;
  virtual std::optional<std::string> validate_count(std::size_t n) const = 0;
};

class integer_validator {
public:
  virtual ~integer_validator() = default;
  virtual std::optional<std::string> validate_integer(std::int64_t v) const = 0;
};

class float_validator {
public:
  virtual ~float_validator() = default;
  virtual std::optional<std::string> validate_float(double v) const = 0;
};

class date_validator {
public:
  virtual ~date_validator() = default;
  virtual std::optional<std::string> validate_date(time_point t) const = 0;
};

using string_validator_ptr = std::shared_ptr<const string_validator>;
using bytes_validator_ptr = std::shared_ptr<const bytes_validator>;
using slice_validator_ptr = std::shared_ptr<const slice_validator>;
using integer_validator_ptr = std::shared_ptr<const integer_validator>;
using float_validator_ptr = std::shared_ptr<const float_validator>;
using date_validator_ptr = std::shared_ptr<const date_validator>;

// ---- length ----

// Minimum length: bytes for strings and byte sequences, items for sequences.
class min_len_v final : public string_validator, public bytes_validator, public slice_validator {
public:
  explicit min_len_v(std::size_t n) noexcept : n_(n) {}

  std::optional<std::string> validate_string(std::string_view s) const override { return check_text(s.size()); }
  std::optional<std::string> validate_bytes(const std::vector<std::uint8_t>& b) const override {
    return check_text(b.size());
  }
  std::optional<std::string> validate_count(std::size_t n) const override {
    if (n < n_) return "Must contain at least " + std::to_string(n_) + " items";
    return std::nullopt;
  }

private:
  std::optional<std::string> check_text(std::size_t len) const {
    if (len < n_) return "Must be at least " + std::to_string(n_) + " characters long";
    return std::nullopt;
  }

  std::size_t n_;
};

class max_len_v final : public string_validator, public bytes_validator, public slice_validator {
public:
  explicit max_len_v(std::size_t n) noexcept : n_(n) {}

  std::optional<std::string> validate_string(std::string_view s) const override { return check_text(s.size()); }
  std::optional<std::string> validate_bytes(const std::vector<std::uint8_t>& b) const override {
    return check_text(b.size());
  }
  std::optional<std::string> validate_count(std::size_t n) const override {
    if (n > n_) return "Must contain no more than " + std::to_string(n_) + " items";
    return std::nullopt;
  }

private:
  std::optional<std::string> check_text(std::size_t len) const {
    if (len > n_) return "Must be no more than " + std::to_string(n_) + " characters long";
    return std::nullopt;
  }

  std::size_t n_;
};

inline std::shared_ptr<const min_len_v> min_len(long long n) {
  if (n < 0) throw std::invalid_argument("jsonv: minimum allowed length must be >= 0");
  return std::make_shared<const min_len_v>(static_cast<std::size_t>(n));
}

inline std::shared_ptr<const max_len_v> max_len(long long n) {
  if (n < 0) throw std::invalid_argument("jsonv: maximum allowed length must be >= 0");
  return std::make_shared<const max_len_v>(static_cast<std::size_t>(n));
}

// ---- pattern ----

// Unanchored ECMAScript search. Throws std::regex_error for a bad expression.
class pattern_v final : public string_validator {
public:
  explicit pattern_v(std::string expr, std::string message = {})
      : expr_(std::move(expr)), re_(expr_, std::regex::ECMAScript), message_(std::move(message)) {
    if (message_.empty()) message_ = "Must match regex pattern " + expr_;
  }

  std::optional<std::string> validate_string(std::string_view s) const override {
    if (std::regex_search(s.begin(), s.end(), re_)) return std::nullopt;
    return message_;
  }

private:
  std::string expr_;
  std::regex re_;
  std::string message_;
};

inline std::shared_ptr<const pattern_v> pattern(std::string expr, std::string message = {}) {
  return std::make_shared<const pattern_v>(std::move(expr), std::move(message));
}

// ---- numeric ranges ----

namespace detail {

enum class bound { min, max, min_exclusive, max_exclusive };

template <class T>
inline std::optional<std::string> check_bound(bound b, T limit, T v) {
  switch (b) {
    case bound::min:
      if (v < limit) return "Must be greater than or equal to " + to_text(limit);
      break;
    case bound::max:
      if (v > limit) return "Must be less than or equal to " + to_text(limit);
      break;
    case bound::min_exclusive:
      if (v <= limit) return "Must be greater than " + to_text(limit);
      break;
    case bound::max_exclusive:
      if (v >= limit) return "Must be less than " + to_text(limit);
      break;
  }
  return std::nullopt;
}

} // namespace detail

class integer_bound_v final : public integer_validator {
public:
  integer_bound_v(detail::bound b, std::int64_t limit) noexcept : b_(b), limit_(limit) {}

  std::optional<std::string> validate_integer(std::int64_t v) const override {
    return detail::check_bound(b_, limit_, v);
  }

private:
  detail::bound b_;
  std::int64_t limit_;
};

class integer_multiple_v final : public integer_validator {
public:
  explicit integer_multiple_v(std::int64_t m) : m_(m) {
    if (m == 0) throw std::invalid_argument("jsonv: multiple-of divisor must not be 0");
  }

  std::optional<std::string> validate_integer(std::int64_t v) const override {
    // -1 never fails and would overflow INT64_MIN % -1
    if (m_ == -1 || v % m_ == 0) return std::nullopt;
    return "Must be a multiple of " + std::to_string(m_);
  }

private:
  std::int64_t m_;
};

class float_bound_v final : public float_validator {
public:
  float_bound_v(detail::bound b, double limit) noexcept : b_(b), limit_(limit) {}

  std::optional<std::string> validate_float(double v) const override { return detail::check_bound(b_, limit_, v); }

private:
  detail::bound b_;
  double limit_;
};

class float_multiple_v final : public float_validator {
public:
  explicit float_multiple_v(double m) : m_(m) {
    if (m == 0.0) throw std::invalid_argument("jsonv: multiple-of divisor must not be 0");
  }

  std::optional<std::string> validate_float(double v) const override {
    if (std::fmod(v, m_) == 0.0) return std::nullopt;
    return "Must be a multiple of " + detail::to_text(m_);
  }

private:
  double m_;
};

inline integer_validator_ptr min_i(std::int64_t v) {
  return std::make_shared<const integer_bound_v>(detail::bound::min, v);
}
inline integer_validator_ptr max_i(std::int64_t v) {
  return std::make_shared<const integer_bound_v>(detail::bound::max, v);
}
inline integer_validator_ptr min_ei(std::int64_t v) {
  return std::make_shared<const integer_bound_v>(detail::bound::min_exclusive, v);
}
inline integer_validator_ptr max_ei(std::int64_t v) {
  return std::make_shared<const integer_bound_v>(detail::bound::max_exclusive, v);
}
inline integer_validator_ptr mul_of_i(std::int64_t v) { return std::make_shared<const integer_multiple_v>(v); }

inline float_validator_ptr min_f(double v) { return std::make_shared<const float_bound_v>(detail::bound::min, v); }
inline float_validator_ptr max_f(double v) { return std::make_shared<const float_bound_v>(detail::bound::max, v); }
inline float_validator_ptr min_ef(double v) {
  return std::make_shared<const float_bound_v>(detail::bound::min_exclusive, v);
}
inline float_validator_ptr max_ef(double v) {
  return std::make_shared<const float_bound_v>(detail::bound::max_exclusive, v);
}
inline float_validator_ptr mul_of_f(double v) { return std::make_shared<const float_multiple_v>(v); }

// ---- dates ----

class date_bound_v final : public date_validator {
public:
  date_bound_v(bool before, time_point limit, std::string message)
      : before_(before), limit_(limit), message_(std::move(message)) {}

  std::optional<std::string> validate_date(time_point t) const override {
    if (before_ ? t < limit_ : t > limit_) return message_;
    return std::nullopt;
  }

private:
  bool before_;
  time_point limit_;
  std::string message_;
};

// Rejects values earlier than `limit`.
inline date_validator_ptr not_before(time_point limit, std::string message = "Must not be before the earliest allowed date") {
  return std::make_shared<const date_bound_v>(true, limit, std::move(message));
}

// Rejects values later than `limit`.
inline date_validator_ptr not_after(time_point limit, std::string message = "Must not be after the latest allowed date") {
  return std::make_shared<const date_bound_v>(false, limit, std::move(message));
}

// ---- function adapters ----

class string_validator_fn final : public string_validator {
public:
  using fn_type = std::function<std::optional<std::string>(std::string_view)>;
  explicit string_validator_fn(fn_type fn) : fn_(std::move(fn)) {}
  std::optional<std::string> validate_string(std::string_view s) const override { return fn_(s); }

private:
  fn_type fn_;
};

class bytes_validator_fn final : public bytes_validator {
public:
  using fn_type = std::function<std::optional<std::string>(const std::vector<std::uint8_t>&)>;
  explicit bytes_validator_fn(fn_type fn) : fn_(std::move(fn)) {}
  std::optional<std::string> validate_bytes(const std::vector<std::uint8_t>& b) const override { return fn_(b); }

private:
  fn_type fn_;
};

class slice_validator_fn final : public slice_validator {
public:
  using fn_type = std::function<std::optional<std::string>(std::size_t)>;
  explicit slice_validator_fn(fn_type fn) : fn_(std::move(fn)) {}
  std::optional<std::string> validate_count(std::size_t n) const override { return fn_(n); }

private:
  fn_type fn_;
};

class integer_validator_fn final : public integer_validator {
public:
  using fn_type = std::function<std::optional<std::string>(std::int64_t)>;
  explicit integer_validator_fn(fn_type fn) : fn_(std::move(fn)) {}
  std::optional<std::string> validate_integer(std::int64_t v) const override { return fn_(v); }

private:
  fn_type fn_;
};

class float_validator_fn final : public float_validator {
public:
  using fn_type = std::function<std::optional<std::string>(double)>;
  explicit float_validator_fn(fn_type fn) : fn_(std::move(fn)) {}
  std::optional<std::string> validate_float(double v) const override { return fn_(v); }

private:
  fn_type fn_;
};

class date_validator_fn final : public date_validator {
public:
  using fn_type = std::function<std::optional<std::string>(time_point)>;
  explicit date_validator_fn(fn_type fn) : fn_(std::move(fn)) {}
  std::optional<std::string> validate_date(time_point t) const override { return fn_(t); }

private:
  fn_type fn_;
};

inline string_validator_ptr string_fn(string_validator_fn::fn_type fn) {
  return std::make_shared<const string_validator_fn>(std::move(fn));
}
inline bytes_validator_ptr bytes_fn(bytes_validator_fn::fn_type fn) {
  return std::make_shared<const bytes_validator_fn>(std::move(fn));
}
inline slice_validator_ptr slice_fn(slice_validator_fn::fn_type fn) {
  return std::make_shared<const slice_validator_fn>(std::move(fn));
}
inline integer_validator_ptr integer_fn(integer_validator_fn::fn_type fn) {
  return std::make_shared<const integer_validator_fn>(std::move(fn));
}
inline float_validator_ptr float_fn(float_validator_fn::fn_type fn) {
  return std::make_shared<const float_validator_fn>(std::move(fn));
}
inline date_validator_ptr date_fn(date_validator_fn::fn_type fn) {
  return std::make_shared<const date_validator_fn>(std::move(fn));
}

} // namespace jsonv
