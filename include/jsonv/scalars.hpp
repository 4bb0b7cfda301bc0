#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "detail.hpp"
#include "schema.hpp"
#include "unquote.hpp"
#include "validators.hpp"

namespace jsonv {

namespace detail {

inline bool fits_width(std::int64_t v, std::size_t bits, bool is_signed) noexcept {
  if (bits >= 64) return is_signed || v >= 0;
  if (is_signed) {
    const std::int64_t hi = (std::int64_t{1} << (bits - 1)) - 1;
    return v >= -hi - 1 && v <= hi;
  }
  return v >= 0 && v <= (std::int64_t{1} << bits) - 1;
}

// strtod gives +-inf for magnitudes beyond double; float destinations
// overflow earlier.
inline bool fits_floating(double v, std::size_t bits) noexcept {
  if (!std::isfinite(v)) return false;
  return bits != 32 || std::fabs(v) <= static_cast<double>(std::numeric_limits<float>::max());
}

template <class Ptr, class Fn>
inline bool run_validators(const std::vector<Ptr>& vs, const path& at, validation_errors& errs, Fn&& check) {
  bool ok = true;
  for (const auto& v : vs) {
    if (auto msg = check(*v)) {
      errs.push_back({at.str(), std::move(*msg)});
      ok = false;
    }
  }
  return ok;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
constexpr std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) noexcept {
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

constexpr bool is_leap(std::int64_t y) noexcept { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

constexpr unsigned days_in_month(std::int64_t y, unsigned m) noexcept {
  constexpr unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return m == 2 && is_leap(y) ? 29u : kDays[m - 1];
}

inline bool read_digits(std::string_view s, std::size_t pos, std::size_t n, unsigned& out) noexcept {
  if (pos + n > s.size()) return false;
  out = 0;
  for (std::size_t i = pos; i < pos + n; ++i) {
    if (!is_digit(s[i])) return false;
    out = out * 10 + static_cast<unsigned>(s[i] - '0');
  }
  return true;
}

// yyyy-mm-dd
inline bool parse_date_prefix(std::string_view s, std::int64_t& days) noexcept {
  unsigned y = 0, m = 0, d = 0;
  if (!read_digits(s, 0, 4, y) || s.size() < 10 || s[4] != '-' || !read_digits(s, 5, 2, m) || s[7] != '-' ||
      !read_digits(s, 8, 2, d)) {
    return false;
  }
  if (m < 1 || m > 12 || d < 1 || d > days_in_month(y, m)) return false;
  days = days_from_civil(y, m, d);
  return true;
}

inline bool parse_date(std::string_view s, time_point& out) {
  std::int64_t days = 0;
  if (s.size() != 10 || !parse_date_prefix(s, days)) return false;
  out = time_point(std::chrono::duration_cast<time_point::duration>(std::chrono::hours(24 * days)));
  return true;
}

// yyyy-mm-dd[T ]hh:mm:ss[.fraction][Z], read as UTC.
inline bool parse_date_time(std::string_view s, time_point& out) {
  std::int64_t days = 0;
  if (!parse_date_prefix(s, days)) return false;
  if (s.size() < 19 || (s[10] != 'T' && s[10] != ' ')) return false;

  unsigned hh = 0, mm = 0, ss = 0;
  if (!read_digits(s, 11, 2, hh) || s[13] != ':' || !read_digits(s, 14, 2, mm) || s[16] != ':' ||
      !read_digits(s, 17, 2, ss)) {
    return false;
  }
  if (hh > 23 || mm > 59 || ss > 59) return false;

  std::size_t i = 19;
  std::int64_t nanos = 0;
  if (i < s.size() && s[i] == '.') {
    ++i;
    std::size_t digits = 0;
    while (i < s.size() && is_digit(s[i])) {
      if (digits < 9) nanos = nanos * 10 + (s[i] - '0');
      ++digits;
      ++i;
    }
    if (digits == 0) return false;
    for (; digits < 9; ++digits) nanos *= 10;
  }
  if (i < s.size() && s[i] == 'Z') ++i;
  if (i != s.size()) return false;

  const auto since_epoch = std::chrono::hours(24 * days) + std::chrono::hours(hh) + std::chrono::minutes(mm) +
                           std::chrono::seconds(ss) + std::chrono::nanoseconds(nanos);
  out = time_point(std::chrono::duration_cast<time_point::duration>(since_epoch));
  return true;
}

} // namespace detail

// Whole numbers into any integer width. Values are read as int64 first; a
// fraction, an exponent or a value outside the destination width is a rule
// violation.
class integer_schema final : public schema {
public:
  explicit integer_schema(std::vector<integer_validator_ptr> vs) : vs_(std::move(vs)) {}

  error prepare(const type_desc& t) override {
    if (t.kind != type_kind::integer) return want("an integer type", t);
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    token t;
    error fatal;
    if (!detail::read_scalar_token(s, t, fatal)) return fatal;
    if (t.type != token_type::number) return detail::wrong_kind(at, s, t, "Must be an integer, got value ", errs);

    std::int64_t v = 0;
    const detail::int_parse r = detail::parse_int64(t.text, v);
    if (r == detail::int_parse::not_integer) {
      errs.push_back({at.str(), "Must be an integer, got value " + std::string(t.text)});
      return {};
    }
    const type_desc& dt = *bound_type();
    if (r == detail::int_parse::out_of_range || !detail::fits_width(v, dt.bits, dt.is_signed)) {
      errs.push_back({at.str(), "Must fit in " + dt.name + ", got value " + std::string(t.text)});
      return {};
    }

    const bool ok = detail::run_validators(vs_, at, errs, [v](const integer_validator& iv) {
      return iv.validate_integer(v);
    });
    if (ok) dt.store_int(dest, v);
    return {};
  }

private:
  std::vector<integer_validator_ptr> vs_;
};

// Any number into float or double.
class number_schema final : public schema {
public:
  explicit number_schema(std::vector<float_validator_ptr> vs) : vs_(std::move(vs)) {}

  error prepare(const type_desc& t) override {
    if (t.kind != type_kind::floating) return want("a floating point type", t);
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    token t;
    error fatal;
    if (!detail::read_scalar_token(s, t, fatal)) return fatal;
    if (t.type != token_type::number) return detail::wrong_kind(at, s, t, "Must be a number, got value ", errs);

    const double v = detail::parse_double(t.text);
    const type_desc& dt = *bound_type();
    if (!detail::fits_floating(v, dt.bits)) {
      errs.push_back({at.str(), "Must fit in " + dt.name + ", got value " + std::string(t.text)});
      return {};
    }
    const bool ok = detail::run_validators(vs_, at, errs, [v](const float_validator& fv) {
      return fv.validate_float(v);
    });
    if (ok) dt.store_float(dest, v);
    return {};
  }

private:
  std::vector<float_validator_ptr> vs_;
};

// true/false into a bool, or as the literal text into a string.
class boolean_schema final : public schema {
public:
  error prepare(const type_desc& t) override {
    if (t.kind != type_kind::boolean && t.kind != type_kind::string) return want("bool", t);
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    token t;
    error fatal;
    if (!detail::read_scalar_token(s, t, fatal)) return fatal;
    if (t.type != token_type::literal_true && t.type != token_type::literal_false) {
      return detail::wrong_kind(at, s, t, "Must be a boolean, got value ", errs);
    }
    if (bound_type()->kind == type_kind::string) {
      static_cast<std::string*>(dest)->assign(t.text.data(), t.text.size());
    } else {
      *static_cast<bool*>(dest) = t.type == token_type::literal_true;
    }
    return {};
  }
};

class string_schema final : public schema {
public:
  explicit string_schema(std::vector<string_validator_ptr> vs) : vs_(std::move(vs)) {}

  error prepare(const type_desc& t) override {
    if (t.kind != type_kind::string) return want("string", t);
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    token t;
    error fatal;
    if (!detail::read_scalar_token(s, t, fatal)) return fatal;
    if (t.type != token_type::string) return detail::wrong_kind(at, s, t, "Must be a string, got value ", errs);

    std::string scratch;
    std::string_view text;
    if (!unquote(t.text, text, scratch)) {
      errs.push_back({at.str(), "Invalid string"});
      return {};
    }
    const bool ok = detail::run_validators(vs_, at, errs, [text](const string_validator& sv) {
      return sv.validate_string(text);
    });
    if (ok) static_cast<std::string*>(dest)->assign(text.data(), text.size());
    return {};
  }

private:
  std::vector<string_validator_ptr> vs_;
};

// A string decoded into a byte sequence.
class bytes_schema final : public schema {
public:
  explicit bytes_schema(std::vector<bytes_validator_ptr> vs) : vs_(std::move(vs)) {}

  error prepare(const type_desc& t) override {
    if (!t.is_bytes()) return want("[]uint8", t);
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    token t;
    error fatal;
    if (!detail::read_scalar_token(s, t, fatal)) return fatal;
    if (t.type != token_type::string) return detail::wrong_kind(at, s, t, "Must be a string, got value ", errs);

    std::vector<std::uint8_t> bytes;
    if (!unquote_bytes(t.text, bytes)) {
      errs.push_back({at.str(), "Invalid string"});
      return {};
    }
    const bool ok = detail::run_validators(vs_, at, errs, [&bytes](const bytes_validator& bv) {
      return bv.validate_bytes(bytes);
    });
    if (ok) *static_cast<std::vector<std::uint8_t>*>(dest) = std::move(bytes);
    return {};
  }

private:
  std::vector<bytes_validator_ptr> vs_;
};

// The string body copied verbatim, escapes included. For values known to
// hold no escapes, such as base64.
class raw_bytes_schema final : public schema {
public:
  error prepare(const type_desc& t) override {
    if (!t.is_bytes()) return want("[]uint8", t);
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    token t;
    error fatal;
    if (!detail::read_scalar_token(s, t, fatal)) return fatal;
    if (t.type != token_type::string) return detail::wrong_kind(at, s, t, "Must be a string, got value ", errs);

    const std::string_view body = t.text.substr(1, t.text.size() - 2);
    static_cast<std::vector<std::uint8_t>*>(dest)->assign(body.begin(), body.end());
    return {};
  }
};

// Calendar values from strings: "yyyy-mm-dd" for dates,
// "yyyy-mm-ddThh:mm:ss[.fff][Z]" for date-times. Both are read as UTC.
class date_schema final : public schema {
public:
  enum class format { date, date_time };

  date_schema(format f, std::vector<date_validator_ptr> vs) : format_(f), vs_(std::move(vs)) {}

  error prepare(const type_desc& t) override {
    if (t.kind != type_kind::time_point) return want("time_point", t);
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    token t;
    error fatal;
    if (!detail::read_scalar_token(s, t, fatal)) return fatal;
    if (t.type != token_type::string) return detail::wrong_kind(at, s, t, "Must be a string, got value ", errs);

    const std::string_view body = t.text.substr(1, t.text.size() - 2);
    time_point v;
    const bool parsed = format_ == format::date ? detail::parse_date(body, v) : detail::parse_date_time(body, v);
    if (!parsed) {
      errs.push_back({at.str(), format_ == format::date ? "Must be a date in the format yyyy-mm-dd"
                                                        : "Must be a date-time in the format yyyy-mm-ddThh:mm:ss"});
      return {};
    }
    const bool ok = detail::run_validators(vs_, at, errs, [v](const date_validator& dv) {
      return dv.validate_date(v);
    });
    if (ok) *static_cast<time_point*>(dest) = v;
    return {};
  }

private:
  format format_;
  std::vector<date_validator_ptr> vs_;
};

// ---- factories ----

template <class... V>
inline schema_ptr integer(V... vs) {
  return std::make_shared<integer_schema>(std::vector<integer_validator_ptr>{std::move(vs)...});
}

template <class... V>
inline schema_ptr number(V... vs) {
  return std::make_shared<number_schema>(std::vector<float_validator_ptr>{std::move(vs)...});
}

inline schema_ptr boolean() { return std::make_shared<boolean_schema>(); }

template <class... V>
inline schema_ptr string(V... vs) {
  return std::make_shared<string_schema>(std::vector<string_validator_ptr>{std::move(vs)...});
}

template <class... V>
inline schema_ptr bytes(V... vs) {
  return std::make_shared<bytes_schema>(std::vector<bytes_validator_ptr>{std::move(vs)...});
}

inline schema_ptr raw_bytes() { return std::make_shared<raw_bytes_schema>(); }

template <class... V>
inline schema_ptr date(V... vs) {
  return std::make_shared<date_schema>(date_schema::format::date, std::vector<date_validator_ptr>{std::move(vs)...});
}

template <class... V>
inline schema_ptr date_time(V... vs) {
  return std::make_shared<date_schema>(date_schema::format::date_time,
                                       std::vector<date_validator_ptr>{std::move(vs)...});
}

} // namespace jsonv
