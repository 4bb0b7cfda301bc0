#pragma once

#include <jsonv/jsonv.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonv_test {

[[noreturn]] inline void fail(const char* expr, const char* file, int line, const char* msg = nullptr) {
  std::cerr << "TEST FAILED: " << (expr ? expr : "") << "\n  at " << file << ":" << line;
  if (msg && *msg) std::cerr << "\n  " << msg;
  std::cerr << "\n";
  std::abort();
}

inline void check(bool ok, const char* expr, const char* file, int line) {
  if (!ok) fail(expr, file, line);
}

template <class Fn>
inline void expect_throw(Fn&& fn, const char* expr, const char* file, int line) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  fail(expr, file, line, "expected exception, got none");
}

inline bool nearly_equal(double a, double b, double abs_eps = 1e-12, double rel_eps = 1e-12) {
  const double diff = std::fabs(a - b);
  if (diff <= abs_eps) return true;
  const double aa = std::fabs(a);
  const double bb = std::fabs(b);
  const double m = (aa > bb) ? aa : bb;
  return diff <= rel_eps * m;
}

inline void dump_records(const jsonv::validation_errors& errs) {
  for (const auto& e : errs) std::cerr << "  " << e.path << ": " << e.message << "\n";
}

// Hands out at most `chunk` bytes per read, to push tokens across refills.
class chunk_reader final : public jsonv::reader {
public:
  chunk_reader(std::string_view s, std::size_t chunk) noexcept : s_(s), chunk_(chunk ? chunk : 1) {}

  jsonv::read_result read(char* buf, std::size_t len) override {
    jsonv::read_result r;
    const std::size_t n = std::min({len, chunk_, s_.size() - pos_});
    if (n != 0) std::memcpy(buf, s_.data() + pos_, n);
    pos_ += n;
    r.n = n;
    if (pos_ == s_.size()) r.status = jsonv::read_status::eof;
    ++calls_;
    return r;
  }

  std::size_t calls() const noexcept { return calls_; }

private:
  std::string_view s_;
  std::size_t chunk_;
  std::size_t pos_{0};
  std::size_t calls_{0};
};

// Returns the data, then fails with a transport error instead of eof.
class failing_reader final : public jsonv::reader {
public:
  failing_reader(std::string_view s, std::string message) : s_(s), message_(std::move(message)) {}

  jsonv::read_result read(char* buf, std::size_t len) override {
    jsonv::read_result r;
    const std::size_t n = std::min(len, s_.size() - pos_);
    if (n != 0) std::memcpy(buf, s_.data() + pos_, n);
    pos_ += n;
    r.n = n;
    if (pos_ == s_.size()) {
      r.status = jsonv::read_status::error;
      r.message = message_;
    }
    return r;
  }

private:
  std::string_view s_;
  std::string message_;
  std::size_t pos_{0};
};

// Never produces data and never reports an end.
class stalled_reader final : public jsonv::reader {
public:
  jsonv::read_result read(char*, std::size_t) override { return {}; }
};

} // namespace jsonv_test

#define JSONV_CHECK(expr) ::jsonv_test::check(!!(expr), #expr, __FILE__, __LINE__)
#define JSONV_EXPECT_THROW(expr) ::jsonv_test::expect_throw([&] { (void)(expr); }, #expr, __FILE__, __LINE__)

namespace jsonv_test {

inline void check_err(const jsonv::error& e, jsonv::error_code code) {
  ::jsonv_test::check(static_cast<bool>(e), "static_cast<bool>(e)", __FILE__, __LINE__);
  ::jsonv_test::check(e.code == code, "e.code == code", __FILE__, __LINE__);
}

inline void check_ok(const jsonv::parse_result& r) {
  if (r.ok()) return;
  if (r.err) std::cerr << "fatal: " << jsonv::to_string(r.err.code) << ": " << r.err.message << "\n";
  dump_records(r.invalid);
  fail("r.ok()", __FILE__, __LINE__);
}

inline void check_records(const jsonv::parse_result& r, const jsonv::validation_errors& want) {
  if (!r.err && r.invalid == want) return;
  std::cerr << "want:\n";
  dump_records(want);
  std::cerr << "got:\n";
  if (r.err) std::cerr << "  fatal: " << r.err.message << "\n";
  dump_records(r.invalid);
  fail("r.invalid == want", __FILE__, __LINE__);
}

} // namespace jsonv_test
