#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <istream>
#include <string>
#include <string_view>

namespace jsonv {

enum class read_status { ok, eof, error };

struct read_result {
  std::size_t n{0};
  read_status status{read_status::ok};
  // Set for read_status::error.
  std::string message;
};

// Byte source for a scanner. A read may return data together with a terminal
// status; once eof or error is returned the source is not read again.
// Deadlines and cancellation belong to the implementation: they surface as
// read_status::error.
class reader {
public:
  virtual ~reader() = default;
  virtual read_result read(char* buf, std::size_t len) = 0;
};

class string_reader final : public reader {
public:
  explicit string_reader(std::string_view s) noexcept : s_(s) {}

  read_result read(char* buf, std::size_t len) override {
    read_result r;
    const std::size_t n = std::min(len, s_.size() - pos_);
    if (n != 0) std::memcpy(buf, s_.data() + pos_, n);
    pos_ += n;
    r.n = n;
    if (pos_ == s_.size()) r.status = read_status::eof;
    return r;
  }

  // Rewinds to the start, so the same text can be decoded again.
  void reset() noexcept { pos_ = 0; }

private:
  std::string_view s_;
  std::size_t pos_{0};
};

class istream_reader final : public reader {
public:
  explicit istream_reader(std::istream& in) noexcept : in_(&in) {}

  read_result read(char* buf, std::size_t len) override {
    read_result r;
    in_->read(buf, static_cast<std::streamsize>(len));
    r.n = static_cast<std::size_t>(in_->gcount());
    // fail without eof: nothing could be read (a stream that never opened)
    if (in_->bad() || (in_->fail() && !in_->eof())) {
      r.status = read_status::error;
      r.message = "stream read failed";
    } else if (in_->eof()) {
      r.status = read_status::eof;
    }
    return r;
  }

private:
  std::istream* in_;
};

} // namespace jsonv
