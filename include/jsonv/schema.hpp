#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "detail.hpp"
#include "error.hpp"
#include "path.hpp"
#include "scanner.hpp"
#include "type_desc.hpp"

namespace jsonv {

// A node of the schema tree: how one JSON value is decoded, validated and
// written into one destination type.
//
// prepare() binds the node to its destination type and must succeed before
// parse() is called. After that the node is read-only and may be used by
// concurrent parses, each with its own scanner and destination.
class schema {
public:
  virtual ~schema() = default;

  virtual error prepare(const type_desc& t) = 0;

  // Decodes the next value from `s` into `dest`, an object of the prepared
  // type. Rule violations are appended to `errs`; the returned error is
  // fatal and stops the whole decode.
  virtual error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const = 0;

  // Whether a JSON null is handed to parse() instead of being handled by
  // the enclosing slot.
  virtual bool accepts_null() const noexcept { return false; }

  const type_desc* bound_type() const noexcept { return bound_; }

protected:
  // Records the destination type. A node serves a single type; preparing it
  // again for the same type is a no-op.
  error bind(const type_desc& t) {
    if (bound_ && bound_ != &t) {
      return make_error(error_code::bad_destination,
                        "schema node is already bound to " + bound_->name + ", cannot bind it to " + t.name);
    }
    bound_ = &t;
    return {};
  }

  // Error for a destination type the node cannot write into.
  static error want(std::string_view wanted, const type_desc& got) {
    return make_error(error_code::bad_destination, "Want " + std::string(wanted) + " not " + got.name);
  }

private:
  const type_desc* bound_{nullptr};
};

using schema_ptr = std::shared_ptr<schema>;

// A value of any type carried next to its type descriptor: enumeration
// members and property defaults.
class boxed {
public:
  boxed() = default;

  // String-like arguments are stored as std::string.
  template <class T, class U = std::decay_t<T>,
            class = std::enable_if_t<!std::is_same_v<U, boxed>>>
  boxed(T&& v) {
    if constexpr (std::is_convertible_v<U, std::string_view> && !std::is_same_v<U, std::string>) {
      set<std::string>(std::string(std::string_view(v)));
    } else {
      set<U>(U(std::forward<T>(v)));
    }
  }

  explicit operator bool() const noexcept { return type_ != nullptr; }

  const type_desc& type() const noexcept { return *type_; }
  const void* get() const noexcept { return value_.get(); }
  const std::string& text() const noexcept { return text_; }

  // The same value in the destination type `t`. Identical types always
  // match; when `widen` is set integers also convert to other integer
  // widths (if the value fits) and to floating types.
  std::optional<boxed> as(const type_desc& t, bool widen) const {
    if (&t == type_) return *this;
    if (!widen || !int_value_) return std::nullopt;

    std::shared_ptr<void> v = t.make();
    if (t.kind == type_kind::integer) {
      if (!t.store_int(v.get(), *int_value_)) return std::nullopt;
    } else if (t.kind == type_kind::floating) {
      t.store_float(v.get(), static_cast<double>(*int_value_));
    } else {
      return std::nullopt;
    }
    boxed out;
    out.type_ = &t;
    out.value_ = std::move(v);
    out.text_ = text_;
    out.int_value_ = int_value_;
    return out;
  }

private:
  template <class U>
  void set(U v) {
    if constexpr (std::is_integral_v<U> && !std::is_same_v<U, bool>) {
      if constexpr (std::is_signed_v<U> || sizeof(U) < sizeof(std::int64_t)) {
        int_value_ = static_cast<std::int64_t>(v);
      } else if (v <= static_cast<U>(std::numeric_limits<std::int64_t>::max())) {
        int_value_ = static_cast<std::int64_t>(v);
      }
    }
    text_ = detail::to_text(v);
    type_ = &type_of<U>();
    value_ = std::make_shared<const U>(std::move(v));
  }

  const type_desc* type_{nullptr};
  std::shared_ptr<const void> value_;
  std::string text_;
  std::optional<std::int64_t> int_value_;
};

namespace detail {

// Prepares `node` for a destination slot. An optional slot is prepared
// through to its value type; optionals do not nest.
inline error prepare_slot(schema& node, const type_desc& slot) {
  if (slot.kind == type_kind::optional) {
    const type_desc& inner = slot.inner();
    if (inner.kind == type_kind::optional) {
      return make_error(error_code::unsupported_type, "nested optional destination " + slot.name + " is not supported");
    }
    return node.prepare(inner);
  }
  return node.prepare(slot);
}

// Decodes one value into a destination slot. A null resets an optional slot
// and is a rule violation for any other; a non-null value engages an
// optional slot before the node writes through it.
inline error parse_slot(const schema& node, const type_desc& slot, const path& at, scanner& s, void* dest,
                        validation_errors& errs) {
  if (s.peek_token() == token_type::literal_null && !node.accepts_null()) {
    s.read_token();
    if (slot.kind == type_kind::optional) {
      slot.reset(dest);
    } else {
      errs.push_back({at.str(), "Must not be null"});
    }
    return {};
  }
  void* target = slot.kind == type_kind::optional ? slot.engage(dest) : dest;
  return node.parse(at, s, target, errs);
}

// Reads a token that should start a scalar value. Returns true when `t` is
// a well-formed value of some kind; otherwise `fatal` is set.
inline bool read_scalar_token(scanner& s, token& t, error& fatal) {
  t = s.read_token();
  if (is_value_start(t.type)) return true;
  fatal = s.unexpected(t, "a value");
  return false;
}

// A scalar node got a value of the wrong JSON kind: record it and move past
// the value. Containers are skipped to their closing token.
inline error wrong_kind(const path& at, scanner& s, const token& t, std::string_view message_prefix,
                        validation_errors& errs) {
  std::string msg(message_prefix);
  if (t.type == token_type::object_begin || t.type == token_type::array_begin) {
    msg += t.type == token_type::object_begin ? "an object" : "an array";
    errs.push_back({at.str(), std::move(msg)});
    return s.skip_rest(t.type);
  }
  msg.append(t.text.data(), t.text.size());
  errs.push_back({at.str(), std::move(msg)});
  return {};
}

} // namespace detail

} // namespace jsonv
