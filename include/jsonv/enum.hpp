#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "schema.hpp"

namespace jsonv {

// Restricts another node's result to a fixed set of values. Integer
// members are converted to the destination's numeric type when they fit.
class enum_schema final : public schema {
public:
  enum_schema(schema_ptr inner, std::vector<boxed> values) : inner_(std::move(inner)), values_(std::move(values)) {
    message_ = "Must be one of: ";
    for (std::size_t i = 0; i < values_.size(); ++i) {
      if (i != 0) message_ += ",";
      message_ += values_[i].text();
    }
  }

  error prepare(const type_desc& t) override {
    if (bound_type() == &t) return {};
    if (bound_type()) return bind(t);
    if (!inner_) return make_error(error_code::bad_destination, "enumeration has no value schema");
    if (!t.comparable()) return make_error(error_code::unsupported_type, "Field must be comparable, " + t.name + " is not");

    std::vector<boxed> allowed;
    allowed.reserve(values_.size());
    for (std::size_t i = 0; i < values_.size(); ++i) {
      const boxed& v = values_[i];
      if (!v) return make_error(error_code::bad_default, "Allowed value " + std::to_string(i) + " is empty");
      std::optional<boxed> c = v.as(t, true);
      if (!c) {
        return make_error(error_code::bad_default,
                          "Allowed value " + v.text() + " (" + v.type().name + ") does not convert to " + t.name);
      }
      allowed.push_back(std::move(*c));
    }

    if (auto e = inner_->prepare(t)) return e;
    allowed_ = std::move(allowed);
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    const std::size_t before = errs.size();
    if (auto e = inner_->parse(at, s, dest, errs)) return e;
    // the value was rejected already and may not have been written
    if (errs.size() != before) return {};

    const type_desc& t = *bound_type();
    for (const boxed& v : allowed_) {
      if (t.equal(dest, v.get())) return {};
    }
    errs.push_back({at.str(), message_});
    return {};
  }

  bool accepts_null() const noexcept override { return inner_ && inner_->accepts_null(); }

private:
  schema_ptr inner_;
  std::vector<boxed> values_;
  std::vector<boxed> allowed_;
  std::string message_;
};

inline schema_ptr enumeration(schema_ptr inner, std::vector<boxed> values) {
  return std::make_shared<enum_schema>(std::move(inner), std::move(values));
}

template <class T>
inline schema_ptr enumeration(schema_ptr inner, std::initializer_list<T> values) {
  std::vector<boxed> boxed_values;
  boxed_values.reserve(values.size());
  for (const T& v : values) boxed_values.emplace_back(v);
  return enumeration(std::move(inner), std::move(boxed_values));
}

} // namespace jsonv
