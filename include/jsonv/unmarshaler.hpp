#pragma once

#include <memory>
#include <string>

#include "schema.hpp"

namespace jsonv {

// Hands the compact text of one complete value to the destination's own
// unmarshal capability (see type_desc.hpp). A refusal is a rule violation at
// the current path. null is passed through like any other value.
class unmarshaler_schema final : public schema {
public:
  error prepare(const type_desc& t) override {
    if (!t.unmarshal) {
      return make_error(error_code::bad_destination,
                        "Must implement the unmarshal capability. " + t.name + " does not.");
    }
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    std::string raw;
    if (auto e = s.read_raw_value(raw)) return e;

    std::string msg;
    if (!bound_type()->unmarshal(dest, raw, msg)) {
      errs.push_back({at.str(), msg.empty() ? std::string("Invalid value") : std::move(msg)});
    }
    return {};
  }

  bool accepts_null() const noexcept override { return true; }
};

inline schema_ptr unmarshaler() { return std::make_shared<unmarshaler_schema>(); }

} // namespace jsonv
