#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "schema.hpp"
#include "validators.hpp"

namespace jsonv {

// A JSON array of same-shaped values into a std::vector. The destination is
// truncated first, so it ends up with exactly the decoded elements.
class slice_schema final : public schema {
public:
  slice_schema(schema_ptr elem, std::vector<slice_validator_ptr> vs) : elem_(std::move(elem)), vs_(std::move(vs)) {}

  error prepare(const type_desc& t) override {
    if (bound_type() == &t) return {};
    if (bound_type()) return bind(t);
    if (t.kind != type_kind::sequence) return want("a slice", t);
    if (!elem_) return make_error(error_code::bad_destination, "slice has no element schema");
    if (auto e = detail::prepare_slot(*elem_, t.elem())) {
      e.message = "slice element: " + e.message;
      return e;
    }
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    const token t = s.read_token();
    if (t.type != token_type::array_begin) return s.unexpected(t, "'['");

    const type_desc& seq = *bound_type();
    const type_desc& elem = seq.elem();
    seq.resize(dest, 0);
    const std::shared_ptr<void> packed = seq.put ? elem.make() : nullptr;

    std::size_t n = 0;
    if (s.peek_token() == token_type::array_end) {
      s.read_token();
    } else {
      for (;;) {
        const std::size_t cap = seq.capacity(dest);
        if (n == cap) seq.reserve(dest, std::max<std::size_t>(4, cap + cap / 2));
        seq.resize(dest, n + 1);

        const path child = at.index(n);
        if (packed) {
          elem.reset(packed.get());
          if (auto e = detail::parse_slot(*elem_, elem, child, s, packed.get(), errs)) return e;
          seq.put(dest, n, packed.get());
        } else {
          if (auto e = detail::parse_slot(*elem_, elem, child, s, seq.at(dest, n), errs)) return e;
        }
        ++n;

        const token sep = s.read_token();
        if (sep.type == token_type::array_end) break;
        if (sep.type != token_type::item_sep) return s.unexpected(sep, "',' or ']'");
      }
    }

    for (const auto& v : vs_) {
      if (auto msg = v->validate_count(n)) errs.push_back({at.str(), std::move(*msg)});
    }
    return {};
  }

private:
  schema_ptr elem_;
  std::vector<slice_validator_ptr> vs_;
};

template <class... V>
inline schema_ptr slice(schema_ptr elem, V... vs) {
  return std::make_shared<slice_schema>(std::move(elem), std::vector<slice_validator_ptr>{std::move(vs)...});
}

} // namespace jsonv
