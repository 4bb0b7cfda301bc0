#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "detail.hpp"
#include "schema.hpp"
#include "unquote.hpp"

namespace jsonv {

// One JSON property of an object schema.
struct property {
  std::string name;
  schema_ptr node;
  boxed def; // empty: no default
};

inline property prop(std::string name, schema_ptr node) { return property{std::move(name), std::move(node), {}}; }

// The default is assigned, unvalidated, when the property is absent. Its
// type must be exactly the field's value type.
inline property prop_with_default(std::string name, schema_ptr node, boxed def) {
  return property{std::move(name), std::move(node), std::move(def)};
}

// Maps a JSON object onto a described struct.
//
// Properties are bound to fields at prepare time (exact name first, then
// ASCII case-insensitive). While parsing, keys are matched the same way;
// unknown keys are skipped. A property whose field is not optional and that
// has no default is required.
class object_schema final : public schema {
public:
  explicit object_schema(std::vector<property> props) : props_(std::move(props)) {}

  error prepare(const type_desc& t) override {
    if (bound_type() == &t) return {};
    if (bound_type()) return bind(t);
    if (t.kind != type_kind::structure) return want("a struct", t);

    const std::vector<field_desc>& fields = t.fields();
    std::vector<binding> bound;
    bound.reserve(props_.size());
    std::string missing;

    for (const property& p : props_) {
      const field_desc* f = find_field(fields, p.name);
      if (!f) {
        if (!missing.empty()) missing += ", ";
        missing += p.name;
        continue;
      }
      if (!p.node) return make_error(error_code::bad_destination, "property " + p.name + " has no schema");

      const type_desc& slot = f->type();
      binding b;
      b.name = p.name;
      b.node = p.node.get();
      b.locate = &f->locate;
      b.slot = &slot;

      if (p.def) {
        const type_desc& vt = slot.value_type();
        if (&p.def.type() != &vt) {
          return make_error(error_code::bad_default,
                            "Default for " + p.name + " is a " + p.def.type().name + ", want " + vt.name);
        }
        if (!vt.copy) {
          return make_error(error_code::bad_default, "Default for " + p.name + ": " + vt.name + " is not copyable");
        }
        b.def = &p.def;
      }
      b.required = slot.kind != type_kind::optional && !b.def;

      if (auto e = detail::prepare_slot(*p.node, slot)) {
        e.message = "property " + p.name + ": " + e.message;
        return e;
      }
      bound.push_back(std::move(b));
    }

    if (!missing.empty()) {
      return make_error(error_code::missing_field, "No field for props: " + missing + " on struct " + t.name);
    }
    bindings_ = std::move(bound);
    return bind(t);
  }

  error parse(const path& at, scanner& s, void* dest, validation_errors& errs) const override {
    enum class state { expect_open, expect_key_or_close, expect_colon, expect_value, expect_comma_or_close, done };

    std::vector<bool> seen(bindings_.size(), false);
    std::string key_scratch;
    std::string key;
    state st = state::expect_open;

    while (st != state::done) {
      switch (st) {
        case state::expect_open: {
          const token t = s.read_token();
          if (t.type != token_type::object_begin) return s.unexpected(t, "'{'");
          st = state::expect_key_or_close;
          break;
        }
        case state::expect_key_or_close: {
          const token t = s.read_token();
          if (t.type == token_type::object_end) {
            st = state::done;
            break;
          }
          if (t.type != token_type::string) return s.unexpected(t, "object property name or '}'");
          std::string_view k;
          if (!unquote(t.text, k, key_scratch)) {
            return make_error(error_code::parse_error, "Invalid object property name", s.consumed());
          }
          // the token text dies with the next read
          key.assign(k.data(), k.size());
          st = state::expect_colon;
          break;
        }
        case state::expect_colon: {
          const token t = s.read_token();
          if (t.type != token_type::prop_sep) return s.unexpected(t, "':'");
          st = state::expect_value;
          break;
        }
        case state::expect_value: {
          const std::size_t i = find_binding(key);
          if (i == npos) {
            if (auto e = s.skip_value()) return e;
          } else {
            const binding& b = bindings_[i];
            const path child = at.prop(b.name);
            if (auto e = detail::parse_slot(*b.node, *b.slot, child, s, (*b.locate)(dest), errs)) return e;
            seen[i] = true;
          }
          st = state::expect_comma_or_close;
          break;
        }
        case state::expect_comma_or_close: {
          const token t = s.read_token();
          if (t.type == token_type::item_sep) {
            st = state::expect_key_or_close;
          } else if (t.type == token_type::object_end) {
            st = state::done;
          } else {
            return s.unexpected(t, "',' or '}'");
          }
          break;
        }
        case state::done:
          break;
      }
    }

    for (std::size_t i = 0; i < bindings_.size(); ++i) {
      if (seen[i]) continue;
      const binding& b = bindings_[i];
      if (b.def) {
        void* field = (*b.locate)(dest);
        void* target = b.slot->kind == type_kind::optional ? b.slot->engage(field) : field;
        b.slot->value_type().copy(target, b.def->get());
      } else if (b.required) {
        errs.push_back({at.prop(b.name).str(), "Is required"});
      }
    }
    return {};
  }

private:
  static constexpr std::size_t npos = static_cast<std::size_t>(-1);

  struct binding {
    std::string name;
    const schema* node{nullptr};
    const std::function<void*(void*)>* locate{nullptr};
    const type_desc* slot{nullptr};
    const boxed* def{nullptr};
    bool required{true};
  };

  static const field_desc* find_field(const std::vector<field_desc>& fields, std::string_view name) {
    const field_desc* folded = nullptr;
    for (const field_desc& f : fields) {
      if (f.name == name) return &f;
      if (!folded && detail::equal_fold(f.name, name)) folded = &f;
    }
    return folded;
  }

  std::size_t find_binding(std::string_view key) const {
    std::size_t folded = npos;
    for (std::size_t i = 0; i < bindings_.size(); ++i) {
      if (bindings_[i].name == key) return i;
      if (folded == npos && detail::equal_fold(bindings_[i].name, key)) folded = i;
    }
    return folded;
  }

  std::vector<property> props_;
  std::vector<binding> bindings_;
};

template <class... P>
inline schema_ptr object(P... props) {
  return std::make_shared<object_schema>(std::vector<property>{std::move(props)...});
}

} // namespace jsonv
