#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace jsonv {

// Destination shapes the schema nodes know how to write into.
enum class type_kind {
  boolean,
  integer,
  floating,
  string,
  time_point,
  structure,
  sequence,
  optional,
  other
};

using time_point = std::chrono::system_clock::time_point;

struct type_desc;
using type_fn = const type_desc& (*)();

// One addressable member of a described struct, as seen after flattening
// embedded structs.
struct field_desc {
  std::string name; // JSON name: the tag when there is one
  bool tagged{false};
  std::size_t depth{0};
  std::function<void*(void*)> locate; // struct address -> member address
  type_fn type{nullptr};
};

// Runtime description of a destination type. One instance exists per type
// (see type_of); identity comparison is by address.
//
// Operations that do not apply to a kind are null.
struct type_desc {
  type_kind kind{type_kind::other};
  std::string name;

  // integer and floating
  std::size_t bits{0};
  bool is_signed{false};

  // Every type.
  std::shared_ptr<void> (*make)(){nullptr};
  void (*reset)(void* dst){nullptr};
  // Copy-assigns; null when the type is not copyable.
  bool (*copy)(void* dst, const void* src){nullptr};
  // Structural equality; null when the type has no operator==.
  bool (*equal)(const void* a, const void* b){nullptr};

  // integer: false when the value does not fit the width.
  bool (*store_int)(void* dst, std::int64_t v){nullptr};
  // floating
  void (*store_float)(void* dst, double v){nullptr};

  // sequence
  type_fn elem{nullptr};
  std::size_t (*size)(const void* seq){nullptr};
  std::size_t (*capacity)(const void* seq){nullptr};
  void (*reserve)(void* seq, std::size_t n){nullptr};
  void (*resize)(void* seq, std::size_t n){nullptr};
  void* (*at)(void* seq, std::size_t i){nullptr};
  // Set instead of at for packed sequences (std::vector<bool>): the element
  // is decoded into a temporary and written by value.
  void (*put)(void* seq, std::size_t i, const void* v){nullptr};

  // optional
  type_fn inner{nullptr};
  void* (*engage)(void* opt){nullptr};
  const void* (*get)(const void* opt){nullptr};

  // structure
  const std::vector<field_desc>& (*fields)(){nullptr};

  // Present for any type with an unmarshal capability, whatever its kind.
  bool (*unmarshal)(void* dst, std::string_view raw, std::string& err){nullptr};

  bool is_bytes() const noexcept {
    return kind == type_kind::sequence && elem().kind == type_kind::integer && elem().bits == 8 && !elem().is_signed;
  }

  // The type an allowed value or a default is given in.
  const type_desc& value_type() const noexcept { return kind == type_kind::optional ? inner() : *this; }

  bool comparable() const noexcept {
    if (kind == type_kind::sequence) return elem().comparable();
    if (kind == type_kind::optional) return inner().comparable();
    return equal != nullptr;
  }
};

// Specialize to describe a struct destination:
//
//   template <> struct jsonv::describe<user> {
//     static constexpr const char* name = "user";  // optional
//     static void fields(jsonv::field_list<user>& f) {
//       f.field("Name", &user::name).field("Age", &user::age, "age").embed(&user::audit);
//     }
//   };
template <class T>
struct describe;

// Specialize to give a type the unmarshal capability without touching it:
//   static bool unmarshal(T& dst, std::string_view raw_json, std::string& err);
template <class T>
struct json_unmarshaler;

template <class T>
const type_desc& type_of();

namespace detail {

template <class T, class = void>
struct is_described : std::false_type {};
template <class T>
struct is_described<T, std::void_t<decltype(&describe<T>::fields)>> : std::true_type {};

template <class T, class = void>
struct has_describe_name : std::false_type {};
template <class T>
struct has_describe_name<T, std::void_t<decltype(describe<T>::name)>> : std::true_type {};

template <class T, class = void>
struct has_unmarshaler_trait : std::false_type {};
template <class T>
struct has_unmarshaler_trait<T, std::void_t<decltype(json_unmarshaler<T>::unmarshal(
                                    std::declval<T&>(), std::string_view{}, std::declval<std::string&>()))>>
    : std::true_type {};

template <class T, class = void>
struct has_unmarshal_member : std::false_type {};
template <class T>
struct has_unmarshal_member<T, std::void_t<decltype(std::declval<T&>().unmarshal_json(
                                   std::string_view{}, std::declval<std::string&>()))>> : std::true_type {};

template <class T, class = void>
struct is_equality_comparable : std::false_type {};
template <class T>
struct is_equality_comparable<T, std::void_t<decltype(std::declval<const T&>() == std::declval<const T&>())>>
    : std::true_type {};

template <class T>
struct is_vector : std::false_type {};
template <class E, class A>
struct is_vector<std::vector<E, A>> : std::true_type {};

template <class T>
struct is_std_optional : std::false_type {};
template <class V>
struct is_std_optional<std::optional<V>> : std::true_type {};

template <class T>
struct is_unique_ptr : std::false_type {};
template <class V>
struct is_unique_ptr<std::unique_ptr<V>> : std::true_type {};

template <class T>
inline std::string struct_name() {
  if constexpr (has_describe_name<T>::value) {
    return describe<T>::name;
  } else {
    return "struct";
  }
}

template <class T>
class field_collector;

} // namespace detail

// Builder handed to describe<T>::fields.
template <class T>
class field_list {
public:
  // `tag` replaces `name` as the JSON name and wins name conflicts at the
  // same depth. A tag of "-" hides the member.
  template <class M>
  field_list& field(std::string_view name, M T::*member, std::string_view tag = {}) {
    if (tag == "-") return *this;
    field_desc f;
    f.tagged = !tag.empty();
    f.name = std::string(f.tagged ? tag : name);
    f.depth = 0;
    f.locate = [member](void* p) -> void* { return &(static_cast<T*>(p)->*member); };
    f.type = &type_of<M>;
    out_.push_back(std::move(f));
    return *this;
  }

  // Promotes the members of an embedded described struct one level deeper.
  template <class M>
  field_list& embed(M T::*member) {
    static_assert(detail::is_described<M>::value, "jsonv: embed() needs a described struct member");
    field_list<M> inner;
    describe<M>::fields(inner);
    for (field_desc& f : inner.out_) {
      field_desc g;
      g.name = std::move(f.name);
      g.tagged = f.tagged;
      g.depth = f.depth + 1;
      auto inner_locate = std::move(f.locate);
      g.locate = [member, inner_locate](void* p) -> void* { return inner_locate(&(static_cast<T*>(p)->*member)); };
      g.type = f.type;
      out_.push_back(std::move(g));
    }
    return *this;
  }

private:
  template <class U>
  friend class field_list;
  friend class detail::field_collector<T>;

  std::vector<field_desc> out_;
};

namespace detail {

// Keeps one field per JSON name: the shallowest wins, a tagged field beats
// untagged ones at the same depth, anything still tied is dropped.
inline std::vector<field_desc> resolve_fields(std::vector<field_desc> all) {
  std::vector<field_desc> out;
  std::vector<bool> taken(all.size(), false);
  for (std::size_t i = 0; i < all.size(); ++i) {
    if (taken[i]) continue;

    std::size_t best_depth = all[i].depth;
    for (std::size_t j = i; j < all.size(); ++j) {
      if (all[j].name == all[i].name && all[j].depth < best_depth) best_depth = all[j].depth;
    }

    std::size_t tagged = 0;
    std::size_t untagged = 0;
    std::size_t pick_tagged = 0;
    std::size_t pick_untagged = 0;
    for (std::size_t j = i; j < all.size(); ++j) {
      if (all[j].name != all[i].name) continue;
      taken[j] = true;
      if (all[j].depth != best_depth) continue;
      if (all[j].tagged) {
        if (tagged++ == 0) pick_tagged = j;
      } else {
        if (untagged++ == 0) pick_untagged = j;
      }
    }

    if (tagged == 1) {
      out.push_back(std::move(all[pick_tagged]));
    } else if (tagged == 0 && untagged == 1) {
      out.push_back(std::move(all[pick_untagged]));
    }
  }
  return out;
}

template <class T>
class field_collector {
public:
  static const std::vector<field_desc>& fields() {
    static const std::vector<field_desc> resolved = [] {
      field_list<T> list;
      describe<T>::fields(list);
      return resolve_fields(std::move(list.out_));
    }();
    return resolved;
  }
};

template <class T>
inline bool store_int(void* dst, std::int64_t v) {
  using limits = std::numeric_limits<T>;
  if constexpr (std::is_signed_v<T>) {
    if (v < static_cast<std::int64_t>(limits::min()) || v > static_cast<std::int64_t>(limits::max())) return false;
  } else {
    if (v < 0) return false;
    if (static_cast<std::uint64_t>(v) > static_cast<std::uint64_t>(limits::max())) return false;
  }
  *static_cast<T*>(dst) = static_cast<T>(v);
  return true;
}

inline std::string integer_name(std::size_t bits, bool is_signed) {
  return std::string(is_signed ? "int" : "uint") + std::to_string(bits);
}

template <class T>
inline type_desc make_type_desc() {
  type_desc d;
  d.make = [] { return std::shared_ptr<void>(std::make_shared<T>()); };
  d.reset = [](void* p) { *static_cast<T*>(p) = T{}; };

  if constexpr (std::is_copy_assignable_v<T> && !is_vector<T>::value) {
    d.copy = [](void* dst, const void* src) {
      *static_cast<T*>(dst) = *static_cast<const T*>(src);
      return true;
    };
  }

  if constexpr (std::is_same_v<T, bool>) {
    d.kind = type_kind::boolean;
    d.name = "bool";
  } else if constexpr (std::is_integral_v<T>) {
    d.kind = type_kind::integer;
    d.bits = sizeof(T) * 8;
    d.is_signed = std::is_signed_v<T>;
    d.name = integer_name(d.bits, d.is_signed);
    d.store_int = &store_int<T>;
  } else if constexpr (std::is_floating_point_v<T>) {
    d.kind = type_kind::floating;
    d.bits = sizeof(T) * 8;
    d.name = sizeof(T) == sizeof(float) ? "float" : sizeof(T) == sizeof(double) ? "double" : "long double";
    d.store_float = [](void* p, double v) { *static_cast<T*>(p) = static_cast<T>(v); };
  } else if constexpr (std::is_same_v<T, std::string>) {
    d.kind = type_kind::string;
    d.name = "string";
  } else if constexpr (std::is_same_v<T, time_point>) {
    d.kind = type_kind::time_point;
    d.name = "time_point";
  } else if constexpr (is_vector<T>::value) {
    using E = typename T::value_type;
    d.kind = type_kind::sequence;
    d.name = "[]" + type_of<E>().name;
    d.elem = &type_of<E>;
    d.size = [](const void* p) { return static_cast<const T*>(p)->size(); };
    d.capacity = [](const void* p) { return static_cast<const T*>(p)->capacity(); };
    d.reserve = [](void* p, std::size_t n) { static_cast<T*>(p)->reserve(n); };
    d.resize = [](void* p, std::size_t n) { static_cast<T*>(p)->resize(n); };
    if constexpr (std::is_same_v<E, bool>) {
      d.put = [](void* p, std::size_t i, const void* v) { (*static_cast<T*>(p))[i] = *static_cast<const bool*>(v); };
      d.copy = [](void* dst, const void* src) {
        *static_cast<T*>(dst) = *static_cast<const T*>(src);
        return true;
      };
      d.equal = [](const void* a, const void* b) { return *static_cast<const T*>(a) == *static_cast<const T*>(b); };
    } else {
      d.at = [](void* p, std::size_t i) -> void* { return &(*static_cast<T*>(p))[i]; };
      d.copy = [](void* dst, const void* src) {
        const type_desc& e = type_of<E>();
        if (!e.copy) return false;
        auto* out = static_cast<T*>(dst);
        const auto* in = static_cast<const T*>(src);
        out->clear();
        out->resize(in->size());
        for (std::size_t i = 0; i < in->size(); ++i) {
          if (!e.copy(&(*out)[i], &(*in)[i])) return false;
        }
        return true;
      };
      d.equal = [](const void* a, const void* b) {
        const type_desc& e = type_of<E>();
        const auto* x = static_cast<const T*>(a);
        const auto* y = static_cast<const T*>(b);
        if (!e.equal || x->size() != y->size()) return false;
        for (std::size_t i = 0; i < x->size(); ++i) {
          if (!e.equal(&(*x)[i], &(*y)[i])) return false;
        }
        return true;
      };
    }
  } else if constexpr (is_std_optional<T>::value) {
    using V = typename T::value_type;
    d.kind = type_kind::optional;
    d.name = "optional<" + type_of<V>().name + ">";
    d.inner = &type_of<V>;
    d.engage = [](void* p) -> void* {
      auto* o = static_cast<T*>(p);
      if (!o->has_value()) o->emplace();
      return &**o;
    };
    d.get = [](const void* p) -> const void* {
      const auto* o = static_cast<const T*>(p);
      return o->has_value() ? &**o : nullptr;
    };
  } else if constexpr (is_unique_ptr<T>::value) {
    using V = typename T::element_type;
    d.kind = type_kind::optional;
    d.name = "*" + type_of<V>().name;
    d.inner = &type_of<V>;
    d.engage = [](void* p) -> void* {
      auto* o = static_cast<T*>(p);
      if (!*o) *o = std::make_unique<V>();
      return o->get();
    };
    d.get = [](const void* p) -> const void* { return static_cast<const T*>(p)->get(); };
  } else if constexpr (is_described<T>::value) {
    d.kind = type_kind::structure;
    d.name = struct_name<T>();
    d.fields = &field_collector<T>::fields;
  } else {
    d.kind = type_kind::other;
    d.name = (has_unmarshaler_trait<T>::value || has_unmarshal_member<T>::value) ? "unmarshaler" : "unsupported type";
  }

  if constexpr (is_std_optional<T>::value || is_unique_ptr<T>::value) {
    d.equal = [](const void* a, const void* b) {
      const type_desc& self = type_of<T>();
      const void* x = self.get(a);
      const void* y = self.get(b);
      if (!x || !y) return x == y;
      return self.inner().equal != nullptr && self.inner().equal(x, y);
    };
  } else if constexpr (!is_vector<T>::value && is_equality_comparable<T>::value) {
    d.equal = [](const void* a, const void* b) { return *static_cast<const T*>(a) == *static_cast<const T*>(b); };
  }

  if constexpr (has_unmarshaler_trait<T>::value) {
    d.unmarshal = [](void* p, std::string_view raw, std::string& err) {
      return json_unmarshaler<T>::unmarshal(*static_cast<T*>(p), raw, err);
    };
  } else if constexpr (has_unmarshal_member<T>::value) {
    d.unmarshal = [](void* p, std::string_view raw, std::string& err) {
      return static_cast<bool>(static_cast<T*>(p)->unmarshal_json(raw, err));
    };
  }
  return d;
}

} // namespace detail

// The descriptor for T, built on first use.
template <class T>
const type_desc& type_of() {
  static const type_desc desc = detail::make_type_desc<T>();
  return desc;
}

} // namespace jsonv
