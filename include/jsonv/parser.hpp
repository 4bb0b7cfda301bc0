#pragma once

#include <istream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "error.hpp"
#include "logging.hpp"
#include "path.hpp"
#include "reader.hpp"
#include "scanner.hpp"
#include "schema.hpp"
#include "type_desc.hpp"

namespace jsonv {

struct parser_options {
  scanner_options scan{};
  // Reject anything but whitespace after the root value.
  bool require_eof{true};
};

// A schema bound to one destination type, reusable for any number of
// documents. Instances are cheap to copy and safe to share between threads
// once built; each parse call uses its own scanner.
class validating_parser {
public:
  // Unbound: parse() throws std::logic_error.
  validating_parser() = default;

  bool bound() const noexcept { return root_ != nullptr; }
  const type_desc* type() const noexcept { return type_; }
  const parser_options& options() const noexcept { return opt_; }

  // Decodes one document into `dest`, which is reset to T{} first. T must
  // be the type the parser was built for (std::invalid_argument otherwise).
  template <class T>
  parse_result parse(reader& r, T& dest) const {
    return parse(r, &dest, type_of<T>());
  }

  template <class T>
  parse_result parse(std::string_view json, T& dest) const {
    string_reader r(json);
    return parse(r, &dest, type_of<T>());
  }

  template <class T>
  parse_result parse(std::istream& in, T& dest) const {
    istream_reader r(in);
    return parse(r, &dest, type_of<T>());
  }

  parse_result parse(reader& r, void* dest, const type_desc& t) const {
    if (!root_) throw std::logic_error("jsonv: parser is not bound to a schema");
    if (&t != type_) throw std::invalid_argument("jsonv: parser is bound to " + type_->name + ", not " + t.name);

    type_->reset(dest);

    scanner s(r, opt_.scan);
    parse_result out;
    const path root;
    error e = detail::parse_slot(*root_, *type_, root, s, dest, out.invalid);
    if (!e && opt_.require_eof) e = s.expect_end();
    if (!e) return out;

    JSONV_DEBUG("decode into {} aborted at byte {}: {}: {}", type_->name, e.offset, to_string(e.code), e.message);
    if (e.code == error_code::end_of_input) {
      out.invalid.assign(1, invalid_data{root.str(), "Unexpected end of input"});
      return out;
    }
    out.invalid.clear();
    out.err = std::move(e);
    return out;
  }

private:
  template <class T>
  friend struct parser_builder;

  validating_parser(schema_ptr root, const type_desc& t, parser_options opt)
      : root_(std::move(root)), type_(&t), opt_(opt) {}

  schema_ptr root_;
  const type_desc* type_{nullptr};
  parser_options opt_;
};

struct make_parser_result {
  validating_parser parser;
  error err;
};

template <class T>
struct parser_builder {
  static make_parser_result build(schema_ptr root, parser_options opt) {
    const type_desc& t = type_of<T>();
    make_parser_result out;
    if (!root) {
      out.err = make_error(error_code::bad_destination, "no root schema");
    } else {
      out.err = detail::prepare_slot(*root, t);
    }
    if (out.err) {
      JSONV_WARN("cannot bind schema to {}: {}", t.name, out.err.message);
      return out;
    }
    JSONV_DEBUG("parser bound to {}", t.name);
    out.parser = validating_parser(std::move(root), t, opt);
    return out;
  }
};

// Binds `root` to destination type T, preparing every node once.
template <class T>
make_parser_result make_parser(schema_ptr root, parser_options opt = {}) {
  return parser_builder<T>::build(std::move(root), opt);
}

// Same, with T taken from a template value.
template <class T>
make_parser_result make_parser(const T&, schema_ptr root, parser_options opt = {}) {
  return parser_builder<T>::build(std::move(root), opt);
}

// Throws prepare_error when the schema does not fit T.
template <class T>
validating_parser make_parser_or_throw(schema_ptr root, parser_options opt = {}) {
  make_parser_result r = parser_builder<T>::build(std::move(root), opt);
  if (r.err) throw prepare_error(std::move(r.err));
  return std::move(r.parser);
}

} // namespace jsonv
