#include "test_common.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace jsonv;

namespace {

// Takes arrays as they come and refuses every other value but null.
struct color {
  int r{0}, g{0}, b{0};
  std::string source;

  bool unmarshal_json(std::string_view raw, std::string& err) {
    source.assign(raw.data(), raw.size());
    if (raw == "null") return true;
    if (raw.size() >= 2 && raw.front() == '[' && raw.back() == ']') return true;
    err = "Must be a color";
    return false;
  }

  bool operator==(const color& o) const { return r == o.r && g == o.g && b == o.b && source == o.source; }
};

struct order {
  std::string status;
  int priority{0};
  std::vector<std::string> labels;
  color tint;
};

} // namespace

namespace jsonv {

template <>
struct describe<order> {
  static constexpr const char* name = "order";
  static void fields(field_list<order>& f) {
    f.field("status", &order::status)
        .field("priority", &order::priority)
        .field("labels", &order::labels)
        .field("tint", &order::tint);
  }
};

} // namespace jsonv

static void test_parse_scalar_root() {
  const validating_parser p = make_parser_or_throw<std::int64_t>(integer());
  JSONV_CHECK(p.bound());
  JSONV_CHECK(p.type() == &type_of<std::int64_t>());
  std::int64_t v = 0;
  jsonv_test::check_ok(p.parse(std::string_view("123"), v));
  JSONV_CHECK(v == 123);
}

static void test_empty_input() {
  const validating_parser p = make_parser_or_throw<int>(integer());
  int v = 5;
  jsonv_test::check_records(p.parse(std::string_view(""), v), {{"/", "Unexpected end of input"}});
  jsonv_test::check_records(p.parse(std::string_view("   "), v), {{"/", "Unexpected end of input"}});
}

static void test_reuse_does_not_leak_state() {
  const validating_parser p =
      make_parser_or_throw<order>(object(prop("status", jsonv::string(min_len(2))), prop("priority", integer())));
  order o;
  const parse_result bad = p.parse(std::string_view(R"({"status": "x"})"), o);
  jsonv_test::check_records(bad, {{"/status", "Must be at least 2 characters long"}, {"/priority", "Is required"}});

  order fresh;
  const parse_result good = p.parse(std::string_view(R"({"status": "open", "priority": 2})"), fresh);
  jsonv_test::check_ok(good);
  JSONV_CHECK(fresh.status == "open" && fresh.priority == 2);

  // the destination is reset before every decode
  o.labels = {"stale"};
  jsonv_test::check_ok(p.parse(std::string_view(R"({"status": "done", "priority": 1})"), o));
  JSONV_CHECK(o.labels.empty());
}

static void test_parser_misuse() {
  {
    const validating_parser unbound;
    JSONV_CHECK(!unbound.bound());
    int v = 0;
    bool threw = false;
    try {
      (void)unbound.parse(std::string_view("1"), v);
    } catch (const std::logic_error&) {
      threw = true;
    }
    JSONV_CHECK(threw);
  }
  {
    const validating_parser p = make_parser_or_throw<int>(integer());
    std::int64_t wrong = 0;
    bool threw = false;
    try {
      (void)p.parse(std::string_view("1"), wrong);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    JSONV_CHECK(threw);
  }
  {
    bool threw = false;
    try {
      (void)make_parser_or_throw<int>(jsonv::string());
    } catch (const prepare_error& e) {
      threw = true;
      JSONV_CHECK(e.err().code == error_code::bad_destination);
      JSONV_CHECK(std::string(e.what()) == "jsonv: bad destination: Want string not int32");
    }
    JSONV_CHECK(threw);
  }
}

static void test_io_error_passes_through() {
  const validating_parser p = make_parser_or_throw<std::vector<int>>(slice(integer(max_i(0))));
  std::vector<int> v;
  jsonv_test::failing_reader r("[1, 2, ", "deadline exceeded");
  const parse_result out = p.parse(r, v);
  jsonv_test::check_err(out.err, error_code::io_error);
  JSONV_CHECK(out.err.message == "deadline exceeded");
  // records gathered before the failure are dropped
  JSONV_CHECK(out.invalid.empty());

  std::ifstream missing("/nonexistent/jsonv/input.json");
  const parse_result from_file = p.parse(missing, v);
  jsonv_test::check_err(from_file.err, error_code::io_error);
  JSONV_CHECK(from_file.err.message == "stream read failed");
}

static void test_trailing_input() {
  {
    const validating_parser p = make_parser_or_throw<int>(integer());
    int v = 0;
    const parse_result r = p.parse(std::string_view("1 2"), v);
    jsonv_test::check_err(r.err, error_code::trailing_characters);
  }
  {
    parser_options opt;
    opt.require_eof = false;
    const validating_parser p = make_parser_or_throw<int>(integer(), opt);
    JSONV_CHECK(!p.options().require_eof);
    int v = 0;
    jsonv_test::check_ok(p.parse(std::string_view("1 garbage"), v));
    JSONV_CHECK(v == 1);
  }
}

static void test_fatal_vs_validation() {
  const validating_parser p = make_parser_or_throw<int>(integer(max_i(1)));
  int v = 0;
  const parse_result invalid = p.parse(std::string_view("2"), v);
  JSONV_CHECK(invalid.is_validation_failure());
  JSONV_CHECK(!invalid.ok());

  // running out of input is reported as a single record, not a fatal error
  jsonv_test::check_records(p.parse(std::string_view("{"), v), {{"/", "Unexpected end of input"}});

  const parse_result syntax = p.parse(std::string_view("-x"), v);
  jsonv_test::check_err(syntax.err, error_code::parse_error);
  JSONV_CHECK(!syntax.is_validation_failure());
}

static void test_chunked_and_stream_input() {
  const validating_parser p = make_parser_or_throw<order>(
      object(prop("status", jsonv::string()), prop("priority", integer()), prop("labels", slice(jsonv::string()))));
  const std::string doc =
      R"({"status": "queued", "priority": 12345, "labels": ["alpha", "beta)" "\xC3\xA9" R"(", "gamma"]})";
  for (std::size_t chunk : {1u, 2u, 5u, 64u}) {
    jsonv_test::chunk_reader r(doc, chunk);
    order o;
    jsonv_test::check_ok(p.parse(r, o));
    JSONV_CHECK(o.status == "queued");
    JSONV_CHECK(o.priority == 12345);
    JSONV_CHECK(o.labels.size() == 3 && o.labels[1] == "beta\xC3\xA9");
  }
  {
    std::istringstream in(doc);
    order o;
    jsonv_test::check_ok(p.parse(in, o));
    JSONV_CHECK(o.labels.back() == "gamma");
  }
  {
    order o;
    parser_options opt;
    opt.scan.read_len = 3;
    const validating_parser small = make_parser_or_throw<order>(
        object(prop("status", jsonv::string()), prop("priority", integer()), prop("labels", slice(jsonv::string()))),
        opt);
    jsonv_test::check_ok(small.parse(std::string_view(doc), o));
    JSONV_CHECK(o.priority == 12345);
  }
}

static void test_make_parser_from_value() {
  const order sample;
  auto r = make_parser(sample, object(prop("priority", integer())));
  JSONV_CHECK(!r.err);
  JSONV_CHECK(r.parser.type() == &type_of<order>());
}

static void test_enumeration() {
  {
    const validating_parser p = make_parser_or_throw<std::string>(enumeration(jsonv::string(), {"open", "closed"}));
    std::string v;
    jsonv_test::check_ok(p.parse(std::string_view(R"("open")"), v));
    JSONV_CHECK(v == "open");
    jsonv_test::check_records(p.parse(std::string_view(R"("pending")"), v), {{"/", "Must be one of: open,closed"}});
  }
  {
    // int members widen to the destination's width
    const validating_parser p = make_parser_or_throw<std::uint8_t>(enumeration(integer(), {1, 2, 3}));
    std::uint8_t v = 0;
    jsonv_test::check_ok(p.parse(std::string_view("2"), v));
    JSONV_CHECK(v == 2);
    jsonv_test::check_records(p.parse(std::string_view("4"), v), {{"/", "Must be one of: 1,2,3"}});
    // the inner node's own record wins; the membership check is skipped
    jsonv_test::check_records(p.parse(std::string_view("300"), v), {{"/", "Must fit in uint8, got value 300"}});
  }
  {
    const validating_parser p = make_parser_or_throw<double>(enumeration(number(), {1, 2}));
    double v = 0;
    jsonv_test::check_ok(p.parse(std::string_view("2.0"), v));
    jsonv_test::check_records(p.parse(std::string_view("2.5"), v), {{"/", "Must be one of: 1,2"}});
  }
  {
    const validating_parser p =
        make_parser_or_throw<order>(object(prop("status", enumeration(jsonv::string(), {"a", "b"}))));
    order o;
    jsonv_test::check_records(p.parse(std::string_view(R"({"status": "c"})"), o), {{"/status", "Must be one of: a,b"}});
  }
  {
    // a member that does not fit the destination
    auto r = make_parser<std::uint8_t>(enumeration(integer(), {1, 256}));
    jsonv_test::check_err(r.err, error_code::bad_default);
  }
  {
    auto r = make_parser<int>(enumeration(integer(), {"1"}));
    jsonv_test::check_err(r.err, error_code::bad_default);
  }
  {
    auto r = make_parser<order>(enumeration(object(prop("priority", integer())), std::vector<boxed>{}));
    jsonv_test::check_err(r.err, error_code::unsupported_type);
    JSONV_CHECK(r.err.message == "Field must be comparable, order is not");
  }
  {
    auto r = make_parser<int>(enumeration(integer(), std::vector<boxed>{boxed(1), boxed()}));
    jsonv_test::check_err(r.err, error_code::bad_default);
    JSONV_CHECK(r.err.message == "Allowed value 1 is empty");
  }
}

static void test_unmarshaler_member() {
  const validating_parser p = make_parser_or_throw<order>(
      object(prop("status", jsonv::string()), prop("tint", unmarshaler())));
  {
    order o;
    jsonv_test::check_ok(p.parse(std::string_view(R"({"status": "s", "tint": [ 1, 2, 3 ]})"), o));
    JSONV_CHECK(o.tint.source == "[1,2,3]");
  }
  {
    order o;
    jsonv_test::check_records(p.parse(std::string_view(R"({"status": "s", "tint": "red"})"), o),
                              {{"/tint", "Must be a color"}});
    JSONV_CHECK(o.tint.source == R"("red")");
  }
  {
    // the destination sees null itself
    order o;
    jsonv_test::check_ok(p.parse(std::string_view(R"({"status": "s", "tint": null})"), o));
    JSONV_CHECK(o.tint.source == "null");
  }
  {
    order o;
    const parse_result r = p.parse(std::string_view(R"({"status": "s", "tint": [1, }"})"), o);
    jsonv_test::check_err(r.err, error_code::parse_error);
  }
  {
    auto r = make_parser<order>(object(prop("status", unmarshaler())));
    jsonv_test::check_err(r.err, error_code::bad_destination);
    JSONV_CHECK(r.err.message == "property status: Must implement the unmarshal capability. string does not.");
  }
  {
    // enumeration over a comparable unmarshal destination
    color red;
    red.source = R"("red")";
    const validating_parser e = make_parser_or_throw<color>(enumeration(unmarshaler(), std::vector<boxed>{red}));
    color c;
    jsonv_test::check_records(e.parse(std::string_view(R"("red")"), c), {{"/", "Must be a color"}});
    jsonv_test::check_records(e.parse(std::string_view("[0]"), c), {{"/", "Must be one of: ?"}});
  }
}

void test_parser() {
  test_parse_scalar_root();
  test_empty_input();
  test_reuse_does_not_leak_state();
  test_parser_misuse();
  test_io_error_passes_through();
  test_trailing_input();
  test_fatal_vs_validation();
  test_chunked_and_stream_input();
  test_make_parser_from_value();
  test_enumeration();
  test_unmarshaler_member();
}
