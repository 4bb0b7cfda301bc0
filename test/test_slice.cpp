#include "test_common.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace jsonv;

namespace {

struct point {
  int x{0};
  int y{0};
};

struct switches {
  std::vector<bool> on;
};

} // namespace

namespace jsonv {

template <>
struct describe<point> {
  static constexpr const char* name = "point";
  static void fields(field_list<point>& f) { f.field("x", &point::x).field("y", &point::y); }
};

template <>
struct describe<switches> {
  static constexpr const char* name = "switches";
  static void fields(field_list<switches>& f) { f.field("on", &switches::on); }
};

} // namespace jsonv

static void test_slice_element_path() {
  const validating_parser p = make_parser_or_throw<std::vector<int>>(slice(integer(max_i(5))));
  std::vector<int> v;
  jsonv_test::check_records(p.parse(std::string_view("[1,7,3]"), v), {{"/1/", "Must be less than or equal to 5"}});
  // the rejected element keeps its zero value
  JSONV_CHECK(v == std::vector<int>({1, 0, 3}));
}

static void test_slice_truncates() {
  const validating_parser p = make_parser_or_throw<std::vector<int>>(slice(integer()));
  std::vector<int> v = {9, 9, 9, 9, 9};
  jsonv_test::check_ok(p.parse(std::string_view("[1, 2]"), v));
  JSONV_CHECK(v == std::vector<int>({1, 2}));

  jsonv_test::check_ok(p.parse(std::string_view("[ ]"), v));
  JSONV_CHECK(v.empty());
}

static void test_slice_grows() {
  const validating_parser p = make_parser_or_throw<std::vector<int>>(slice(integer()));
  std::string doc = "[";
  for (int i = 0; i < 1000; ++i) {
    if (i) doc += ", ";
    doc += std::to_string(i);
  }
  doc += "]";
  std::vector<int> v;
  jsonv_test::check_ok(p.parse(std::string_view(doc), v));
  JSONV_CHECK(v.size() == 1000);
  JSONV_CHECK(v.front() == 0 && v.back() == 999);
}

static void test_slice_count_validators() {
  const validating_parser p =
      make_parser_or_throw<std::vector<std::string>>(slice(jsonv::string(), min_len(1), max_len(2)));
  std::vector<std::string> v;
  jsonv_test::check_records(p.parse(std::string_view("[]"), v), {{"/", "Must contain at least 1 items"}});
  jsonv_test::check_records(p.parse(std::string_view(R"(["a", "b", "c"])"), v),
                            {{"/", "Must contain no more than 2 items"}});
  // element records come before the count record
  jsonv_test::check_records(p.parse(std::string_view(R"(["a", 1, "c"])"), v),
                            {{"/1/", "Must be a string, got value 1"}, {"/", "Must contain no more than 2 items"}});
}

static void test_slice_of_structs() {
  const validating_parser p =
      make_parser_or_throw<std::vector<point>>(slice(object(prop("x", integer(min_i(0))), prop("y", integer()))));
  std::vector<point> v;
  jsonv_test::check_records(p.parse(std::string_view(R"([{"x": 1, "y": 2}, {"x": -1}, {"y": 0, "x": 0}])"), v),
                            {{"/1/x", "Must be greater than or equal to 0"}, {"/1/y", "Is required"}});
  JSONV_CHECK(v.size() == 3);
  JSONV_CHECK(v[0].x == 1 && v[0].y == 2);
}

static void test_nested_slices() {
  const validating_parser p = make_parser_or_throw<std::vector<std::vector<int>>>(slice(slice(integer(max_i(3)))));
  std::vector<std::vector<int>> v;
  jsonv_test::check_records(p.parse(std::string_view("[[1], [], [2, 4]]"), v), {{"/2/1/", "Must be less than or equal to 3"}});
  JSONV_CHECK(v.size() == 3 && v[1].empty() && v[2].size() == 2);
}

static void test_slice_optional_elements() {
  const validating_parser p = make_parser_or_throw<std::vector<std::optional<int>>>(slice(integer()));
  std::vector<std::optional<int>> v;
  jsonv_test::check_ok(p.parse(std::string_view("[1, null, 3]"), v));
  JSONV_CHECK(v.size() == 3 && v[0] == 1 && !v[1] && v[2] == 3);
}

static void test_slice_structural_errors() {
  const validating_parser p = make_parser_or_throw<std::vector<int>>(slice(integer()));
  std::vector<int> v;
  {
    const parse_result r = p.parse(std::string_view("[1 2]"), v);
    jsonv_test::check_err(r.err, error_code::parse_error);
    JSONV_CHECK(r.err.message == "Expected ',' or ']' not number");
  }
  {
    const parse_result r = p.parse(std::string_view(R"({"a": 1})"), v);
    jsonv_test::check_err(r.err, error_code::parse_error);
    JSONV_CHECK(r.err.message == "Expected '[' not {");
  }
  {
    const parse_result r = p.parse(std::string_view("[1,]"), v);
    jsonv_test::check_err(r.err, error_code::parse_error);
  }
  {
    // cut off: one record at the root, nothing else
    jsonv_test::check_records(p.parse(std::string_view("[1, 2"), v), {{"/", "Unexpected end of input"}});
  }
}

static void test_slice_of_bools() {
  const validating_parser p = make_parser_or_throw<std::vector<bool>>(slice(boolean(), max_len(3)));
  std::vector<bool> v = {false, false, false, false, false};
  jsonv_test::check_ok(p.parse(std::string_view("[true, false, true]"), v));
  JSONV_CHECK(v == std::vector<bool>({true, false, true}));

  jsonv_test::check_records(p.parse(std::string_view("[true, null, 1]"), v),
                            {{"/1/", "Must not be null"}, {"/2/", "Must be a boolean, got value 1"}});
  JSONV_CHECK(v == std::vector<bool>({true, false, false}));

  jsonv_test::check_records(p.parse(std::string_view("[true, true, true, true]"), v),
                            {{"/", "Must contain no more than 3 items"}});
  JSONV_CHECK(v.size() == 4);

  jsonv_test::check_ok(p.parse(std::string_view("[]"), v));
  JSONV_CHECK(v.empty());

  const validating_parser q = make_parser_or_throw<switches>(object(prop("on", slice(boolean()))));
  switches sw;
  jsonv_test::check_ok(q.parse(std::string_view(R"({"on": [false, true]})"), sw));
  JSONV_CHECK(sw.on == std::vector<bool>({false, true}));
}

static void test_slice_prepare_errors() {
  {
    auto r = make_parser<std::string>(slice(integer()));
    jsonv_test::check_err(r.err, error_code::bad_destination);
    JSONV_CHECK(r.err.message == "Want a slice not string");
  }
  {
    auto r = make_parser<std::vector<std::string>>(slice(integer()));
    jsonv_test::check_err(r.err, error_code::bad_destination);
    JSONV_CHECK(r.err.message == "slice element: Want an integer type not string");
  }
  {
    auto r = make_parser<std::vector<int>>(slice(nullptr));
    jsonv_test::check_err(r.err, error_code::bad_destination);
  }
}

void test_slice() {
  test_slice_element_path();
  test_slice_truncates();
  test_slice_grows();
  test_slice_count_validators();
  test_slice_of_structs();
  test_nested_slices();
  test_slice_optional_elements();
  test_slice_structural_errors();
  test_slice_of_bools();
  test_slice_prepare_errors();
}
