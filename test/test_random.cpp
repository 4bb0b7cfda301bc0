#include "test_common.hpp"

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

using namespace jsonv;

namespace {

struct rng {
  std::uint64_t s{0x9E3779B97F4A7C15ull};
  std::uint64_t next_u64() {
    // xorshift64*
    std::uint64_t x = s;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    s = x;
    return x * 2685821657736338717ull;
  }
  std::uint32_t next_u32() { return static_cast<std::uint32_t>(next_u64() >> 32); }
  std::size_t range(std::size_t n) { return n ? static_cast<std::size_t>(next_u64() % n) : 0u; }
  bool coin() { return (next_u64() & 1ull) != 0; }
};

struct record {
  std::string name;
  int count{0};
  double score{0};
  std::vector<std::string> tags;
  std::optional<bool> flag;
};

} // namespace

namespace jsonv {

template <>
struct describe<record> {
  static constexpr const char* name = "record";
  static void fields(field_list<record>& f) {
    f.field("name", &record::name)
        .field("count", &record::count)
        .field("score", &record::score)
        .field("tags", &record::tags)
        .field("flag", &record::flag);
  }
};

} // namespace jsonv

namespace {

std::string random_string(rng& r, std::size_t max_len) {
  const std::size_t len = r.range(max_len + 1);
  std::string out;
  out.reserve(len);
  for (std::size_t i = 0; i < len; ++i) {
    const std::uint32_t pick = r.next_u32() % 16u;
    switch (pick) {
      case 0: out.push_back('\"'); break;
      case 1: out.push_back('\\'); break;
      case 2: out.push_back('\n'); break;
      case 3: out.push_back('\t'); break;
      case 4: out += "\xC3\xA9"; break;
      default: {
        // printable ASCII excluding control chars
        char c = static_cast<char>(' ' + (r.next_u32() % 95u));
        out.push_back(c);
        break;
      }
    }
  }
  return out;
}

void append_quoted(std::string& out, const std::string& s) {
  out.push_back('"');
  for (char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\t': out += "\\u0009"; break;
      default: out.push_back(c); break;
    }
  }
  out.push_back('"');
}

void append_double(std::string& out, double d) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", d);
  out += buf;
}

// Values for keys the schema does not know about.
void append_noise(rng& r, std::string& out, int depth) {
  const std::uint32_t k = r.next_u32() % (depth > 0 ? 6u : 4u);
  switch (k) {
    case 0: out += "null"; break;
    case 1: out += r.coin() ? "true" : "false"; break;
    case 2: append_double(out, static_cast<double>(static_cast<std::int32_t>(r.next_u32())) / 1000.0); break;
    case 3: append_quoted(out, random_string(r, 12)); break;
    case 4: {
      out.push_back('[');
      const std::size_t n = r.range(5);
      for (std::size_t i = 0; i < n; ++i) {
        if (i) out += r.coin() ? "," : " , ";
        append_noise(r, out, depth - 1);
      }
      out.push_back(']');
      break;
    }
    default: {
      out.push_back('{');
      const std::size_t n = r.range(5);
      for (std::size_t i = 0; i < n; ++i) {
        if (i) out += ",";
        append_quoted(out, random_string(r, 6));
        out += ":";
        append_noise(r, out, depth - 1);
      }
      out.push_back('}');
      break;
    }
  }
}

record random_record(rng& r) {
  record rec;
  rec.name = random_string(r, 20);
  rec.count = static_cast<int>(r.range(1400)) - 200;
  rec.score = static_cast<double>(static_cast<std::int32_t>(r.next_u32() % 2000000u) - 1000000) / 1000.0;
  const std::size_t n = r.range(6);
  for (std::size_t i = 0; i < n; ++i) rec.tags.push_back(random_string(r, 8));
  if (r.coin()) rec.flag = r.coin();
  return rec;
}

std::string to_json(rng& r, const record& rec) {
  std::string out = "{";
  auto key = [&out](const char* k) {
    if (out.size() > 1) out += ", ";
    out += "\"";
    out += k;
    out += "\": ";
  };
  auto noise = [&]() {
    if (r.range(3) != 0) return;
    if (out.size() > 1) out += ", ";
    out += "\"x_";
    out += std::to_string(r.range(100));
    out += "\": ";
    append_noise(r, out, 3);
  };

  noise();
  key("name");
  append_quoted(out, rec.name);
  noise();
  key("count");
  out += std::to_string(rec.count);
  key("score");
  append_double(out, rec.score);
  noise();
  key("tags");
  out += "[";
  for (std::size_t i = 0; i < rec.tags.size(); ++i) {
    if (i) out += ",";
    append_quoted(out, rec.tags[i]);
  }
  out += "]";
  if (rec.flag) {
    key("flag");
    out += *rec.flag ? "true" : "false";
  } else if (r.coin()) {
    key("flag");
    out += "null";
  }
  noise();
  out += "}";
  return out;
}

} // namespace

void test_random() {
  rng r;
  const validating_parser p = make_parser_or_throw<record>(object(prop("name", jsonv::string()),
                                                                  prop("count", integer(min_i(0), max_i(1000))),
                                                                  prop("score", number()),
                                                                  prop("tags", slice(jsonv::string(), max_len(4))),
                                                                  prop("flag", boolean())));

  // Deterministic pseudo-fuzz: generate random records, encode them with
  // unknown keys mixed in, decode through small random reads and compare.
  for (int iter = 0; iter < 2000; ++iter) {
    const record want = random_record(r);
    const std::string doc = to_json(r, want);

    parser_options opt;
    opt.scan.read_len = 1 + r.range(64);
    const validating_parser small = make_parser_or_throw<record>(
        object(prop("name", jsonv::string()), prop("count", integer(min_i(0), max_i(1000))), prop("score", number()),
               prop("tags", slice(jsonv::string(), max_len(4))), prop("flag", boolean())),
        opt);

    jsonv_test::chunk_reader cr(doc, 1 + r.range(16));
    record got;
    const parse_result res = (iter % 2 == 0) ? small.parse(cr, got) : p.parse(std::string_view(doc), got);
    JSONV_CHECK(!res.err);

    validation_errors expect;
    if (want.count < 0) expect.push_back({"/count", "Must be greater than or equal to 0"});
    if (want.count > 1000) expect.push_back({"/count", "Must be less than or equal to 1000"});
    if (want.tags.size() > 4) expect.push_back({"/tags", "Must contain no more than 4 items"});
    jsonv_test::check_records(res, expect);

    JSONV_CHECK(got.name == want.name);
    // a rejected value is never written
    const bool count_ok = want.count >= 0 && want.count <= 1000;
    JSONV_CHECK(got.count == (count_ok ? want.count : 0));
    JSONV_CHECK(jsonv_test::nearly_equal(got.score, want.score, 1e-9, 1e-9));
    JSONV_CHECK(got.tags == want.tags);
    JSONV_CHECK(got.flag == want.flag);

    // A strict prefix never decodes: either the input runs out (one record
    // at the root) or it ends inside a number such as "-" or "1e".
    const std::size_t cut = r.range(doc.size());
    const parse_result trunc = p.parse(std::string_view(doc.data(), cut), got);
    JSONV_CHECK(!trunc.ok());
    if (trunc.err) {
      jsonv_test::check_err(trunc.err, error_code::parse_error);
      JSONV_CHECK(trunc.invalid.empty());
    } else {
      jsonv_test::check_records(trunc, {{"/", "Unexpected end of input"}});
    }
  }
}
