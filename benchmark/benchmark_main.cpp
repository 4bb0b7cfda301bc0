#include <jsonv/jsonv.hpp>

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "bench_common.hpp"

namespace {

struct item {
  std::uint64_t id{0};
  bool ok{false};
  std::string name;
  double val{0.0};
};

struct id_only {
  std::uint64_t id{0};
};

} // namespace

namespace jsonv {

template <>
struct describe<item> {
  static constexpr const char* name = "item";
  static void fields(field_list<item>& f) {
    f.field("id", &item::id).field("ok", &item::ok).field("name", &item::name).field("val", &item::val);
  }
};

template <>
struct describe<id_only> {
  static constexpr const char* name = "id_only";
  static void fields(field_list<id_only>& f) { f.field("id", &id_only::id); }
};

} // namespace jsonv

namespace {

using jsonv_bench::bench_result;
using jsonv_bench::do_not_optimize;

jsonv::schema_ptr item_schema(std::size_t max_name) {
  using namespace jsonv;
  return slice(object(prop("id", integer(min_i(0))),
                      prop("ok", boolean()),
                      prop("name", jsonv::string(max_len(static_cast<long long>(max_name)))),
                      prop("val", number())));
}

template <class T>
bench_result bench_decode(const jsonv::validating_parser& p, std::string_view json, std::size_t iters,
                          std::size_t* records = nullptr) {
  std::vector<T> out;
  return jsonv_bench::time_loop(iters, json.size(), [&] {
    const jsonv::parse_result r = p.parse(json, out);
    if (records) *records = r.invalid.size();
    do_not_optimize(r.err.code);
    do_not_optimize(out.size());
  });
}

bench_result bench_decode_stream(const jsonv::validating_parser& p, const std::string& json, std::size_t iters) {
  std::vector<item> out;
  return jsonv_bench::time_loop(iters, json.size(), [&] {
    std::istringstream in(json);
    const jsonv::parse_result r = p.parse(in, out);
    do_not_optimize(r.err.code);
    do_not_optimize(out.size());
  });
}

} // namespace

int main(int argc, char** argv) {
  std::size_t count = 2000;
  std::size_t iters = 200;
  std::size_t runs = 5;
  const std::size_t name_len = 24;

  if (argc >= 2) count = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string payload = jsonv_bench::make_items_payload(count, name_len);
  std::cout << "payload bytes: " << payload.size() << "\n";

  using jsonv::make_parser_or_throw;
  const jsonv::validating_parser valid = make_parser_or_throw<std::vector<item>>(item_schema(name_len + 16));
  // every name breaks the length rule
  const jsonv::validating_parser failing = make_parser_or_throw<std::vector<item>>(item_schema(name_len / 2));
  // every property but "id" goes through skip_value
  const jsonv::validating_parser skipping =
      make_parser_or_throw<std::vector<id_only>>(jsonv::slice(jsonv::object(jsonv::prop("id", jsonv::integer()))));

  {
    std::vector<item> out;
    if (!valid.parse(std::string_view(payload), out).ok()) {
      std::cerr << "payload does not decode\n";
      return 1;
    }
  }

  using jsonv_bench::print_mbps;
  using jsonv_bench::run_median;
  std::size_t records = 0;
  print_mbps("decode(valid)", run_median(runs, [&] { return bench_decode<item>(valid, payload, iters); }));
  print_mbps("decode(failing)", run_median(runs, [&] { return bench_decode<item>(failing, payload, iters, &records); }));
  std::cout << "records per document: " << records << "\n";
  print_mbps("decode(istream)", run_median(runs, [&] { return bench_decode_stream(valid, payload, iters); }));
  print_mbps("decode(skip)", run_median(runs, [&] { return bench_decode<id_only>(skipping, payload, iters); }));

  return 0;
}
