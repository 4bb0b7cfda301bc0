#include <jsonv/jsonv.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>
#include <nlohmann/json.hpp>
#include <rapidjson/document.h>

#include "bench_common.hpp"

// Each contender turns the same document into std::vector<record> and checks
// the same two rules (id not negative, name at most kMaxName bytes). The DOM
// libraries parse first and map by hand; jsonv decodes directly.

namespace {

constexpr std::size_t kMaxName = 40;

struct record {
  std::uint64_t id{0};
  bool ok{false};
  std::string name;
  double val{0.0};
};

} // namespace

namespace jsonv {

template <>
struct describe<record> {
  static constexpr const char* name = "record";
  static void fields(field_list<record>& f) {
    f.field("id", &record::id).field("ok", &record::ok).field("name", &record::name).field("val", &record::val);
  }
};

} // namespace jsonv

namespace {

using jsonv_bench::bench_result;
using jsonv_bench::do_not_optimize;
using jsonv_bench::time_loop;

[[noreturn]] void reject(const char* who) {
  std::cerr << who << ": payload rejected\n";
  std::exit(1);
}

bench_result jsonv_records(std::string_view json, std::size_t iters) {
  using namespace jsonv;
  const validating_parser p = make_parser_or_throw<std::vector<record>>(
      slice(object(prop("id", integer(min_i(0))), prop("ok", boolean()),
                   prop("name", jsonv::string(max_len(static_cast<long long>(kMaxName)))), prop("val", number()))));
  std::vector<record> out;
  return time_loop(iters, json.size(), [&] {
    if (!p.parse(json, out).ok()) reject("jsonv");
    do_not_optimize(out.size());
  });
}

bench_result jsonv_numbers(std::string_view json, std::size_t iters) {
  const jsonv::validating_parser p = jsonv::make_parser_or_throw<std::vector<double>>(jsonv::slice(jsonv::number()));
  std::vector<double> out;
  return time_loop(iters, json.size(), [&] {
    if (!p.parse(json, out).ok()) reject("jsonv");
    do_not_optimize(out.size());
  });
}

bench_result nlohmann_records(std::string_view json, std::size_t iters) {
  std::vector<record> out;
  return time_loop(iters, json.size(), [&] {
    const nlohmann::json doc = nlohmann::json::parse(json, nullptr, false);
    if (doc.is_discarded() || !doc.is_array()) reject("nlohmann");
    out.clear();
    for (const nlohmann::json& o : doc) {
      const nlohmann::json& id = o.at("id");
      const nlohmann::json& name = o.at("name");
      if (!id.is_number_unsigned()) reject("nlohmann");
      if (!name.is_string() || name.get_ref<const std::string&>().size() > kMaxName) reject("nlohmann");
      out.push_back({id.get<std::uint64_t>(), o.at("ok").get<bool>(), name.get<std::string>(),
                     o.at("val").get<double>()});
    }
    do_not_optimize(out.size());
  });
}

bench_result jsoncpp_records(std::string_view json, std::size_t iters) {
  Json::CharReaderBuilder builder;
  builder["strictRoot"] = true;
  builder["allowComments"] = false;
  const std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  std::vector<record> out;
  return time_loop(iters, json.size(), [&] {
    Json::Value doc;
    std::string errs;
    if (!reader->parse(json.data(), json.data() + json.size(), &doc, &errs) || !doc.isArray()) reject("jsoncpp");
    out.clear();
    for (const Json::Value& o : doc) {
      const Json::Value& id = o["id"];
      const Json::Value& name = o["name"];
      if (!id.isUInt64()) reject("jsoncpp");
      if (!name.isString() || name.asString().size() > kMaxName) reject("jsoncpp");
      out.push_back({id.asUInt64(), o["ok"].asBool(), name.asString(), o["val"].asDouble()});
    }
    do_not_optimize(out.size());
  });
}

bench_result rapidjson_records(std::string_view json, std::size_t iters) {
  std::vector<record> out;
  return time_loop(iters, json.size(), [&] {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError() || !doc.IsArray()) reject("rapidjson");
    out.clear();
    for (const rapidjson::Value& o : doc.GetArray()) {
      const rapidjson::Value& id = o["id"];
      const rapidjson::Value& name = o["name"];
      if (!id.IsUint64()) reject("rapidjson");
      if (!name.IsString() || name.GetStringLength() > kMaxName) reject("rapidjson");
      out.push_back({id.GetUint64(), o["ok"].GetBool(), std::string(name.GetString(), name.GetStringLength()),
                     o["val"].GetDouble()});
    }
    do_not_optimize(out.size());
  });
}

bench_result rapidjson_numbers(std::string_view json, std::size_t iters) {
  std::vector<double> out;
  return time_loop(iters, json.size(), [&] {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError() || !doc.IsArray()) reject("rapidjson");
    out.clear();
    for (const rapidjson::Value& v : doc.GetArray()) out.push_back(v.GetDouble());
    do_not_optimize(out.size());
  });
}

} // namespace

int main(int argc, char** argv) {
  std::size_t count = 2000;
  std::size_t iters = 200;
  std::size_t runs = 5;

  if (argc >= 2) count = static_cast<std::size_t>(std::stoull(argv[1]));
  if (argc >= 3) iters = static_cast<std::size_t>(std::stoull(argv[2]));
  if (argc >= 4) runs = static_cast<std::size_t>(std::stoull(argv[3]));

  const std::string records = jsonv_bench::make_items_payload(count, 24);
  const std::string numbers = jsonv_bench::make_numbers_payload(count * 16);
  std::cout << "records payload bytes: " << records.size() << "\n"
            << "numbers payload bytes: " << numbers.size() << "\n";

  // one pass each so a contender that rejects the payload fails before timing
  jsonv_records(records, 1);
  nlohmann_records(records, 1);
  jsoncpp_records(records, 1);
  rapidjson_records(records, 1);

  using jsonv_bench::print_mbps;
  using jsonv_bench::run_median;

  std::cout << "\n== Records ==\n";
  print_mbps("jsonv", run_median(runs, [&] { return jsonv_records(records, iters); }));
  print_mbps("nlohmann", run_median(runs, [&] { return nlohmann_records(records, iters); }));
  print_mbps("jsoncpp", run_median(runs, [&] { return jsoncpp_records(records, iters); }));
  print_mbps("rapidjson", run_median(runs, [&] { return rapidjson_records(records, iters); }));

  std::cout << "\n== Numbers ==\n";
  print_mbps("jsonv", run_median(runs, [&] { return jsonv_numbers(numbers, iters); }));
  print_mbps("rapidjson", run_median(runs, [&] { return rapidjson_numbers(numbers, iters); }));

  return 0;
}
