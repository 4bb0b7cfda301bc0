#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace jsonv_bench {

template <class T>
inline void do_not_optimize(const T& v) {
#if defined(_MSC_VER)
  volatile const char* p = reinterpret_cast<const char*>(&v);
  (void)p;
#else
  asm volatile("" : : "g"(v) : "memory");
#endif
}

struct bench_result {
  double seconds{0.0};
  std::size_t bytes{0};
};

// Runs `body` `iters` times and reports `bytes` per run.
template <class Fn>
bench_result time_loop(std::size_t iters, std::size_t bytes, Fn&& body) {
  const auto t0 = std::chrono::steady_clock::now();
  for (std::size_t i = 0; i < iters; ++i) body();
  const auto t1 = std::chrono::steady_clock::now();
  return {std::chrono::duration<double>(t1 - t0).count(), bytes * iters};
}

template <class Fn>
bench_result run_median(std::size_t runs, Fn&& fn) {
  if (runs <= 1) return fn();
  std::vector<bench_result> all;
  all.reserve(runs);
  for (std::size_t r = 0; r < runs; ++r) all.push_back(fn());
  const auto mid = all.begin() + static_cast<std::ptrdiff_t>(all.size() / 2);
  std::nth_element(all.begin(), mid, all.end(),
                   [](const bench_result& a, const bench_result& b) { return a.seconds < b.seconds; });
  return *mid;
}

inline void print_mbps(const char* name, const bench_result& r) {
  const double mib = static_cast<double>(r.bytes) / (1024.0 * 1024.0);
  std::cout << name << ": " << (r.seconds > 0.0 ? mib / r.seconds : 0.0) << " MiB/s (" << r.seconds << " s)\n";
}

// An array of {"id","ok","name","val"} records. Every eighth record carries
// an extra "note" object no destination declares, every sixteenth name has
// escapes. Key order rotates so matching cannot rely on position.
inline std::string make_items_payload(std::size_t count, std::size_t name_len) {
  std::mt19937_64 rng(20240611);
  std::uniform_int_distribution<int> letter('a', 'z');

  std::string s;
  s.reserve(count * (name_len + 80));
  s += '[';
  for (std::size_t i = 0; i < count; ++i) {
    if (i) s += ',';

    std::string name;
    for (std::size_t k = 0; k < name_len; ++k) name += static_cast<char>(letter(rng));
    if (i % 16 == 0) name += "\\t\\u00e9";

    const std::string fields[4] = {
        "\"id\":" + std::to_string(i),
        std::string("\"ok\":") + (i % 3 == 0 ? "true" : "false"),
        "\"name\":\"" + name + "\"",
        std::string("\"val\":") + (i % 2 == 0 ? "0.015625" : "-2.5e3"),
    };
    s += '{';
    for (std::size_t f = 0; f < 4; ++f) {
      if (f) s += ',';
      s += fields[(f + i) % 4];
    }
    if (i % 8 == 0) s += ",\"note\":{\"by\":\"bench\",\"seen\":[1,2,3],\"extra\":null}";
    s += '}';
  }
  s += ']';
  return s;
}

// A flat array of doubles with long mantissas and extreme exponents.
inline std::string make_numbers_payload(std::size_t count) {
  static const char* const kValues[] = {"0.1", "-123456.789e-3", "6.02214076e23", "4.9406564584124654e-324",
                                        "1.7976931348623157e308"};
  std::string s;
  s.reserve(count * 16);
  s += '[';
  for (std::size_t i = 0; i < count; ++i) {
    if (i) s += ',';
    s += kValues[i % 5];
  }
  s += ']';
  return s;
}

} // namespace jsonv_bench
