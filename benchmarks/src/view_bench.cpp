/**
 * @file view_bench.cpp
 * @brief Microbenchmark for view build + release and for handing data to jobs.
 *
 * Measures:
 *   1) build + release() cycles, checked vs unchecked
 *   2) build + release_after() cycles drained through the job system
 *   3) one job reading a view vs one job reading a fresh std::vector copy
 *
 * Reports: ops/sec and ns per op.
 */

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <utility>
#include <vector>

#include "pinview/gc/managed_array.hpp"
#include "pinview/jobs/job_system.hpp"
#include "pinview/view/view_builder.hpp"

namespace bench {
using clock = std::chrono::steady_clock;
using ns    = std::chrono::nanoseconds;

struct Result {
  std::string name;          // e.g., "release@checked"
  std::size_t N = 0;         // operations
  double      seconds = 0.0; // wall time
  double      ops_per_s = 0.0;
  double      ns_per_op = 0.0;
};

Result finish(std::string name, std::size_t N, clock::time_point t0, clock::time_point t1) {
  const double seconds = std::chrono::duration_cast<ns>(t1 - t0).count() / 1e9;
  Result r;
  r.name      = std::move(name);
  r.N         = N;
  r.seconds   = seconds;
  r.ops_per_s = (seconds > 0.0) ? (static_cast<double>(N) / seconds) : 0.0;
  r.ns_per_op = (r.ops_per_s > 0.0) ? 1e9 / r.ops_per_s : 0.0;
  return r;
}

pinview::config::RuntimeConfig mode(pinview::config::SafetyMode m) {
  pinview::config::RuntimeConfig cfg;
  cfg.safety = m;
  return cfg;
}

// Returns false (and prints) on the first library error.
template <class E>
bool check(const E& r, const char* what) {
  if (r) return true;
  std::cerr << "view_bench: " << what << " failed: " << pinview::to_string(r.error()) << '\n';
  return false;
}

Result run_sync(pinview::config::SafetyMode m, std::size_t N) {
  pinview::gc::Heap heap;
  pinview::jobs::JobSystem js(1);
  auto obs = pinview::obs::make_counting_observer();
  pinview::view::ViewBuilder builder(heap, js, mode(m), obs.get());
  auto arr = pinview::gc::make_array<float>(heap, 4096);

  const auto t0 = clock::now();
  for (std::size_t i = 0; i < N; ++i) {
    auto v = builder.from_array(arr);
    if (!check(v, "from_array") || !check(v->handle.release(), "release")) break;
  }
  const auto t1 = clock::now();
  return finish(std::string("release@") + (m == pinview::config::SafetyMode::Checked ? "checked" : "unchecked"),
                N, t0, t1);
}

Result run_deferred(std::size_t N, std::size_t workers) {
  pinview::gc::Heap heap;
  pinview::jobs::JobSystem js(workers);
  auto obs = pinview::obs::make_counting_observer();
  pinview::view::ViewBuilder builder(heap, js, pinview::config::Loader::defaults(), obs.get());
  auto arr = pinview::gc::make_array<float>(heap, 4096);

  const auto t0 = clock::now();
  for (std::size_t i = 0; i < N; ++i) {
    auto v = builder.from_array(arr);
    if (!check(v, "from_array")) break;
    auto done = v->handle.release_after(pinview::jobs::JobHandle{});
    if (!check(done, "release_after")) break;
  }
  js.wait_idle();
  const auto t1 = clock::now();
  return finish("release_after@" + std::to_string(workers), N, t0, t1);
}

Result run_handoff(bool copy, std::size_t elements, std::size_t N) {
  pinview::gc::Heap heap;
  pinview::jobs::JobSystem js(1);
  auto obs = pinview::obs::make_counting_observer();
  pinview::view::ViewBuilder builder(heap, js, pinview::config::Loader::defaults(), obs.get());
  auto arr = pinview::gc::make_array<std::uint32_t>(heap, elements);
  for (std::size_t i = 0; i < elements; ++i) arr[i] = static_cast<std::uint32_t>(i);

  volatile std::uint64_t sink = 0;
  const auto t0 = clock::now();
  for (std::size_t i = 0; i < N; ++i) {
    if (copy) {
      std::vector<std::uint32_t> snapshot(arr.data(), arr.data() + arr.length());
      auto h = js.schedule([&sink, s = std::move(snapshot)] {
        sink = std::accumulate(s.begin(), s.end(), std::uint64_t{0});
      });
      if (!check(h, "schedule")) break;
      h->wait();
    } else {
      auto v = builder.from_array(arr);
      if (!check(v, "from_array")) break;
      auto h = js.schedule([&sink, d = v->descriptor] {
        auto s = d.unchecked_span();
        sink = std::accumulate(s.begin(), s.end(), std::uint64_t{0});
      });
      if (!check(h, "schedule")) break;
      auto done = v->handle.release_after(*h);
      if (!check(done, "release_after")) break;
      done->wait();
    }
  }
  const auto t1 = clock::now();
  return finish((copy ? "copy@" : "view@") + std::to_string(elements), N, t0, t1);
}

inline void print(const Result& r) {
  std::cout << std::fixed << std::setprecision(2)
            << std::left << std::setw(22) << r.name
            << "  N=" << std::setw(9) << r.N
            << "  time=" << std::setw(8) << r.seconds << " s"
            << "  ops/s=" << std::setw(12) << r.ops_per_s
            << "  ns/op=" << std::setw(10) << r.ns_per_op
            << '\n';
}

} // namespace bench

int main() {
  using bench::print;

  // Parameters
  constexpr std::size_t N = 200'000;
  const std::vector<std::size_t> sizes = {1'024, 262'144};

  std::cout << "pinview microbenchmark (build/release, deferred release, hand-off)\n";
  std::cout << "----------------------------------------------------------\n";

  print(bench::run_sync(pinview::config::SafetyMode::Checked, N));
  print(bench::run_sync(pinview::config::SafetyMode::Unchecked, N));
  print(bench::run_deferred(N, 1));
  print(bench::run_deferred(N, 4));
  for (auto n : sizes) {
    print(bench::run_handoff(true, n, 2'000));
    print(bench::run_handoff(false, n, 2'000));
  }

  std::cout << std::flush;
  return 0;
}
