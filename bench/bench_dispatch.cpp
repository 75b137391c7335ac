/**
 * @file  bench/bench_dispatch.cpp
 * @brief Google Benchmark suite for the calculation path.
 *
 * Benchmarks
 * ----------
 *   BM_Solver_<Type>         : raw solver cost per implemented type
 *   BM_Dispatch_CacheHit     : validate + key + cache lookup
 *   BM_Dispatch_CacheMiss    : full path with a cold key every iteration
 *   BM_Handler_Calculate     : JSON decode → dispatch → JSON encode
 *   BM_Cache_PutEvict        : FIFO insert at capacity
 *
 * Build (CMake):
 *   cmake --build build --target bench_dispatch
 *   ./build/bench_dispatch --benchmark_format=json
 *
 * Custom counter "req_per_sec" = handled requests per second.
 */

#include "benchmark/benchmark.h"

#include "efe/http.hpp"
#include "efe/log.hpp"
#include "efe/solvers.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <string>

using namespace efe;

// ── Solvers ────────────────────────────────────────────────────────────────────

static void BM_Solver_Schwarzschild(benchmark::State& state) {
    const SchwarzschildParams p{.mass = 1.0, .radius = 10.0};
    for (auto _ : state) {
        auto r = solvers::solve_schwarzschild(p);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Solver_Schwarzschild);

static void BM_Solver_Kerr(benchmark::State& state) {
    const KerrParams p{.mass = 1.0, .angular_momentum = 0.5, .radius = 10.0};
    for (auto _ : state) {
        auto r = solvers::solve_kerr(p);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Solver_Kerr);

static void BM_Solver_Hawking(benchmark::State& state) {
    const HawkingParams p{.mass = 1.0, .charge = 0.3, .angular_momentum = 0.2};
    for (auto _ : state) {
        auto r = solvers::solve_hawking(p);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_Solver_Hawking);

// ── Dispatcher ─────────────────────────────────────────────────────────────────

static void BM_Dispatch_CacheHit(benchmark::State& state) {
    log::set_level(log::Level::Off);
    cache::FifoResultCache cache;
    dispatch::CalculationDispatcher d(cache);
    const CalculationRequest req{"schwarzschild", {{"mass", 1.0}, {"radius", 10.0}}};
    (void)d.dispatch(req);

    for (auto _ : state) {
        auto out = d.dispatch(req);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Dispatch_CacheHit);

static void BM_Dispatch_CacheMiss(benchmark::State& state) {
    log::set_level(log::Level::Off);
    cache::FifoResultCache cache;
    dispatch::CalculationDispatcher d(cache);
    double radius = 10.0;

    for (auto _ : state) {
        radius += 1e-6;  // new key every iteration
        auto out = d.dispatch({"schwarzschild", {{"mass", 1.0}, {"radius", radius}}});
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Dispatch_CacheMiss);

// ── Request handler ────────────────────────────────────────────────────────────

static void BM_Handler_Calculate(benchmark::State& state) {
    log::set_level(log::Level::Off);
    cache::FifoResultCache cache;
    dispatch::CalculationDispatcher d(cache);
    http::RequestHandler handler(d);
    const std::string body =
        R"({"type":"kerr","inputs":{"mass":1,"angular_momentum":0.5,"radius":10}})";

    for (auto _ : state) {
        auto r = handler.calculate(body);
        benchmark::DoNotOptimize(r.body.data());
    }
    state.counters["req_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()), benchmark::Counter::kIsRate);
}
BENCHMARK(BM_Handler_Calculate)->Unit(benchmark::kMicrosecond);

// ── Cache ──────────────────────────────────────────────────────────────────────

static void BM_Cache_PutEvict(benchmark::State& state) {
    const auto capacity = static_cast<std::size_t>(state.range(0));
    cache::FifoResultCache cache(capacity);
    const auto result = solvers::solve_hawking({.mass = 1.0});
    std::uint64_t i = 0;

    for (auto _ : state) {
        cache.put(fmt::format("k{}", i++), result);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Cache_PutEvict)->Arg(100)->Arg(10000);

BENCHMARK_MAIN();
