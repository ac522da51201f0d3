/**
 * @file  bench/bench_elastic_step.cpp
 * @brief Google Benchmark suite for ElasticSystem<T>::step.
 *
 * Benchmarks
 * ----------
 *   BM_LinearStep/N       scalar step with N snap points
 *   BM_VolumeStep/N       3-D step with N snap points
 *   BM_QuaternionStep     quaternion step, no snap points
 *   BM_Simulate/N         batch simulate() over N frames
 *
 * Build (CMake):
 *   cmake -DELASTIC_BENCH=ON ..
 *   cmake --build build --target bench_elastic_step
 *   ./build/bench_elastic_step --benchmark_format=json
 *
 * Custom counter "Msteps_per_sec" = step throughput / 1e6.
 */

#include "benchmark/benchmark.h"

#include "elastic/elastic_system.hpp"
#include "elastic/trajectory.hpp"

#include <cmath>
#include <cstddef>
#include <vector>

using namespace elastic;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// N snap points spread evenly across [-1, 1].
static std::vector<Scalar> make_snap_points(std::size_t n) {
    std::vector<Scalar> p(n);
    for (std::size_t i = 0; i < n; ++i) {
        p[i] = -1.0f + 2.0f * static_cast<Scalar>(i) / static_cast<Scalar>(n > 1 ? n - 1 : 1);
    }
    return p;
}

static void add_rate_counter(benchmark::State& state) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
    state.counters["Msteps_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) / 1e6,
        benchmark::Counter::kIsRate);
}

// ── Single-step benchmarks ─────────────────────────────────────────────────────

static void BM_LinearStep(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto sys = LinearElasticSystem::create(
        0.0f, 0.0f,
        {.min_stretch = -1.0f, .max_stretch = 1.0f, .snap_to_end = true,
         .snap_points = make_snap_points(n)},
        ElasticProperties{});
    if (!sys) {
        state.SkipWithError("invalid configuration");
        return;
    }
    Scalar phase = 0.0f;
    for (auto _ : state) {
        phase += 0.01f;
        benchmark::DoNotOptimize(sys->step(std::sin(phase), 1.0f / 90.0f));
    }
    add_rate_counter(state);
}
BENCHMARK(BM_LinearStep)->RangeMultiplier(4)->Range(1, 256);

static void BM_VolumeStep(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    std::vector<Vector3> points;
    points.reserve(n);
    for (Scalar s : make_snap_points(n)) {
        points.emplace_back(s, 0.5f * s, 0.0f);
    }
    auto sys = VolumeElasticSystem::create(
        Vector3(0.1f, 0.1f, 0.1f), Vector3::Zero(),
        {.min_stretch = 0.0f, .max_stretch = 1.0f, .snap_points = std::move(points)},
        ElasticProperties{});
    if (!sys) {
        state.SkipWithError("invalid configuration");
        return;
    }
    Scalar phase = 0.0f;
    for (auto _ : state) {
        phase += 0.01f;
        const Vector3 forcing(std::sin(phase), std::cos(phase), 0.0f);
        benchmark::DoNotOptimize(sys->step(forcing, 1.0f / 90.0f));
    }
    add_rate_counter(state);
}
BENCHMARK(BM_VolumeStep)->RangeMultiplier(4)->Range(1, 256);

static void BM_QuaternionStep(benchmark::State& state) {
    auto sys = QuaternionElasticSystem::create(
        Quaternion::Identity(), ValueSpace<Quaternion>::zero(),
        {.min_stretch = 0.0f, .max_stretch = 2.0f}, ElasticProperties{});
    if (!sys) {
        state.SkipWithError("invalid configuration");
        return;
    }
    Scalar angle = 0.0f;
    for (auto _ : state) {
        angle += 0.01f;
        const Quaternion forcing(Eigen::AngleAxis<Scalar>(angle, Vector3::UnitY()));
        benchmark::DoNotOptimize(sys->step(forcing, 1.0f / 90.0f));
    }
    add_rate_counter(state);
}
BENCHMARK(BM_QuaternionStep);

// ── Batch benchmark ────────────────────────────────────────────────────────────

static void BM_Simulate(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    std::vector<Scalar> forcing(n);
    for (std::size_t i = 0; i < n; ++i) {
        forcing[i] = std::sin(static_cast<Scalar>(i) * 0.01f);
    }
    auto sys = LinearElasticSystem::create(
        0.0f, 0.0f, {.min_stretch = -1.0f, .max_stretch = 1.0f}, ElasticProperties{});
    if (!sys) {
        state.SkipWithError("invalid configuration");
        return;
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(sys->reset(0.0f, 0.0f));
        auto samples = simulate(*sys, forcing);
        benchmark::DoNotOptimize(samples);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_Simulate)->RangeMultiplier(8)->Range(64, 32768)->Unit(benchmark::kMicrosecond);
