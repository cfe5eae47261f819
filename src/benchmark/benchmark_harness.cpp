/**
 * @file benchmark_harness.cpp
 * @brief Warmup and adaptive iteration sampling
 *
 * @date 2025
 */

#include "algoscope/benchmark/benchmark_harness.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace algoscope {
namespace benchmark {

namespace {

using Clock = std::chrono::steady_clock;

void CheckCancellation(Clock::time_point deadline, const CancellationToken* cancel) {
    if (cancel != nullptr && cancel->IsCancelled()) {
        throw BenchmarkCancelled("Benchmark cancelled");
    }
    if (Clock::now() >= deadline) {
        throw BenchmarkCancelled("Benchmark exceeded its time budget");
    }
}

// Keeps the routine's result observable
void Consume(const BenchmarkInput& input) {
    volatile int sink = input.values.empty() ? input.probe : input.values.front();
    (void)sink;
}

} // namespace

// Constructor
BenchmarkHarness::BenchmarkHarness(const BenchmarkConfig& config)
    : config_(config) {
}

core::BenchmarkSummary BenchmarkHarness::Run(const std::string& label,
                                             const std::vector<std::size_t>& sizes,
                                             const InputGenerator& generator,
                                             const Routine& routine,
                                             const CancellationToken* cancel) const {
    if (sizes.empty()) {
        throw core::EngineError(core::ErrorKind::VALIDATION_ERROR, "Benchmark needs at least one input size");
    }
    for (auto size : sizes) {
        if (size == 0) {
            throw core::EngineError(core::ErrorKind::VALIDATION_ERROR, "Benchmark input sizes must be positive");
        }
    }

    const auto deadline = Clock::now() + config_.time_budget;
    std::mt19937 rng(config_.seed != 0 ? config_.seed : std::random_device{}());

    spdlog::debug("Benchmark '{}': {} size(s), warmup {}, min {:.1f}ms, max {} iterations",
                  label, sizes.size(), config_.warmup_iterations,
                  config_.min_duration_ms, config_.max_iterations);

    std::vector<core::BenchmarkPoint> points;
    points.reserve(sizes.size());

    for (auto size : sizes) {
        CheckCancellation(deadline, cancel);

        BenchmarkInput input;
        try {
            input = generator(size, rng);
        } catch (const std::exception& e) {
            throw BenchmarkFault("Input generation failed at size " + std::to_string(size) + ": " + e.what());
        }

        auto point = Measure(size, input, routine, deadline, cancel);
        spdlog::debug("  n={:<6} iterations={:<5} avg={:.4f}ms",
                      point.input_size, point.iterations, point.AverageMs());
        points.push_back(point);
    }

    return Summarize(label, std::move(points));
}

core::BenchmarkPoint BenchmarkHarness::Measure(std::size_t size,
                                               const BenchmarkInput& input,
                                               const Routine& routine,
                                               Clock::time_point deadline,
                                               const CancellationToken* cancel) const {
    auto run_once = [&]() -> double {
        BenchmarkInput working = input;
        double elapsed = 0.0;
        try {
            auto start = Clock::now();
            routine(working);
            elapsed = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
        } catch (const std::exception& e) {
            throw BenchmarkFault("Routine failed at size " + std::to_string(size) + ": " + e.what());
        }
        Consume(working);
        return elapsed;
    };

    // Warmup (not recorded)
    for (std::size_t i = 0; i < config_.warmup_iterations; ++i) {
        CheckCancellation(deadline, cancel);
        run_once();
    }

    core::BenchmarkPoint point;
    point.input_size = size;

    while (point.iterations < config_.max_iterations &&
           point.total_duration_ms < config_.min_duration_ms) {
        CheckCancellation(deadline, cancel);
        point.total_duration_ms += run_once();
        ++point.iterations;
    }

    if (point.iterations == 0) {
        CheckCancellation(deadline, cancel);
        point.total_duration_ms = run_once();
        point.iterations = 1;
    }

    return point;
}

core::BenchmarkSummary BenchmarkHarness::Summarize(const std::string& label,
                                                   std::vector<core::BenchmarkPoint> points) {
    core::BenchmarkSummary summary;
    summary.label = label;

    double min_avg = std::numeric_limits<double>::max();
    double max_avg = 0.0;

    for (const auto& point : points) {
        summary.total_iterations += point.iterations;
        summary.total_duration_ms += point.total_duration_ms;
        min_avg = std::min(min_avg, point.AverageMs());
        max_avg = std::max(max_avg, point.AverageMs());
    }

    summary.min_avg_ms = points.empty() ? 0.0 : min_avg;
    summary.max_avg_ms = max_avg;
    summary.points = std::move(points);
    return summary;
}

} // namespace benchmark
} // namespace algoscope
