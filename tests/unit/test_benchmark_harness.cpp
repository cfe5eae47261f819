/**
 * @file test_benchmark_harness.cpp
 * @brief Unit tests for warmup and adaptive iteration sampling
 */

#include "algoscope/benchmark/benchmark_harness.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <stdexcept>

using namespace algoscope;
using namespace algoscope::benchmark;

class BenchmarkHarnessTest : public ::testing::Test {
protected:
    static BenchmarkInput Descending(std::size_t size, std::mt19937&) {
        BenchmarkInput input;
        for (std::size_t i = 0; i < size; ++i) {
            input.values.push_back(static_cast<int>(size - i));
        }
        return input;
    }

    static void Sort(BenchmarkInput& input) {
        std::sort(input.values.begin(), input.values.end());
    }

    static BenchmarkConfig FastConfig() {
        BenchmarkConfig config;
        config.warmup_iterations = 1;
        config.min_duration_ms = 1.0;
        config.max_iterations = 20;
        config.seed = 42;
        return config;
    }
};

TEST_F(BenchmarkHarnessTest, OnePointPerSizeInRequestOrder) {
    BenchmarkHarness harness(FastConfig());
    auto summary = harness.Run("sort", {8, 16, 32}, &Descending, &Sort);

    EXPECT_EQ(summary.label, "sort");
    ASSERT_EQ(summary.points.size(), 3u);
    EXPECT_EQ(summary.points[0].input_size, 8u);
    EXPECT_EQ(summary.points[1].input_size, 16u);
    EXPECT_EQ(summary.points[2].input_size, 32u);

    std::size_t total = 0;
    for (const auto& point : summary.points) {
        EXPECT_GE(point.iterations, 1u);
        EXPECT_LE(point.iterations, 20u);
        EXPECT_GE(point.total_duration_ms, 0.0);
        total += point.iterations;
    }
    EXPECT_EQ(summary.total_iterations, total);
    EXPECT_LE(summary.min_avg_ms, summary.max_avg_ms);
}

TEST_F(BenchmarkHarnessTest, DescendingSizesKeepTheirOrder) {
    BenchmarkHarness harness(FastConfig());
    auto summary = harness.Run("sort", {32, 8}, &Descending, &Sort);

    ASSERT_EQ(summary.points.size(), 2u);
    EXPECT_EQ(summary.points[0].input_size, 32u);
    EXPECT_EQ(summary.points[1].input_size, 8u);
}

TEST_F(BenchmarkHarnessTest, ForcesOneIterationWhenCapIsZero) {
    auto config = FastConfig();
    config.max_iterations = 0;
    config.warmup_iterations = 0;

    std::atomic<int> calls{0};
    BenchmarkHarness harness(config);
    auto summary = harness.Run("count", {4}, &Descending,
                               [&calls](BenchmarkInput&) { ++calls; });

    ASSERT_EQ(summary.points.size(), 1u);
    EXPECT_EQ(summary.points[0].iterations, 1u);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(BenchmarkHarnessTest, WarmupRunsAreNotRecorded) {
    auto config = FastConfig();
    config.warmup_iterations = 3;
    config.max_iterations = 2;
    config.min_duration_ms = 1e9;

    int calls = 0;
    BenchmarkHarness harness(config);
    auto summary = harness.Run("count", {4}, &Descending,
                               [&calls](BenchmarkInput&) { ++calls; });

    EXPECT_EQ(summary.points[0].iterations, 2u);
    EXPECT_EQ(calls, 5);
}

TEST_F(BenchmarkHarnessTest, EachIterationGetsAFreshInput) {
    auto config = FastConfig();
    config.warmup_iterations = 0;
    config.max_iterations = 3;
    config.min_duration_ms = 1e9;

    BenchmarkHarness harness(config);
    harness.Run("check", {5}, &Descending, [](BenchmarkInput& input) {
        // The previous iteration sorted its copy; this one must see the original
        EXPECT_EQ(input.values.front(), 5);
        std::sort(input.values.begin(), input.values.end());
    });
}

TEST_F(BenchmarkHarnessTest, RejectsEmptyOrZeroSizes) {
    BenchmarkHarness harness(FastConfig());

    try {
        harness.Run("sort", {}, &Descending, &Sort);
        FAIL() << "expected EngineError";
    } catch (const core::EngineError& e) {
        EXPECT_EQ(e.Kind(), core::ErrorKind::VALIDATION_ERROR);
    }

    EXPECT_THROW(harness.Run("sort", {8, 0}, &Descending, &Sort), core::EngineError);
}

TEST_F(BenchmarkHarnessTest, RoutineFailureAbortsTheBenchmark) {
    BenchmarkHarness harness(FastConfig());

    try {
        harness.Run("fails", {8}, &Descending,
                    [](BenchmarkInput&) { throw std::runtime_error("bad routine"); });
        FAIL() << "expected BenchmarkFault";
    } catch (const BenchmarkFault& e) {
        EXPECT_EQ(e.Kind(), core::ErrorKind::RUNTIME_FAULT);
        EXPECT_NE(std::string(e.what()).find("bad routine"), std::string::npos);
    }
}

TEST_F(BenchmarkHarnessTest, GeneratorFailureAbortsTheBenchmark) {
    BenchmarkHarness harness(FastConfig());
    EXPECT_THROW(harness.Run("fails", {8},
                             [](std::size_t, std::mt19937&) -> BenchmarkInput {
                                 throw std::runtime_error("no input");
                             },
                             &Sort),
                 BenchmarkFault);
}

TEST_F(BenchmarkHarnessTest, CancellationStopsTheBenchmark) {
    CancellationToken token;
    token.Cancel();

    BenchmarkHarness harness(FastConfig());
    try {
        harness.Run("sort", {8}, &Descending, &Sort, &token);
        FAIL() << "expected BenchmarkCancelled";
    } catch (const BenchmarkCancelled& e) {
        EXPECT_EQ(e.Kind(), core::ErrorKind::TIMEOUT_ERROR);
    }
}

TEST_F(BenchmarkHarnessTest, ExhaustedBudgetStopsTheBenchmark) {
    auto config = FastConfig();
    config.time_budget = std::chrono::milliseconds(0);

    BenchmarkHarness harness(config);
    EXPECT_THROW(harness.Run("sort", {8}, &Descending, &Sort), BenchmarkCancelled);
}

TEST_F(BenchmarkHarnessTest, SummarizeComputesMinAndMaxAverages) {
    std::vector<core::BenchmarkPoint> points(2);
    points[0].input_size = 8;
    points[0].iterations = 2;
    points[0].total_duration_ms = 4.0;
    points[1].input_size = 16;
    points[1].iterations = 4;
    points[1].total_duration_ms = 4.0;

    auto summary = BenchmarkHarness::Summarize("x", points);
    EXPECT_EQ(summary.total_iterations, 6u);
    EXPECT_DOUBLE_EQ(summary.total_duration_ms, 8.0);
    EXPECT_DOUBLE_EQ(summary.min_avg_ms, 1.0);
    EXPECT_DOUBLE_EQ(summary.max_avg_ms, 2.0);

    auto empty = BenchmarkHarness::Summarize("empty", {});
    EXPECT_DOUBLE_EQ(empty.min_avg_ms, 0.0);
}
