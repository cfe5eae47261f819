/**
 * @file test_routine_catalog.cpp
 * @brief Unit tests for the vetted benchmark routines
 */

#include "algoscope/benchmark/routine_catalog.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace algoscope::benchmark;

class RoutineCatalogTest : public ::testing::Test {
protected:
    RoutineCatalog catalog_ = RoutineCatalog::CreateDefault();
    std::mt19937 rng_{1234};
};

TEST_F(RoutineCatalogTest, DefaultCatalogIds) {
    EXPECT_EQ(catalog_.Ids(),
              (std::vector<std::string>{"binary-search", "bubble-sort", "insertion-sort", "selection-sort"}));
    EXPECT_FALSE(catalog_.Contains("bfs"));
    EXPECT_EQ(catalog_.Find("bfs"), nullptr);
}

TEST_F(RoutineCatalogTest, EntriesCarryMetadata) {
    const auto* bubble = catalog_.Find("bubble-sort");
    ASSERT_NE(bubble, nullptr);
    EXPECT_EQ(bubble->name, "Bubble Sort");
    EXPECT_EQ(bubble->complexity, "O(n^2)");
    EXPECT_EQ(bubble->default_sizes, DefaultBenchmarkSizes());

    EXPECT_EQ(catalog_.Find("binary-search")->complexity, "O(log n)");
}

TEST_F(RoutineCatalogTest, SortingRoutinesSort) {
    for (const char* id : {"bubble-sort", "insertion-sort", "selection-sort"}) {
        const auto* entry = catalog_.Find(id);
        ASSERT_NE(entry, nullptr) << id;

        auto input = entry->generator(200, rng_);
        ASSERT_EQ(input.values.size(), 200u);
        for (int value : input.values) {
            EXPECT_GE(value, 0);
            EXPECT_LT(value, 2000);
        }

        auto expected = input.values;
        std::sort(expected.begin(), expected.end());

        entry->routine(input);
        EXPECT_EQ(input.values, expected) << id;
    }
}

TEST_F(RoutineCatalogTest, BinarySearchFindsItsProbe) {
    const auto* entry = catalog_.Find("binary-search");
    ASSERT_NE(entry, nullptr);

    auto input = entry->generator(128, rng_);
    EXPECT_TRUE(std::is_sorted(input.values.begin(), input.values.end()));

    const int probe = input.probe;
    entry->routine(input);

    ASSERT_GE(input.probe, 0);
    ASSERT_LT(input.probe, 128);
    EXPECT_EQ(input.values[static_cast<std::size_t>(input.probe)], probe);
}

TEST_F(RoutineCatalogTest, RegisterReplacesExistingEntry) {
    catalog_.Register({"bubble-sort", "Custom", "O(1)", nullptr, nullptr, {4}});
    EXPECT_EQ(catalog_.Find("bubble-sort")->name, "Custom");
    EXPECT_EQ(catalog_.Routines().size(), 4u);
}

TEST_F(RoutineCatalogTest, RoutinesRunUnderTheHarness) {
    BenchmarkConfig config;
    config.warmup_iterations = 1;
    config.min_duration_ms = 0.5;
    config.max_iterations = 5;
    config.seed = 7;

    BenchmarkHarness harness(config);
    const auto* entry = catalog_.Find("insertion-sort");
    auto summary = harness.Run(entry->name, {16, 32}, entry->generator, entry->routine);

    ASSERT_EQ(summary.points.size(), 2u);
    EXPECT_EQ(summary.label, "Insertion Sort");
}
