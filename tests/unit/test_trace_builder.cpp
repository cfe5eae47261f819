/**
 * @file test_trace_builder.cpp
 * @brief Unit tests for step numbering and highlight validation.
 */

#include "algoscope/trace/trace_builder.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace algoscope;
using namespace algoscope::trace;

class TraceBuilderTest : public ::testing::Test {
protected:
    TraceBuilder builder_;
};

TEST_F(TraceBuilderTest, NumbersStepsFromOneWithoutGaps) {
    builder_.AddStep(1, "start");
    builder_.AddArrayStep(4, "compare", {3, 1}, {0, 1});
    builder_.AddRecordedStep(7, "note", std::nullopt, std::nullopt);

    auto steps = builder_.Build();
    ASSERT_EQ(steps.size(), 3u);
    for (std::size_t i = 0; i < steps.size(); ++i) {
        EXPECT_EQ(steps[i].step, static_cast<int>(i) + 1);
    }
    EXPECT_EQ(steps[1].current_line, 4);
    EXPECT_FALSE(steps[0].array_snapshot.has_value());
    ASSERT_TRUE(steps[1].array_snapshot.has_value());
    EXPECT_EQ(*steps[1].array_snapshot, (std::vector<double>{3, 1}));
}

TEST_F(TraceBuilderTest, RejectsHighlightOutsideSnapshot) {
    EXPECT_THROW(builder_.AddArrayStep(1, "bad", {1, 2}, {2}), std::invalid_argument);
    EXPECT_THROW(builder_.AddArrayStep(1, "bad", {1, 2}, {-1}), std::invalid_argument);
    EXPECT_EQ(builder_.Size(), 0u);
}

TEST_F(TraceBuilderTest, HighlightsWithoutSnapshotAreAccepted) {
    builder_.AddRecordedStep(2, "only highlights", std::nullopt, std::vector<int>{5});
    EXPECT_EQ(builder_.Size(), 1u);
}

TEST_F(TraceBuilderTest, BuildEmptiesTheBuilder) {
    builder_.AddStep(1, "x");
    auto first = builder_.Build();
    EXPECT_EQ(first.size(), 1u);
    EXPECT_EQ(builder_.Size(), 0u);

    builder_.AddStep(1, "y");
    auto second = builder_.Build();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].step, 1);
}

TEST_F(TraceBuilderTest, HasValidHighlightsChecksBounds) {
    core::TraceStep step;
    step.array_snapshot = std::vector<double>{1, 2, 3};
    step.highlighted_indices = std::vector<int>{0, 2};
    EXPECT_TRUE(HasValidHighlights(step));

    step.highlighted_indices = std::vector<int>{3};
    EXPECT_FALSE(HasValidHighlights(step));
}

TEST_F(TraceBuilderTest, StepCapThrowsTraceInputError) {
    TraceBuilder capped(3);
    capped.AddStep(1, "a");
    capped.AddStep(2, "b");
    capped.AddStep(3, "c");
    EXPECT_THROW(capped.AddStep(4, "d"), TraceInputError);
    EXPECT_EQ(capped.Size(), 3u);
}

TEST_F(TraceBuilderTest, SnapshotValueCapThrowsTraceInputError) {
    TraceBuilder capped(100, 5);
    capped.AddArrayStep(1, "three", {1, 2, 3}, {});
    capped.AddArrayStep(1, "two", {1, 2}, {});
    EXPECT_THROW(capped.AddArrayStep(1, "one more", {1}, {}), TraceInputError);
    capped.AddStep(2, "no snapshot");

    auto steps = capped.Build();
    EXPECT_EQ(steps.size(), 3u);

    // Build resets the running total
    EXPECT_NO_THROW(capped.AddArrayStep(1, "fresh", {1, 2, 3, 4, 5}, {}));
}
