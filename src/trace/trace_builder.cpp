/**
 * @file trace_builder.cpp
 * @brief Trace step numbering and highlight validation
 *
 * @date 2025
 */

#include "algoscope/trace/trace_builder.hpp"

#include <stdexcept>
#include <utility>

namespace algoscope {
namespace trace {

bool HasValidHighlights(const core::TraceStep& step) {
    if (!step.array_snapshot || !step.highlighted_indices) {
        return true;
    }
    const auto size = step.array_snapshot->size();
    for (int index : *step.highlighted_indices) {
        if (index < 0 || static_cast<std::size_t>(index) >= size) {
            return false;
        }
    }
    return true;
}

TraceBuilder::TraceBuilder(std::size_t max_steps, std::size_t max_snapshot_values)
    : max_steps_(max_steps), max_snapshot_values_(max_snapshot_values) {
}

void TraceBuilder::AddStep(int line, std::string description) {
    AddRecordedStep(line, std::move(description), std::nullopt, std::nullopt);
}

void TraceBuilder::AddArrayStep(int line, std::string description,
                                std::vector<double> snapshot, std::vector<int> highlighted) {
    AddRecordedStep(line, std::move(description),
                    std::optional<std::vector<double>>(std::move(snapshot)),
                    std::optional<std::vector<int>>(std::move(highlighted)));
}

void TraceBuilder::AddRecordedStep(int line, std::string description,
                                   std::optional<std::vector<double>> snapshot,
                                   std::optional<std::vector<int>> highlighted) {
    if (steps_.size() >= max_steps_) {
        throw TraceInputError("trace exceeds " + std::to_string(max_steps_) + " steps");
    }
    const std::size_t values = snapshot ? snapshot->size() : 0;
    if (values > max_snapshot_values_ - snapshot_values_) {
        throw TraceInputError("trace snapshots exceed " + std::to_string(max_snapshot_values_) + " values");
    }

    core::TraceStep step;
    step.step = static_cast<int>(steps_.size()) + 1;
    step.current_line = line;
    step.description = std::move(description);
    step.array_snapshot = std::move(snapshot);
    step.highlighted_indices = std::move(highlighted);

    if (!HasValidHighlights(step)) {
        throw std::invalid_argument("highlighted index outside snapshot at step " +
                                    std::to_string(step.step));
    }

    snapshot_values_ += values;
    steps_.push_back(std::move(step));
}

std::vector<core::TraceStep> TraceBuilder::Build() {
    std::vector<core::TraceStep> steps;
    steps.swap(steps_);
    snapshot_values_ = 0;
    return steps;
}

} // namespace trace
} // namespace algoscope
