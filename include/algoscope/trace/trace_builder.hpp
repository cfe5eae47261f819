/**
 * @file trace_builder.hpp
 * @brief Incremental construction of numbered trace steps
 *
 * @date 2025
 */

#pragma once

#include "algoscope/core/types.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace algoscope {
namespace trace {

/**
 * @class TraceInputError
 * @brief Input value unsuitable for a trace, or a trace grown past its caps
 */
class TraceInputError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Upper bound on steps in one trace
constexpr std::size_t kMaxTraceSteps = 50000;

/// Upper bound on snapshot values summed over all steps of one trace
constexpr std::size_t kMaxTraceSnapshotValues = 2000000;

/**
 * @brief Whether every highlighted index addresses an element of the snapshot
 *
 * Steps lacking either optional field are always valid.
 */
bool HasValidHighlights(const core::TraceStep& step);

/**
 * @class TraceBuilder
 * @brief Appends steps and numbers them 1..N
 *
 * **Usage Example**:
 * @code
 * TraceBuilder builder;
 * builder.AddArrayStep(4, "Compare arr[0] = 5 and arr[1] = 1", {5, 1, 4}, {0, 1});
 * builder.AddStep(0, "Done");
 * auto steps = builder.Build();   // steps[0].step == 1, steps[1].step == 2
 * @endcode
 *
 * Adding a step past either cap throws TraceInputError.
 */
class TraceBuilder {
public:
    explicit TraceBuilder(std::size_t max_steps = kMaxTraceSteps,
                          std::size_t max_snapshot_values = kMaxTraceSnapshotValues);

    /// Step without snapshot or highlights
    void AddStep(int line, std::string description);

    /**
     * @brief Step with an array snapshot and highlighted indices
     * @throws std::invalid_argument if a highlighted index is out of range
     */
    void AddArrayStep(int line, std::string description,
                      std::vector<double> snapshot, std::vector<int> highlighted);

    /**
     * @brief Step with any combination of optional fields
     * @throws std::invalid_argument if a highlighted index is out of range
     */
    void AddRecordedStep(int line, std::string description,
                         std::optional<std::vector<double>> snapshot,
                         std::optional<std::vector<int>> highlighted);

    std::size_t Size() const { return steps_.size(); }

    /// Hand out the steps; the builder is empty afterwards
    std::vector<core::TraceStep> Build();

private:
    std::vector<core::TraceStep> steps_;
    std::size_t snapshot_values_{0};
    std::size_t max_steps_;
    std::size_t max_snapshot_values_;
};

} // namespace trace
} // namespace algoscope
