/**
 * @file trace_emitter.cpp
 * @brief Trace strategy selection and hook record conversion
 *
 * @date 2025
 */

#include "algoscope/trace/trace_emitter.hpp"
#include "algoscope/trace/trace_builder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

using json = nlohmann::json;

namespace algoscope {
namespace trace {

std::string ToString(TraceStrategy strategy) {
    switch (strategy) {
        case TraceStrategy::SYNTHETIC:    return "synthetic";
        case TraceStrategy::INSTRUMENTED: return "instrumented";
    }
    return "instrumented";
}

TraceEmitter::TraceEmitter(const SyntheticTraceCatalog& catalog, const TraceEmitterConfig& config)
    : catalog_(catalog)
    , config_(config) {
}

TraceEmission TraceEmitter::Emit(const std::optional<std::string>& algorithm_id,
                                 const json& input,
                                 const std::vector<core::TraceHookRecord>& hook_records,
                                 bool hook_truncated) const {
    if (algorithm_id && catalog_.Contains(*algorithm_id)) {
        TraceEmission emission;
        emission.strategy = TraceStrategy::SYNTHETIC;
        emission.steps = catalog_.Generate(*algorithm_id, input, config_.max_synthetic_input);
        emission.warnings.push_back(
            "Trace replays the reference implementation of '" + *algorithm_id +
            "'; it may not follow your code's exact path.");
        if (!hook_records.empty()) {
            emission.warnings.push_back(
                std::to_string(hook_records.size()) +
                " trace() call(s) were ignored because a reference trace was used.");
        }
        spdlog::debug("Synthetic trace '{}' with {} steps", *algorithm_id, emission.steps.size());
        return emission;
    }

    auto emission = FromHookRecords(hook_records, hook_truncated);
    if (algorithm_id) {
        emission.warnings.insert(emission.warnings.begin(),
            "No reference trace for algorithm '" + *algorithm_id +
            "'; using trace() calls from your code.");
    }
    return emission;
}

TraceEmission TraceEmitter::FromHookRecords(const std::vector<core::TraceHookRecord>& hook_records,
                                            bool hook_truncated) const {
    TraceEmission emission;
    emission.strategy = TraceStrategy::INSTRUMENTED;

    TraceBuilder builder;
    std::size_t dropped_highlights = 0;

    for (const auto& record : hook_records) {
        auto highlighted = record.highlighted;
        if (highlighted) {
            core::TraceStep candidate;
            candidate.array_snapshot = record.array;
            candidate.highlighted_indices = highlighted;
            const bool negative = std::any_of(highlighted->begin(), highlighted->end(),
                                              [](int index) { return index < 0; });
            if (negative || !HasValidHighlights(candidate)) {
                highlighted.reset();
                ++dropped_highlights;
            }
        }
        builder.AddRecordedStep(record.line, record.description, record.array, std::move(highlighted));
    }

    if (dropped_highlights > 0) {
        emission.warnings.push_back(
            "Dropped highlighted indices outside the array snapshot in " +
            std::to_string(dropped_highlights) + " trace step(s).");
    }
    if (hook_truncated) {
        emission.warnings.push_back(
            "Trace truncated after " + std::to_string(builder.Size()) + " steps.");
    }

    emission.steps = builder.Build();
    return emission;
}

} // namespace trace
} // namespace algoscope
