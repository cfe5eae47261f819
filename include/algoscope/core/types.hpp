/**
 * @file types.hpp
 * @brief Shared request, result, trace and benchmark data types
 *
 * Plain value types passed between the sandbox, the trace emitter, the
 * benchmark harness and the request orchestrator. None of these types own
 * external resources.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace algoscope {
namespace core {

/**
 * @enum Language
 * @brief Scripting languages known to the engine
 *
 * Only JAVASCRIPT has a runner. PYTHON is recognised so that requests for it
 * receive a structured "unsupported" answer instead of a validation error.
 */
enum class Language {
    JAVASCRIPT,  ///< Hosted by the node interpreter
    PYTHON       ///< Recognised, no runner
};

/**
 * @brief Wire identifier of a language ("javascript", "python")
 */
std::string ToString(Language language);

/**
 * @brief Parse a wire language identifier (case-sensitive)
 * @return Language, or std::nullopt for unknown identifiers
 */
std::optional<Language> ParseLanguage(const std::string& name);

/**
 * @struct ExecutionRequest
 * @brief One user program submission
 */
struct ExecutionRequest {
    Language language{Language::JAVASCRIPT};   ///< Requested language
    std::string source_code;                    ///< Program text
    std::optional<std::string> algorithm_id;    ///< Catalog id selecting a synthetic trace
    nlohmann::json input;                       ///< Optional input value (null when absent)
    bool capture_trace{true};                   ///< Client trace preference
};

/**
 * @struct TraceStep
 * @brief One frame of a step-by-step playback
 *
 * Steps are numbered from 1 without gaps. When both optional fields are set,
 * every highlighted index addresses an element of the snapshot.
 */
struct TraceStep {
    int step{0};                                          ///< 1-based step number
    int current_line{0};                                  ///< Source line the step refers to
    std::string description;                              ///< Human readable description
    std::optional<std::vector<double>> array_snapshot;    ///< Array state at this step
    std::optional<std::vector<int>> highlighted_indices;  ///< Indices to highlight
};

/**
 * @struct TraceHookRecord
 * @brief Raw record written by the in-sandbox trace() hook
 */
struct TraceHookRecord {
    int line{0};
    std::string description;
    std::optional<std::vector<double>> array;
    std::optional<std::vector<int>> highlighted;  ///< Entries outside [0, INT_MAX] are -1
};

/**
 * @struct ExecutionResult
 * @brief Output of one execution, built once during assembly
 */
struct ExecutionResult {
    bool success{false};          ///< Program ran to completion
    std::string stdout_text;      ///< Captured standard output
    std::string stderr_text;      ///< Captured standard error
    double duration_ms{0.0};      ///< Wall-clock execution time
    std::vector<TraceStep> trace; ///< Playback steps (may be empty)
};

/**
 * @struct BenchmarkPoint
 * @brief Timing of one input size
 */
struct BenchmarkPoint {
    std::size_t input_size{0};      ///< Number of input elements
    std::size_t iterations{0};      ///< Recorded iterations (>= 1)
    double total_duration_ms{0.0};  ///< Sum of recorded iteration durations

    double AverageMs() const {
        return iterations == 0 ? 0.0 : total_duration_ms / static_cast<double>(iterations);
    }
};

/**
 * @struct BenchmarkSummary
 * @brief Aggregated result of one benchmark invocation
 */
struct BenchmarkSummary {
    std::string label;                   ///< Routine label
    std::vector<BenchmarkPoint> points;  ///< One point per requested size, in request order
    std::size_t total_iterations{0};
    double total_duration_ms{0.0};
    double min_avg_ms{0.0};
    double max_avg_ms{0.0};
};

} // namespace core
} // namespace algoscope
