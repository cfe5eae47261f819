/**
 * @file trace_emitter.hpp
 * @brief Trace strategy selection (synthetic vs instrumented)
 *
 * @date 2025
 */

#pragma once

#include "algoscope/core/types.hpp"
#include "algoscope/trace/synthetic_traces.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace algoscope {
namespace trace {

/**
 * @enum TraceStrategy
 * @brief Where the steps of a trace came from
 */
enum class TraceStrategy {
    SYNTHETIC,     ///< Reference generator selected by algorithm id
    INSTRUMENTED   ///< trace() hook calls made by the user program
};

std::string ToString(TraceStrategy strategy);

/**
 * @struct TraceEmitterConfig
 * @brief Trace generation limits
 */
struct TraceEmitterConfig {
    std::size_t max_synthetic_input{64};   ///< Largest input a synthetic generator accepts
};

/**
 * @struct TraceEmission
 * @brief Steps plus the notes produced while emitting them
 */
struct TraceEmission {
    TraceStrategy strategy{TraceStrategy::INSTRUMENTED};
    std::vector<core::TraceStep> steps;
    std::vector<std::string> warnings;
};

/**
 * @class TraceEmitter
 * @brief Produces the playback steps for one execution
 *
 * Strategy selection:
 * - algorithm id known to the catalog → SYNTHETIC (reference replay; a
 *   warning notes that user code may take a different path)
 * - otherwise → INSTRUMENTED from the sandbox hook records; an unknown
 *   algorithm id adds a warning
 *
 * Stateless apart from a reference to the catalog, which must outlive it.
 */
class TraceEmitter {
public:
    TraceEmitter(const SyntheticTraceCatalog& catalog,
                 const TraceEmitterConfig& config = TraceEmitterConfig{});

    /**
     * @brief Emit the trace
     *
     * @param algorithm_id Optional catalog id
     * @param input Request input (null when absent)
     * @param hook_records trace() records captured by the sandbox
     * @param hook_truncated Whether the sandbox dropped records at its cap
     *
     * @throws TraceInputError if the synthetic generator rejects @p input
     */
    TraceEmission Emit(const std::optional<std::string>& algorithm_id,
                       const nlohmann::json& input,
                       const std::vector<core::TraceHookRecord>& hook_records,
                       bool hook_truncated) const;

    /**
     * @brief Steps from hook records; out-of-range highlights are dropped
     */
    TraceEmission FromHookRecords(const std::vector<core::TraceHookRecord>& hook_records,
                                  bool hook_truncated) const;

private:
    const SyntheticTraceCatalog& catalog_;
    TraceEmitterConfig config_;
};

} // namespace trace
} // namespace algoscope
