/**
 * @file request_codec.hpp
 * @brief JSON wire format for requests and responses
 *
 * Parsing functions validate field presence and types and throw
 * core::EngineError (VALIDATION_ERROR) with a client-facing message.
 * Serialisation writes integral doubles as JSON integers so that array
 * snapshots read back as the numbers the program used.
 *
 * @date 2025
 */

#pragma once

#include "algoscope/core/request_orchestrator.hpp"
#include "algoscope/core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace algoscope {
namespace api {

/**
 * @struct BenchmarkRequest
 * @brief Parsed benchmark body
 */
struct BenchmarkRequest {
    std::string algorithm_id;
    core::Language language{core::Language::JAVASCRIPT};
    core::BenchmarkOverrides overrides;
};

/**
 * @brief Parse an execute body
 *
 * `{ language, code | sourceCode, algorithmId? | algoId?, input?, options?: { captureTrace? } }`
 */
core::ExecutionRequest ParseExecuteRequest(const nlohmann::json& body);

/**
 * @brief Parse a benchmark body
 *
 * `{ algorithmId, language, sizes?, warmupIterations?, minDurationMs?, maxIterations? }`
 */
BenchmarkRequest ParseBenchmarkRequest(const nlohmann::json& body);

/// Integral values become JSON integers
nlohmann::json NumberToJson(double value);

nlohmann::json ToJson(const core::TraceStep& step);
nlohmann::json ToJson(const core::ExecutionResult& result);
nlohmann::json ToJson(const core::BenchmarkPoint& point);
nlohmann::json ToJson(const core::BenchmarkSummary& summary);

/// `{ ok:true, language, algorithmId, result, warnings? }` or the error body
nlohmann::json ToJson(const core::ExecuteResponse& response);

/// `{ ok:true, result:{...} }` or the error body
nlohmann::json ToJson(const core::BenchmarkResponse& response);

/// `{ ok:false, error, message, details? }`
nlohmann::json ErrorBody(core::ErrorKind kind,
                         const std::string& message,
                         const nlohmann::json& details = nullptr);

} // namespace api
} // namespace algoscope
