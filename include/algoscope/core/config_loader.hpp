/**
 * @file config_loader.hpp
 * @brief JSON configuration file for the engine
 *
 * **File Layout** (every key optional):
 * @code
 * {
 *   "verbose": false,
 *   "limits":    { "maxSourceBytes": 65536, "maxBenchmarkSizes": 16, "maxInputSize": 10000 },
 *   "sandbox":   { "timeoutMs": 2000, "nodeBinary": "/usr/bin/node", "workingDirectory": "/",
 *                  "maxMessageLength": 240, "maxHeapMb": 128, "maxAddressSpaceMb": 0,
 *                  "maxOpenFiles": 64, "maxOutputBytes": 1048576, "maxTraceRecords": 10000 },
 *   "trace":     { "maxSyntheticInput": 64 },
 *   "benchmark": { "warmupIterations": 3, "minDurationMs": 50, "maxIterations": 1000,
 *                  "timeBudgetMs": 10000, "seed": 0 }
 * }
 * @endcode
 *
 * Unknown keys are logged and skipped. A key with the wrong type raises
 * core::EngineError (VALIDATION_ERROR).
 *
 * @date 2025
 */

#pragma once

#include "algoscope/core/request_orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace algoscope {
namespace core {

class ConfigLoader {
public:
    /**
     * @brief Read and apply a config file over the defaults
     * @throws EngineError if the file is missing, unparsable or mistyped
     */
    static RequestOrchestrator::Config LoadFromFile(const std::filesystem::path& path);

    /**
     * @brief Apply a parsed document over @p config
     * @throws EngineError on mistyped keys
     */
    static void Apply(RequestOrchestrator::Config& config, const nlohmann::json& document);

    /// Effective configuration, in file layout
    static nlohmann::json ToJson(const RequestOrchestrator::Config& config);
};

} // namespace core
} // namespace algoscope
