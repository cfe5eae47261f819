/**
 * @file config_loader.cpp
 * @brief JSON configuration parsing
 *
 * @date 2025
 */

#include "algoscope/core/config_loader.hpp"
#include "algoscope/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <limits>
#include <set>

using json = nlohmann::json;

namespace algoscope {
namespace core {

namespace {

[[noreturn]] void TypeError(const std::string& key, const char* expected) {
    throw EngineError(ErrorKind::VALIDATION_ERROR,
                      "Config key '" + key + "' must be " + expected);
}

void WarnUnknownKeys(const json& section, const std::string& prefix, const std::set<std::string>& known) {
    for (const auto& item : section.items()) {
        if (known.count(item.key()) == 0) {
            spdlog::warn("Ignoring unknown config key '{}{}'", prefix, item.key());
        }
    }
}

const json* Section(const json& document, const std::string& name) {
    if (!document.contains(name)) {
        return nullptr;
    }
    const auto& section = document[name];
    if (!section.is_object()) {
        TypeError(name, "an object");
    }
    return &section;
}

template <typename T>
void ReadUnsigned(const json& section, const std::string& prefix, const char* key, T& target) {
    if (!section.contains(key)) {
        return;
    }
    const auto& value = section[key];
    if (!value.is_number_unsigned() && !(value.is_number_integer() && value.get<long long>() >= 0)) {
        TypeError(prefix + key, "a non-negative integer");
    }
    auto raw = value.get<unsigned long long>();
    if (raw > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        TypeError(prefix + key, "within range");
    }
    target = static_cast<T>(raw);
}

void ReadDouble(const json& section, const std::string& prefix, const char* key, double& target) {
    if (!section.contains(key)) {
        return;
    }
    const auto& value = section[key];
    if (!value.is_number()) {
        TypeError(prefix + key, "a number");
    }
    target = value.get<double>();
}

void ReadMilliseconds(const json& section, const std::string& prefix, const char* key,
                      std::chrono::milliseconds& target) {
    std::size_t count = static_cast<std::size_t>(target.count());
    ReadUnsigned(section, prefix, key, count);
    if (count == 0) {
        TypeError(prefix + key, "positive");
    }
    target = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(count));
}

void ReadString(const json& section, const std::string& prefix, const char* key, std::string& target) {
    if (!section.contains(key)) {
        return;
    }
    const auto& value = section[key];
    if (!value.is_string()) {
        TypeError(prefix + key, "a string");
    }
    target = value.get<std::string>();
}

void ReadPath(const json& section, const std::string& prefix, const char* key, std::filesystem::path& target) {
    std::string text = target.string();
    ReadString(section, prefix, key, text);
    target = text;
}

} // namespace

RequestOrchestrator::Config ConfigLoader::LoadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw EngineError(ErrorKind::VALIDATION_ERROR, "Cannot open config file: " + path.string());
    }

    json document;
    try {
        file >> document;
    }
    catch (const json::parse_error& e) {
        throw EngineError(ErrorKind::VALIDATION_ERROR,
                          "Config file " + path.string() + " is not valid JSON: " + e.what());
    }

    RequestOrchestrator::Config config;
    Apply(config, document);
    spdlog::debug("Loaded config from {}", path.string());
    return config;
}

void ConfigLoader::Apply(RequestOrchestrator::Config& config, const json& document) {
    if (!document.is_object()) {
        throw EngineError(ErrorKind::VALIDATION_ERROR, "Config document must be a JSON object");
    }

    WarnUnknownKeys(document, "", {"verbose", "limits", "sandbox", "trace", "benchmark"});

    if (document.contains("verbose")) {
        if (!document["verbose"].is_boolean()) {
            TypeError("verbose", "a boolean");
        }
        config.verbose_logging = document["verbose"].get<bool>();
    }

    if (const auto* limits = Section(document, "limits")) {
        WarnUnknownKeys(*limits, "limits.", {"maxSourceBytes", "maxBenchmarkSizes", "maxInputSize"});
        ReadUnsigned(*limits, "limits.", "maxSourceBytes", config.max_source_bytes);
        ReadUnsigned(*limits, "limits.", "maxBenchmarkSizes", config.max_benchmark_sizes);
        ReadUnsigned(*limits, "limits.", "maxInputSize", config.max_input_size);
    }

    if (const auto* sandbox = Section(document, "sandbox")) {
        WarnUnknownKeys(*sandbox, "sandbox.", {
            "timeoutMs", "nodeBinary", "workingDirectory", "maxMessageLength", "maxHeapMb",
            "maxAddressSpaceMb", "maxOpenFiles", "maxOutputBytes", "maxTraceRecords"});

        auto& target = config.sandbox;
        ReadMilliseconds(*sandbox, "sandbox.", "timeoutMs", target.timeout);
        ReadPath(*sandbox, "sandbox.", "nodeBinary", target.node_binary);
        ReadPath(*sandbox, "sandbox.", "workingDirectory", target.working_directory);
        ReadUnsigned(*sandbox, "sandbox.", "maxMessageLength", target.max_message_length);
        ReadUnsigned(*sandbox, "sandbox.", "maxHeapMb", target.resource_limits.max_heap_mb);
        ReadUnsigned(*sandbox, "sandbox.", "maxAddressSpaceMb", target.resource_limits.max_address_space_mb);
        ReadUnsigned(*sandbox, "sandbox.", "maxOpenFiles", target.resource_limits.max_open_files);
        ReadUnsigned(*sandbox, "sandbox.", "maxOutputBytes", target.resource_limits.max_output_bytes);
        ReadUnsigned(*sandbox, "sandbox.", "maxTraceRecords", target.resource_limits.max_trace_records);
    }

    if (const auto* trace = Section(document, "trace")) {
        WarnUnknownKeys(*trace, "trace.", {"maxSyntheticInput"});
        ReadUnsigned(*trace, "trace.", "maxSyntheticInput", config.trace.max_synthetic_input);
    }

    if (const auto* bench = Section(document, "benchmark")) {
        WarnUnknownKeys(*bench, "benchmark.", {
            "warmupIterations", "minDurationMs", "maxIterations", "timeBudgetMs", "seed"});

        auto& target = config.benchmark;
        ReadUnsigned(*bench, "benchmark.", "warmupIterations", target.warmup_iterations);
        ReadDouble(*bench, "benchmark.", "minDurationMs", target.min_duration_ms);
        ReadUnsigned(*bench, "benchmark.", "maxIterations", target.max_iterations);
        ReadMilliseconds(*bench, "benchmark.", "timeBudgetMs", target.time_budget);
        ReadUnsigned(*bench, "benchmark.", "seed", target.seed);
    }
}

json ConfigLoader::ToJson(const RequestOrchestrator::Config& config) {
    const auto& sandbox = config.sandbox;
    const auto& limits = sandbox.resource_limits;

    return {
        {"verbose", config.verbose_logging},
        {"limits", {
            {"maxSourceBytes", config.max_source_bytes},
            {"maxBenchmarkSizes", config.max_benchmark_sizes},
            {"maxInputSize", config.max_input_size}
        }},
        {"sandbox", {
            {"timeoutMs", sandbox.timeout.count()},
            {"nodeBinary", sandbox.node_binary.string()},
            {"workingDirectory", sandbox.working_directory.string()},
            {"maxMessageLength", sandbox.max_message_length},
            {"maxHeapMb", limits.max_heap_mb},
            {"maxAddressSpaceMb", limits.max_address_space_mb},
            {"maxOpenFiles", limits.max_open_files},
            {"maxOutputBytes", limits.max_output_bytes},
            {"maxTraceRecords", limits.max_trace_records}
        }},
        {"trace", {
            {"maxSyntheticInput", config.trace.max_synthetic_input}
        }},
        {"benchmark", {
            {"warmupIterations", config.benchmark.warmup_iterations},
            {"minDurationMs", config.benchmark.min_duration_ms},
            {"maxIterations", config.benchmark.max_iterations},
            {"timeBudgetMs", config.benchmark.time_budget.count()},
            {"seed", config.benchmark.seed}
        }}
    };
}

} // namespace core
} // namespace algoscope
