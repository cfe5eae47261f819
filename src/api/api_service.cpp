/**
 * @file api_service.cpp
 * @brief Route handlers and status code mapping
 *
 * @date 2025
 */

#include "algoscope/api/api_service.hpp"
#include "algoscope/api/request_codec.hpp"
#include "algoscope/core/errors.hpp"
#include "algoscope/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

using json = nlohmann::json;

namespace algoscope {
namespace api {

using core::ErrorKind;
using utils::StringUtils;

namespace {

constexpr const char* kInternalMessage = "Internal server error.";

ApiResponse Error(ErrorKind kind, const std::string& message, const json& details = nullptr) {
    return {core::HttpStatusFor(kind), ErrorBody(kind, message, details)};
}

std::string NormalizeRoute(std::string route) {
    route = StringUtils::Trim(route);
    if (StringUtils::StartsWith(route, "/api/")) {
        route = route.substr(5);
    } else if (StringUtils::StartsWith(route, "/")) {
        route = route.substr(1);
    }
    return route;
}

} // namespace

// Constructor
ApiService::ApiService(const core::RequestOrchestrator& orchestrator)
    : orchestrator_(orchestrator) {
}

ApiResponse ApiService::Guard(const char* route, const std::function<ApiResponse()>& handler) const {
    try {
        return handler();
    }
    catch (const core::EngineError& e) {
        if (e.Kind() == ErrorKind::INTERNAL_FAULT) {
            spdlog::error("[{}] internal fault: {}", route, e.what());
            return Error(e.Kind(), kInternalMessage);
        }
        spdlog::debug("[{}] {}: {}", route, core::ToString(e.Kind()), e.what());
        return Error(e.Kind(), e.what());
    }
    catch (const std::exception& e) {
        spdlog::error("[{}] unhandled exception: {}", route, e.what());
        return Error(ErrorKind::INTERNAL_FAULT, kInternalMessage);
    }
}

// ============================================================================
// ROUTES
// ============================================================================

ApiResponse ApiService::HandleExecute(const json& body) const {
    return Guard("execute", [&]() -> ApiResponse {
        auto request = ParseExecuteRequest(body);
        auto response = orchestrator_.Execute(request);
        return {response.http_status, ToJson(response)};
    });
}

ApiResponse ApiService::HandleBenchmark(const json& body, const benchmark::CancellationToken* cancel) const {
    return Guard("benchmark", [&]() -> ApiResponse {
        auto request = ParseBenchmarkRequest(body);
        auto response = orchestrator_.RunBenchmark(request.algorithm_id, request.language,
                                                   request.overrides, cancel);
        return {response.http_status, ToJson(response)};
    });
}

ApiResponse ApiService::HandleInfo() const {
    return Guard("info", [&]() -> ApiResponse {
        const auto& sandbox = orchestrator_.Sandbox();
        const auto& config = orchestrator_.GetConfig();

        json languages = json::array();
        for (const auto& entry : sandbox.Runtimes().Runtimes()) {
            const auto& runtime = entry.second;
            json language = {
                {"id", core::ToString(runtime.language)},
                {"supported", runtime.supported},
                {"available", sandbox.IsLanguageAvailable(runtime.language)}
            };
            if (!runtime.supported) {
                language["note"] = runtime.unsupported_reason;
            }
            languages.push_back(std::move(language));
        }

        json trace_algorithms = json::array();
        for (const auto& entry : orchestrator_.TraceCatalog().Algorithms()) {
            trace_algorithms.push_back({
                {"id", entry.second.id},
                {"name", entry.second.name},
                {"category", entry.second.category}
            });
        }

        json routines = json::array();
        for (const auto& entry : orchestrator_.Routines().Routines()) {
            routines.push_back({
                {"id", entry.second.id},
                {"name", entry.second.name},
                {"complexity", entry.second.complexity},
                {"defaultSizes", entry.second.default_sizes}
            });
        }

        json body = {
            {"name", kEngineName},
            {"version", kEngineVersion},
            {"lastUpdated", StringUtils::FormatIso8601(std::chrono::system_clock::now())},
            {"languages", std::move(languages)},
            {"traceAlgorithms", std::move(trace_algorithms)},
            {"benchmarkRoutines", std::move(routines)},
            {"limits", {
                {"timeoutMs", config.sandbox.timeout.count()},
                {"maxSourceBytes", config.max_source_bytes},
                {"maxOutputBytes", config.sandbox.resource_limits.max_output_bytes},
                {"maxTraceSteps", config.sandbox.resource_limits.max_trace_records},
                {"maxSyntheticInput", config.trace.max_synthetic_input},
                {"maxBenchmarkSizes", config.max_benchmark_sizes},
                {"maxInputSize", config.max_input_size}
            }}
        };
        return {200, std::move(body)};
    });
}

ApiResponse ApiService::HandleHealth() const {
    return Guard("health", [&]() -> ApiResponse {
        auto uptime = orchestrator_.Uptime();
        bool engine_ready = orchestrator_.IsInitialized();
        bool javascript = engine_ready &&
                          orchestrator_.Sandbox().IsLanguageAvailable(core::Language::JAVASCRIPT);

        json checks = {
            {"executionEngine", engine_ready},
            {"javascriptRuntime", javascript},
            {"traceCatalog", !orchestrator_.TraceCatalog().Algorithms().empty()},
            {"benchmarkCatalog", !orchestrator_.Routines().Routines().empty()}
        };

        bool healthy = true;
        for (const auto& check : checks.items()) {
            healthy = healthy && check.value().get<bool>();
        }

        json body = {
            {"status", healthy ? "ok" : "degraded"},
            {"service", kEngineName},
            {"uptimeMs", uptime.count()},
            {"uptimeSeconds", (uptime.count() + 500) / 1000},
            {"timestamp", StringUtils::FormatIso8601(std::chrono::system_clock::now())},
            {"checks", std::move(checks)}
        };
        return {200, std::move(body)};
    });
}

// ============================================================================
// DISPATCH
// ============================================================================

ApiResponse ApiService::Dispatch(const std::string& route, const json& body) const {
    auto name = NormalizeRoute(route);

    if (name == "execute") {
        return HandleExecute(body);
    }
    if (name == "benchmark") {
        return HandleBenchmark(body);
    }
    if (name == "info") {
        return HandleInfo();
    }
    if (name == "health") {
        return HandleHealth();
    }

    spdlog::debug("Unknown route '{}'", route);
    return Error(ErrorKind::VALIDATION_ERROR, "Unknown route '" + name + "'.");
}

ApiResponse ApiService::DispatchRaw(const std::string& route, const std::string& raw_body) const {
    json body;
    if (!StringUtils::Trim(raw_body).empty()) {
        body = json::parse(raw_body, nullptr, false);
        if (body.is_discarded()) {
            return Error(ErrorKind::VALIDATION_ERROR, "Invalid JSON body.");
        }
    }
    return Dispatch(route, body);
}

json ApiService::HandleEnvelope(const json& envelope) const {
    json id = nullptr;
    ApiResponse response;

    if (!envelope.is_object()) {
        response = Error(ErrorKind::VALIDATION_ERROR, "Envelope must be a JSON object.");
    } else {
        if (envelope.contains("id")) {
            id = envelope["id"];
        }
        if (!envelope.contains("route") || !envelope["route"].is_string()) {
            response = Error(ErrorKind::VALIDATION_ERROR, "Envelope field 'route' must be a string.");
        } else {
            json body = envelope.contains("body") ? envelope["body"] : json(nullptr);
            response = Dispatch(envelope["route"].get<std::string>(), body);
        }
    }

    return {{"id", id}, {"status", response.status}, {"body", std::move(response.body)}};
}

std::string ApiService::HandleEnvelopeLine(const std::string& line) const {
    auto envelope = json::parse(line, nullptr, false);
    if (envelope.is_discarded()) {
        auto response = Error(ErrorKind::VALIDATION_ERROR, "Invalid JSON body.");
        json out = {{"id", nullptr}, {"status", response.status}, {"body", std::move(response.body)}};
        return out.dump(-1, ' ', false, json::error_handler_t::replace);
    }
    return HandleEnvelope(envelope).dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace api
} // namespace algoscope
