/**
 * @file request_codec.cpp
 * @brief Request parsing and response serialisation
 *
 * @date 2025
 */

#include "algoscope/api/request_codec.hpp"
#include "algoscope/core/errors.hpp"
#include "algoscope/utils/string_utils.hpp"

#include <cmath>
#include <cstdint>

using json = nlohmann::json;

namespace algoscope {
namespace api {

using core::EngineError;
using core::ErrorKind;

namespace {

constexpr const char* kLanguageMessage = "Field 'language' must be either 'javascript' or 'python'.";

[[noreturn]] void Invalid(const std::string& message) {
    throw EngineError(ErrorKind::VALIDATION_ERROR, message);
}

void RequireObject(const json& body) {
    if (!body.is_object()) {
        Invalid("Request body must be a JSON object.");
    }
}

core::Language ReadLanguage(const json& body) {
    if (!body.contains("language") || !body["language"].is_string()) {
        Invalid(kLanguageMessage);
    }
    auto language = core::ParseLanguage(body["language"].get<std::string>());
    if (!language) {
        Invalid(kLanguageMessage);
    }
    return *language;
}

std::size_t ReadCount(const json& body, const char* key) {
    const auto& value = body[key];
    if (!value.is_number_integer() || value.get<long long>() < 0) {
        Invalid(std::string("Field '") + key + "' must be a non-negative integer.");
    }
    return value.get<std::size_t>();
}

} // namespace

// ============================================================================
// PARSING
// ============================================================================

core::ExecutionRequest ParseExecuteRequest(const json& body) {
    RequireObject(body);

    core::ExecutionRequest request;

    const char* code_key = body.contains("code") ? "code" : "sourceCode";
    if (!body.contains(code_key) || !body[code_key].is_string() ||
        utils::StringUtils::Trim(body[code_key].get<std::string>()).empty()) {
        Invalid("Field 'code' is required and must be a non-empty string.");
    }
    request.source_code = body[code_key].get<std::string>();

    request.language = ReadLanguage(body);

    for (const char* key : {"algorithmId", "algoId"}) {
        if (!body.contains(key) || body[key].is_null()) {
            continue;
        }
        if (!body[key].is_string()) {
            Invalid(std::string("Field '") + key + "' must be a string.");
        }
        request.algorithm_id = body[key].get<std::string>();
        break;
    }

    if (body.contains("input")) {
        request.input = body["input"];
    }

    if (body.contains("options") && !body["options"].is_null()) {
        const auto& options = body["options"];
        if (!options.is_object()) {
            Invalid("Field 'options' must be an object.");
        }
        if (options.contains("captureTrace")) {
            if (!options["captureTrace"].is_boolean()) {
                Invalid("Field 'options.captureTrace' must be a boolean.");
            }
            request.capture_trace = options["captureTrace"].get<bool>();
        }
    }

    return request;
}

BenchmarkRequest ParseBenchmarkRequest(const json& body) {
    RequireObject(body);

    BenchmarkRequest request;

    if (!body.contains("algorithmId") || !body["algorithmId"].is_string() ||
        body["algorithmId"].get<std::string>().empty()) {
        Invalid("Field 'algorithmId' is required and must be a string.");
    }
    request.algorithm_id = body["algorithmId"].get<std::string>();
    request.language = ReadLanguage(body);

    auto& overrides = request.overrides;

    if (body.contains("sizes") && !body["sizes"].is_null()) {
        const auto& sizes = body["sizes"];
        if (!sizes.is_array()) {
            Invalid("Field 'sizes' must be an array of positive integers.");
        }
        std::vector<std::size_t> values;
        for (const auto& size : sizes) {
            if (!size.is_number_integer() || size.get<long long>() <= 0) {
                Invalid("Field 'sizes' must be an array of positive integers.");
            }
            values.push_back(size.get<std::size_t>());
        }
        overrides.sizes = std::move(values);
    }

    if (body.contains("warmupIterations")) {
        overrides.warmup_iterations = ReadCount(body, "warmupIterations");
    }
    if (body.contains("maxIterations")) {
        overrides.max_iterations = ReadCount(body, "maxIterations");
    }
    if (body.contains("minDurationMs")) {
        if (!body["minDurationMs"].is_number()) {
            Invalid("Field 'minDurationMs' must be a number.");
        }
        overrides.min_duration_ms = body["minDurationMs"].get<double>();
    }

    return request;
}

// ============================================================================
// SERIALISATION
// ============================================================================

json NumberToJson(double value) {
    constexpr double kMaxExact = 9007199254740992.0;  // 2^53
    if (std::isfinite(value) && std::trunc(value) == value && std::fabs(value) <= kMaxExact) {
        return static_cast<std::int64_t>(value);
    }
    if (!std::isfinite(value)) {
        return nullptr;
    }
    return value;
}

json ToJson(const core::TraceStep& step) {
    json j = {
        {"step", step.step},
        {"currentLine", step.current_line},
        {"description", step.description}
    };

    if (step.array_snapshot) {
        json snapshot = json::array();
        for (double value : *step.array_snapshot) {
            snapshot.push_back(NumberToJson(value));
        }
        j["arraySnapshot"] = std::move(snapshot);
    }
    if (step.highlighted_indices) {
        j["highlightedIndices"] = *step.highlighted_indices;
    }
    return j;
}

json ToJson(const core::ExecutionResult& result) {
    json trace = json::array();
    for (const auto& step : result.trace) {
        trace.push_back(ToJson(step));
    }

    return {
        {"success", result.success},
        {"stdout", result.stdout_text},
        {"stderr", result.stderr_text},
        {"durationMs", result.duration_ms},
        {"trace", std::move(trace)}
    };
}

json ToJson(const core::BenchmarkPoint& point) {
    return {
        {"inputSize", point.input_size},
        {"iterations", point.iterations},
        {"totalDurationMs", point.total_duration_ms},
        {"durationMs", point.AverageMs()}
    };
}

json ToJson(const core::BenchmarkSummary& summary) {
    return {
        {"label", summary.label},
        {"totalIterations", summary.total_iterations},
        {"totalDurationMs", summary.total_duration_ms},
        {"minAvgMs", summary.min_avg_ms},
        {"maxAvgMs", summary.max_avg_ms}
    };
}

json ErrorBody(ErrorKind kind, const std::string& message, const json& details) {
    json j = {
        {"ok", false},
        {"error", core::ToString(kind)},
        {"message", message}
    };
    if (!details.is_null()) {
        j["details"] = details;
    }
    return j;
}

json ToJson(const core::ExecuteResponse& response) {
    if (!response.ok) {
        auto kind = response.error_kind.value_or(ErrorKind::INTERNAL_FAULT);
        json details = response.details;
        if (response.partial_result) {
            if (!details.is_object()) {
                details = json::object();
            }
            details["result"] = ToJson(*response.partial_result);
        }
        auto body = ErrorBody(kind, response.error_message, details);
        if (!response.warnings.empty()) {
            body["warnings"] = response.warnings;
        }
        return body;
    }

    json j = {
        {"ok", true},
        {"language", core::ToString(response.language)},
        {"algorithmId", response.algorithm_id ? json(*response.algorithm_id) : json(nullptr)},
        {"result", response.result ? ToJson(*response.result) : json(nullptr)}
    };
    if (!response.warnings.empty()) {
        j["warnings"] = response.warnings;
    }
    return j;
}

json ToJson(const core::BenchmarkResponse& response) {
    if (!response.ok) {
        auto kind = response.error_kind.value_or(ErrorKind::INTERNAL_FAULT);
        return ErrorBody(kind, response.error_message, {
            {"algorithmId", response.algorithm_id},
            {"language", core::ToString(response.language)}
        });
    }

    json points = json::array();
    for (const auto& point : response.summary.points) {
        points.push_back(ToJson(point));
    }

    json result = {
        {"algorithmId", response.algorithm_id},
        {"language", core::ToString(response.language)},
        {"createdAt", utils::StringUtils::FormatIso8601(response.created_at)},
        {"points", std::move(points)},
        {"summary", ToJson(response.summary)}
    };
    if (response.notes) {
        result["notes"] = *response.notes;
    }

    return {{"ok", true}, {"result", std::move(result)}};
}

} // namespace api
} // namespace algoscope
