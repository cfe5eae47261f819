/**
 * @file api_service.hpp
 * @brief Route handlers on top of the request orchestrator
 *
 * Maps the four routes (execute, benchmark, info, health) to orchestrator
 * calls and every outcome to a status code and JSON body:
 * - 400: validation failures, including an unparsable body
 * - 200: success, and ok:false bodies for timeouts, runtime faults and
 *   unsupported languages
 * - 500: internal faults, with a generic message
 *
 * The transport (CLI, line-delimited serve loop) lives in the application.
 *
 * @date 2025
 */

#pragma once

#include "algoscope/benchmark/benchmark_harness.hpp"
#include "algoscope/core/request_orchestrator.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace algoscope {
namespace api {

constexpr const char* kEngineName = "algoscope";
constexpr const char* kEngineVersion = "1.0.0";

/**
 * @struct ApiResponse
 * @brief Status code + JSON body
 */
struct ApiResponse {
    int status{200};
    nlohmann::json body;
};

/**
 * @class ApiService
 * @brief Stateless route dispatcher
 *
 * **Usage Example**:
 * @code
 * ApiService service(orchestrator);
 * auto response = service.DispatchRaw("execute",
 *     R"({"language":"javascript","code":"print('hi')"})");
 * // response.status == 200, response.body["result"]["stdout"] == "hi\n"
 * @endcode
 */
class ApiService {
public:
    explicit ApiService(const core::RequestOrchestrator& orchestrator);

    ApiResponse HandleExecute(const nlohmann::json& body) const;
    ApiResponse HandleBenchmark(const nlohmann::json& body,
                                const benchmark::CancellationToken* cancel = nullptr) const;
    ApiResponse HandleInfo() const;
    ApiResponse HandleHealth() const;

    /**
     * @brief Route by name ("execute", "/api/execute", ...)
     */
    ApiResponse Dispatch(const std::string& route, const nlohmann::json& body) const;

    /**
     * @brief Dispatch() with an unparsed body; invalid JSON yields 400
     */
    ApiResponse DispatchRaw(const std::string& route, const std::string& raw_body) const;

    /**
     * @brief Handle one serve envelope `{id, route, body}`
     * @return `{id, status, body}`
     */
    nlohmann::json HandleEnvelope(const nlohmann::json& envelope) const;

    /// HandleEnvelope() for one raw input line
    std::string HandleEnvelopeLine(const std::string& line) const;

private:
    ApiResponse Guard(const char* route, const std::function<ApiResponse()>& handler) const;

    const core::RequestOrchestrator& orchestrator_;
};

} // namespace api
} // namespace algoscope
