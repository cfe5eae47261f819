/**
 * @file request_orchestrator.hpp
 * @brief Per-request pipeline: validate, execute, trace, assemble
 *
 * Owns the sandbox, the trace emitter, the benchmark harness and the two
 * catalogs. Every failure that leaves the orchestrator is classified as one
 * core::ErrorKind; trace generation is the only stage allowed to degrade
 * instead of failing.
 *
 * @date 2025
 */

#pragma once

#include "algoscope/benchmark/benchmark_harness.hpp"
#include "algoscope/benchmark/routine_catalog.hpp"
#include "algoscope/core/errors.hpp"
#include "algoscope/core/types.hpp"
#include "algoscope/sandbox/sandbox_engine.hpp"
#include "algoscope/trace/synthetic_traces.hpp"
#include "algoscope/trace/trace_emitter.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace algoscope {
namespace core {

/**
 * @enum RequestPhase
 * @brief Stages of one execute request
 *
 * VALIDATING -> EXECUTING -> TRACING -> ASSEMBLING -> DONE.
 * FAILED is absorbing and reachable from every stage.
 */
enum class RequestPhase {
    VALIDATING,   ///< Field and limit checks, no resources spent
    EXECUTING,    ///< Program running in the sandbox
    TRACING,      ///< Synthetic or instrumented trace generation
    ASSEMBLING,   ///< Building the immutable result
    DONE,         ///< Result available
    FAILED        ///< Classified error available
};

std::string ToString(RequestPhase phase);

/**
 * @struct ExecuteResponse
 * @brief Outcome of one execute request
 *
 * Exactly one of @c result (ok) or @c error_kind (not ok) is set. A runtime
 * fault additionally carries the partial result in @c details.
 */
struct ExecuteResponse {
    bool ok{false};
    Language language{Language::JAVASCRIPT};
    std::optional<std::string> algorithm_id;
    std::shared_ptr<const ExecutionResult> result;   ///< Set when ok
    std::vector<std::string> warnings;

    std::optional<ErrorKind> error_kind;             ///< Set when !ok
    std::string error_message;
    nlohmann::json details;                          ///< Null when absent
    std::shared_ptr<const ExecutionResult> partial_result;  ///< Timeouts and runtime faults

    int http_status{200};
    std::vector<RequestPhase> phases;                ///< Visited stages, in order
};

/**
 * @struct BenchmarkOverrides
 * @brief Per-request changes to the sampling policy
 */
struct BenchmarkOverrides {
    std::optional<std::vector<std::size_t>> sizes;
    std::optional<std::size_t> warmup_iterations;
    std::optional<double> min_duration_ms;
    std::optional<std::size_t> max_iterations;
};

/**
 * @struct BenchmarkResponse
 * @brief Outcome of one benchmark request
 */
struct BenchmarkResponse {
    bool ok{false};
    std::string algorithm_id;
    Language language{Language::JAVASCRIPT};
    std::chrono::system_clock::time_point created_at;
    BenchmarkSummary summary;                        ///< Empty points when nothing was measured
    std::optional<std::string> notes;

    std::optional<ErrorKind> error_kind;
    std::string error_message;
    int http_status{200};
};

/**
 * @class RequestOrchestrator
 * @brief Front door of the engine
 *
 * **Thread Safety**: after Initialize() every public method is const and may
 * be called concurrently. Each execute request gets its own child process.
 *
 * **Usage Example**:
 * @code
 * RequestOrchestrator orchestrator;
 * orchestrator.Initialize();
 *
 * ExecutionRequest request;
 * request.source_code = "print('hi')";
 * auto response = orchestrator.Execute(request);
 * // response.ok, response.result->stdout_text == "hi\n"
 * @endcode
 */
class RequestOrchestrator {
public:
    /**
     * @struct Config
     * @brief Engine-level configuration
     */
    struct Config {
        sandbox::SandboxConfig sandbox;
        trace::TraceEmitterConfig trace;
        benchmark::BenchmarkConfig benchmark;

        std::size_t max_source_bytes{64 * 1024};   ///< Largest accepted program
        std::size_t max_benchmark_sizes{16};       ///< Entries in a sizes override
        std::size_t max_input_size{10000};         ///< Largest benchmark input size
        bool verbose_logging{false};
    };

    RequestOrchestrator();
    explicit RequestOrchestrator(const Config& config);
    ~RequestOrchestrator();

    RequestOrchestrator(const RequestOrchestrator&) = delete;
    RequestOrchestrator& operator=(const RequestOrchestrator&) = delete;

    /**
     * @brief Build the sandbox and catalogs, validate runtimes
     * @return false if the sandbox configuration is unusable
     */
    bool Initialize();

    bool IsInitialized() const { return initialized_; }

    /**
     * @brief Run one execute request through the full pipeline
     *
     * Never throws for request-level failures; they are reported on the
     * response. Throws std::runtime_error if not initialized.
     */
    ExecuteResponse Execute(const ExecutionRequest& request) const;

    /**
     * @brief Execute() on its own worker thread
     */
    std::future<ExecuteResponse> ExecuteAsync(ExecutionRequest request) const;

    /**
     * @brief Benchmark a cataloged routine
     *
     * An unknown algorithm or a language other than javascript yields an ok
     * response with no points and an explanatory note.
     */
    BenchmarkResponse RunBenchmark(const std::string& algorithm_id,
                                   Language language,
                                   const BenchmarkOverrides& overrides = BenchmarkOverrides{},
                                   const benchmark::CancellationToken* cancel = nullptr) const;

    const Config& GetConfig() const { return config_; }
    const sandbox::SandboxEngine& Sandbox() const;
    const trace::SyntheticTraceCatalog& TraceCatalog() const { return trace_catalog_; }
    const benchmark::RoutineCatalog& Routines() const { return routines_; }

    /// Time since construction
    std::chrono::milliseconds Uptime() const;

private:
    void Validate(const ExecutionRequest& request) const;
    benchmark::BenchmarkConfig ResolveBenchmarkConfig(const BenchmarkOverrides& overrides) const;
    std::vector<std::size_t> ResolveSizes(const BenchmarkOverrides& overrides,
                                          const benchmark::BenchmarkRoutine& routine) const;

    void Fail(ExecuteResponse& response, ErrorKind kind, const std::string& message) const;

    Config config_;
    std::chrono::steady_clock::time_point started_at_;

    std::unique_ptr<sandbox::SandboxEngine> sandbox_;
    trace::SyntheticTraceCatalog trace_catalog_;
    benchmark::RoutineCatalog routines_;
    std::unique_ptr<trace::TraceEmitter> emitter_;

    std::atomic<bool> initialized_{false};
};

} // namespace core
} // namespace algoscope
