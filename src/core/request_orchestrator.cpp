/**
 * @file request_orchestrator.cpp
 * @brief Request pipeline and failure classification
 *
 * **Execute Pipeline**:
 * ```
 * VALIDATING → code present, size limit, language has a runner
 * EXECUTING  → one sandboxed interpreter process
 * TRACING    → synthetic (catalog id) or instrumented (trace() hook)
 * ASSEMBLING → immutable ExecutionResult
 * DONE
 * ```
 * Any stage may move to FAILED with exactly one ErrorKind. Tracing never
 * fails a request; it degrades to an empty trace and a warning.
 *
 * @date 2025
 */

#include "algoscope/core/request_orchestrator.hpp"
#include "algoscope/sandbox/sandbox_outcome.hpp"
#include "algoscope/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <sstream>

using json = nlohmann::json;

namespace algoscope {
namespace core {

using utils::StringUtils;

namespace {

constexpr const char* kInternalFaultMessage = "Internal error while executing code.";
constexpr const char* kInternalBenchmarkMessage = "Internal error while running benchmark.";

constexpr std::size_t kMaxWarmupIterations = 1000;
constexpr std::size_t kMaxIterationsOverride = 1000000;
constexpr double kMaxMinDurationMs = 10000.0;

/// Result of a run that did not complete: output so far, message appended to stderr
std::shared_ptr<ExecutionResult> PartialResult(const std::string& stdout_text,
                                               const std::string& stderr_text,
                                               const std::string& message,
                                               double duration_ms) {
    auto partial = std::make_shared<ExecutionResult>();
    partial->success = false;
    partial->stdout_text = stdout_text;
    partial->stderr_text = stderr_text;
    if (!partial->stderr_text.empty() && partial->stderr_text.back() != '\n') {
        partial->stderr_text += '\n';
    }
    partial->stderr_text += message;
    partial->duration_ms = duration_ms;
    return partial;
}

} // namespace

std::string ToString(RequestPhase phase) {
    switch (phase) {
        case RequestPhase::VALIDATING: return "validating";
        case RequestPhase::EXECUTING:  return "executing";
        case RequestPhase::TRACING:    return "tracing";
        case RequestPhase::ASSEMBLING: return "assembling";
        case RequestPhase::DONE:       return "done";
        case RequestPhase::FAILED:     return "failed";
    }
    return "failed";
}

// Constructor
RequestOrchestrator::RequestOrchestrator()
    : RequestOrchestrator(Config{}) {}

RequestOrchestrator::RequestOrchestrator(const Config& config)
    : config_(config)
    , started_at_(std::chrono::steady_clock::now()) {

    if (config_.verbose_logging) {
        spdlog::set_level(spdlog::level::debug);
        config_.sandbox.verbose_logging = true;
    }
}

// Destructor
RequestOrchestrator::~RequestOrchestrator() {
    if (initialized_) {
        spdlog::debug("Request orchestrator shut down");
    }
}

bool RequestOrchestrator::Initialize() {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("INITIALIZING ALGOSCOPE ENGINE");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    try {
        spdlog::debug("Initializing Sandbox Engine...");
        auto sandbox = std::make_unique<sandbox::SandboxEngine>(config_.sandbox);
        if (!sandbox->Initialize()) {
            spdlog::error("Failed to initialize Sandbox Engine");
            return false;
        }

        spdlog::debug("Loading catalogs...");
        trace_catalog_ = trace::SyntheticTraceCatalog::CreateDefault();
        routines_ = benchmark::RoutineCatalog::CreateDefault();

        sandbox_ = std::move(sandbox);
        emitter_ = std::make_unique<trace::TraceEmitter>(trace_catalog_, config_.trace);

        spdlog::info("Trace algorithms:   {}", StringUtils::Join(trace_catalog_.Ids(), ", "));
        spdlog::info("Benchmark routines: {}", StringUtils::Join(routines_.Ids(), ", "));
        spdlog::info("Source limit:       {} bytes", config_.max_source_bytes);

        initialized_ = true;

        spdlog::info("═══════════════════════════════════════════════════════════════");
        spdlog::info("✓ Algoscope engine initialized successfully");
        spdlog::info("═══════════════════════════════════════════════════════════════");
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to initialize engine: {}", e.what());
        return false;
    }
}

const sandbox::SandboxEngine& RequestOrchestrator::Sandbox() const {
    if (!sandbox_) {
        throw std::runtime_error("Request orchestrator not initialized");
    }
    return *sandbox_;
}

std::chrono::milliseconds RequestOrchestrator::Uptime() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at_);
}

// ============================================================================
// EXECUTE
// ============================================================================

void RequestOrchestrator::Validate(const ExecutionRequest& request) const {
    if (StringUtils::Trim(request.source_code).empty()) {
        throw EngineError(ErrorKind::VALIDATION_ERROR,
                          "Field 'code' is required and must be a non-empty string.");
    }
    if (request.source_code.size() > config_.max_source_bytes) {
        throw EngineError(ErrorKind::VALIDATION_ERROR,
                          "Field 'code' exceeds the limit of " +
                          std::to_string(config_.max_source_bytes) + " bytes.");
    }

    const auto* runtime = sandbox_->Runtimes().Find(request.language);
    if (runtime == nullptr || !runtime->supported) {
        throw EngineError(ErrorKind::UNSUPPORTED_LANGUAGE,
                          runtime != nullptr ? runtime->unsupported_reason
                                             : "Language '" + ToString(request.language) + "' has no runner.");
    }
}

void RequestOrchestrator::Fail(ExecuteResponse& response, ErrorKind kind, const std::string& message) const {
    response.ok = false;
    response.error_kind = kind;
    response.error_message = message;
    response.http_status = HttpStatusFor(kind);
    response.result.reset();
    response.phases.push_back(RequestPhase::FAILED);
}

ExecuteResponse RequestOrchestrator::Execute(const ExecutionRequest& request) const {
    if (!initialized_) {
        throw std::runtime_error("Request orchestrator not initialized");
    }

    ExecuteResponse response;
    response.language = request.language;
    response.algorithm_id = request.algorithm_id;

    // VALIDATING
    response.phases.push_back(RequestPhase::VALIDATING);
    try {
        Validate(request);
    }
    catch (const EngineError& e) {
        spdlog::debug("Request rejected ({}): {}", ToString(e.Kind()), e.what());
        Fail(response, e.Kind(), e.what());
        if (e.Kind() == ErrorKind::UNSUPPORTED_LANGUAGE) {
            response.details = {
                {"language", ToString(request.language)},
                {"algorithmId", request.algorithm_id ? json(*request.algorithm_id) : json(nullptr)},
                {"hasInput", !request.input.is_null()}
            };
        }
        return response;
    }

    if (!request.capture_trace) {
        response.warnings.push_back(
            "captureTrace=false is currently ignored; trace generation is controlled by algorithmId.");
    }

    // EXECUTING
    response.phases.push_back(RequestPhase::EXECUTING);
    sandbox::SandboxOutcome outcome;
    try {
        outcome = sandbox_->Execute(request.language, request.source_code, request.input);
    }
    catch (const EngineError& e) {
        spdlog::warn("Sandbox rejected request: {}", e.what());
        Fail(response, e.Kind(), e.Kind() == ErrorKind::INTERNAL_FAULT ? kInternalFaultMessage : e.what());
        return response;
    }
    catch (const std::exception& e) {
        spdlog::error("Sandbox failure: {}", e.what());
        Fail(response, ErrorKind::INTERNAL_FAULT, kInternalFaultMessage);
        return response;
    }

    if (const auto* timed_out = std::get_if<sandbox::TimedOut>(&outcome)) {
        spdlog::debug("Execution timed out after {:.1f}ms", timed_out->elapsed_ms);
        const auto message =
            "Execution timed out after " + std::to_string(config_.sandbox.timeout.count()) + " ms.";
        Fail(response, ErrorKind::TIMEOUT_ERROR, message);
        response.details = {
            {"timeoutMs", config_.sandbox.timeout.count()},
            {"elapsedMs", timed_out->elapsed_ms}
        };
        response.partial_result = PartialResult(timed_out->stdout_text, timed_out->stderr_text,
                                                message, timed_out->elapsed_ms);
        return response;
    }

    if (const auto* faulted = std::get_if<sandbox::Faulted>(&outcome)) {
        if (!sandbox::IsUserFault(faulted->kind)) {
            spdlog::error("Interpreter launch failed: {}", faulted->message);
            Fail(response, ErrorKind::INTERNAL_FAULT, kInternalFaultMessage);
            return response;
        }

        spdlog::debug("Execution faulted ({}): {}", sandbox::ToString(faulted->kind), faulted->message);
        Fail(response, ErrorKind::RUNTIME_FAULT, faulted->message);
        response.details = {{"fault", sandbox::ToString(faulted->kind)}};
        response.partial_result = PartialResult(faulted->stdout_text, faulted->stderr_text,
                                                faulted->message, faulted->duration_ms);
        return response;
    }

    const auto& completed = std::get<sandbox::Completed>(outcome);

    // TRACING
    response.phases.push_back(RequestPhase::TRACING);
    std::vector<TraceStep> steps;
    try {
        auto emission = emitter_->Emit(request.algorithm_id, request.input,
                                       completed.hook_records, completed.hook_truncated);
        steps = std::move(emission.steps);
        response.warnings.insert(response.warnings.end(),
                                 emission.warnings.begin(), emission.warnings.end());
    }
    catch (const std::exception& e) {
        spdlog::warn("Trace generation failed: {}", e.what());
        steps.clear();
        response.warnings.push_back(
            "Trace generation failed (" + StringUtils::Truncate(StringUtils::FirstLine(e.what()), 200) +
            "); returning an empty trace.");
    }

    // ASSEMBLING
    response.phases.push_back(RequestPhase::ASSEMBLING);
    auto result = std::make_shared<ExecutionResult>();
    result->success = true;
    result->stdout_text = completed.stdout_text;
    result->stderr_text = completed.stderr_text;
    result->duration_ms = completed.duration_ms;
    result->trace = std::move(steps);

    response.ok = true;
    response.result = std::move(result);
    response.http_status = 200;
    response.phases.push_back(RequestPhase::DONE);

    spdlog::debug("Execution done in {:.2f}ms, {} trace step(s), {} warning(s)",
                  response.result->duration_ms, response.result->trace.size(), response.warnings.size());
    return response;
}

std::future<ExecuteResponse> RequestOrchestrator::ExecuteAsync(ExecutionRequest request) const {
    return std::async(std::launch::async, [this, request = std::move(request)]() {
        return Execute(request);
    });
}

// ============================================================================
// BENCHMARK
// ============================================================================

benchmark::BenchmarkConfig RequestOrchestrator::ResolveBenchmarkConfig(const BenchmarkOverrides& overrides) const {
    auto config = config_.benchmark;

    if (overrides.warmup_iterations) {
        if (*overrides.warmup_iterations > kMaxWarmupIterations) {
            throw EngineError(ErrorKind::VALIDATION_ERROR,
                              "Field 'warmupIterations' must be at most " +
                              std::to_string(kMaxWarmupIterations) + ".");
        }
        config.warmup_iterations = *overrides.warmup_iterations;
    }
    if (overrides.min_duration_ms) {
        double value = *overrides.min_duration_ms;
        if (!std::isfinite(value) || value < 0.0 || value > kMaxMinDurationMs) {
            throw EngineError(ErrorKind::VALIDATION_ERROR,
                              "Field 'minDurationMs' must be between 0 and " +
                              StringUtils::FormatNumber(kMaxMinDurationMs) + ".");
        }
        config.min_duration_ms = value;
    }
    if (overrides.max_iterations) {
        if (*overrides.max_iterations > kMaxIterationsOverride) {
            throw EngineError(ErrorKind::VALIDATION_ERROR,
                              "Field 'maxIterations' must be at most " +
                              std::to_string(kMaxIterationsOverride) + ".");
        }
        config.max_iterations = *overrides.max_iterations;
    }

    return config;
}

std::vector<std::size_t> RequestOrchestrator::ResolveSizes(const BenchmarkOverrides& overrides,
                                                           const benchmark::BenchmarkRoutine& routine) const {
    if (!overrides.sizes) {
        return routine.default_sizes;
    }

    const auto& sizes = *overrides.sizes;
    if (sizes.empty() || sizes.size() > config_.max_benchmark_sizes) {
        throw EngineError(ErrorKind::VALIDATION_ERROR,
                          "Field 'sizes' must contain between 1 and " +
                          std::to_string(config_.max_benchmark_sizes) + " entries.");
    }
    for (auto size : sizes) {
        if (size == 0 || size > config_.max_input_size) {
            throw EngineError(ErrorKind::VALIDATION_ERROR,
                              "Every entry of 'sizes' must be between 1 and " +
                              std::to_string(config_.max_input_size) + ".");
        }
    }
    return sizes;
}

BenchmarkResponse RequestOrchestrator::RunBenchmark(const std::string& algorithm_id,
                                                    Language language,
                                                    const BenchmarkOverrides& overrides,
                                                    const benchmark::CancellationToken* cancel) const {
    if (!initialized_) {
        throw std::runtime_error("Request orchestrator not initialized");
    }

    BenchmarkResponse response;
    response.algorithm_id = algorithm_id;
    response.language = language;
    response.created_at = std::chrono::system_clock::now();
    response.summary.label = algorithm_id;

    auto fail = [&response](ErrorKind kind, const std::string& message) {
        response.ok = false;
        response.error_kind = kind;
        response.error_message = message;
        response.http_status = HttpStatusFor(kind);
        return response;
    };

    const auto* routine = routines_.Find(algorithm_id);
    if (routine == nullptr || language != Language::JAVASCRIPT) {
        response.ok = true;
        response.notes = "Benchmarks are only implemented for " +
                         StringUtils::Join(routines_.Ids(), ", ") +
                         " in JavaScript. Other algorithms/languages currently return an empty dataset.";
        spdlog::debug("No benchmark for '{}' ({})", algorithm_id, ToString(language));
        return response;
    }

    try {
        auto config = ResolveBenchmarkConfig(overrides);
        auto sizes = ResolveSizes(overrides, *routine);

        spdlog::info("Benchmarking '{}' over {} size(s)", algorithm_id, sizes.size());

        benchmark::BenchmarkHarness harness(config);
        response.summary = harness.Run(routine->id, sizes, routine->generator, routine->routine, cancel);

        std::ostringstream notes;
        notes << "Native benchmark of the reference " << routine->name
              << " implementation (" << routine->complexity << "); "
              << config.warmup_iterations << " warmup iteration(s) per size.";
        response.notes = notes.str();
        response.ok = true;
        response.http_status = 200;

        spdlog::info("Benchmark '{}' finished: {} iterations, {:.2f}ms total",
                     algorithm_id, response.summary.total_iterations, response.summary.total_duration_ms);
        return response;
    }
    catch (const benchmark::BenchmarkCancelled& e) {
        spdlog::warn("Benchmark '{}' cancelled: {}", algorithm_id, e.what());
        return fail(e.Kind(), e.what());
    }
    catch (const benchmark::BenchmarkFault& e) {
        spdlog::error("Benchmark '{}' failed: {}", algorithm_id, e.what());
        return fail(e.Kind(), e.what());
    }
    catch (const EngineError& e) {
        if (e.Kind() == ErrorKind::INTERNAL_FAULT) {
            spdlog::error("Benchmark '{}' internal fault: {}", algorithm_id, e.what());
            return fail(e.Kind(), kInternalBenchmarkMessage);
        }
        return fail(e.Kind(), e.what());
    }
    catch (const std::exception& e) {
        spdlog::error("Benchmark '{}' internal fault: {}", algorithm_id, e.what());
        return fail(ErrorKind::INTERNAL_FAULT, kInternalBenchmarkMessage);
    }
}

} // namespace core
} // namespace algoscope
