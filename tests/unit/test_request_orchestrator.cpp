/**
 * @file test_request_orchestrator.cpp
 * @brief Unit tests for the execute and benchmark pipelines
 */

#include "algoscope/core/request_orchestrator.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include <unistd.h>

using namespace algoscope;
using namespace algoscope::core;
using json = nlohmann::json;

namespace {

bool NodeAvailable() {
    return ::access(ALGOSCOPE_DEFAULT_NODE_BINARY, X_OK) == 0;
}

ExecutionRequest JavascriptRequest(const std::string& code) {
    ExecutionRequest request;
    request.language = Language::JAVASCRIPT;
    request.source_code = code;
    return request;
}

BenchmarkOverrides QuickOverrides(std::vector<std::size_t> sizes) {
    BenchmarkOverrides overrides;
    overrides.sizes = std::move(sizes);
    overrides.warmup_iterations = 1;
    overrides.min_duration_ms = 1.0;
    overrides.max_iterations = 10;
    return overrides;
}

} // namespace

class RequestOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        RequestOrchestrator::Config config;
        config.sandbox.timeout = std::chrono::milliseconds(3000);
        config.benchmark.seed = 11;
        orchestrator_ = std::make_unique<RequestOrchestrator>(config);
        ASSERT_TRUE(orchestrator_->Initialize());
    }

    std::unique_ptr<RequestOrchestrator> orchestrator_;
};

class OrchestratorExecutionTest : public RequestOrchestratorTest {
protected:
    void SetUp() override {
        if (!NodeAvailable()) {
            GTEST_SKIP() << "node interpreter not available at " << ALGOSCOPE_DEFAULT_NODE_BINARY;
        }
        RequestOrchestratorTest::SetUp();
    }
};

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(RequestOrchestratorTest, UninitializedOrchestratorRefusesWork) {
    RequestOrchestrator orchestrator;
    EXPECT_FALSE(orchestrator.IsInitialized());
    EXPECT_THROW(orchestrator.Execute(JavascriptRequest("print(1)")), std::runtime_error);
    EXPECT_THROW(orchestrator.RunBenchmark("bubble-sort", Language::JAVASCRIPT), std::runtime_error);
    EXPECT_THROW(orchestrator.Sandbox(), std::runtime_error);
}

TEST_F(RequestOrchestratorTest, InitializeFailsForUnusableSandboxLimits) {
    RequestOrchestrator::Config config;
    config.sandbox.resource_limits.max_heap_mb = 4;
    RequestOrchestrator orchestrator(config);
    EXPECT_FALSE(orchestrator.Initialize());
    EXPECT_FALSE(orchestrator.IsInitialized());
}

TEST_F(RequestOrchestratorTest, InitializedOrchestratorExposesCatalogs) {
    EXPECT_TRUE(orchestrator_->IsInitialized());
    EXPECT_TRUE(orchestrator_->TraceCatalog().Contains("bfs"));
    EXPECT_TRUE(orchestrator_->Routines().Contains("binary-search"));
    EXPECT_GE(orchestrator_->Uptime().count(), 0);
}

TEST_F(RequestOrchestratorTest, PhaseNames) {
    EXPECT_EQ(ToString(RequestPhase::VALIDATING), "validating");
    EXPECT_EQ(ToString(RequestPhase::ASSEMBLING), "assembling");
    EXPECT_EQ(ToString(RequestPhase::FAILED), "failed");
}

// ============================================================================
// Execute validation
// ============================================================================

TEST_F(RequestOrchestratorTest, BlankCodeIsAValidationError) {
    for (const char* code : {"", "   \n\t"}) {
        auto response = orchestrator_->Execute(JavascriptRequest(code));

        EXPECT_FALSE(response.ok);
        ASSERT_TRUE(response.error_kind.has_value());
        EXPECT_EQ(*response.error_kind, ErrorKind::VALIDATION_ERROR);
        EXPECT_EQ(response.http_status, 400);
        EXPECT_EQ(response.error_message, "Field 'code' is required and must be a non-empty string.");
        EXPECT_EQ(response.result, nullptr);
        EXPECT_EQ(response.phases, (std::vector<RequestPhase>{RequestPhase::VALIDATING, RequestPhase::FAILED}));
    }
}

TEST_F(RequestOrchestratorTest, OversizedCodeIsAValidationError) {
    RequestOrchestrator::Config config;
    config.max_source_bytes = 16;
    RequestOrchestrator orchestrator(config);
    ASSERT_TRUE(orchestrator.Initialize());

    auto response = orchestrator.Execute(JavascriptRequest(std::string(17, 'x')));
    EXPECT_EQ(response.error_kind, ErrorKind::VALIDATION_ERROR);
    EXPECT_EQ(response.error_message, "Field 'code' exceeds the limit of 16 bytes.");
}

TEST_F(RequestOrchestratorTest, PythonIsUnsupportedWithDetails) {
    ExecutionRequest request;
    request.language = Language::PYTHON;
    request.source_code = "print('hi')";
    request.algorithm_id = "bubble-sort";
    request.input = json::array({3, 1, 2});

    auto response = orchestrator_->Execute(request);

    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.error_kind, ErrorKind::UNSUPPORTED_LANGUAGE);
    EXPECT_EQ(response.http_status, 200);
    EXPECT_EQ(response.error_message, "Python execution is not implemented yet. Use JavaScript for now.");
    EXPECT_EQ(response.details["language"], "python");
    EXPECT_EQ(response.details["algorithmId"], "bubble-sort");
    EXPECT_EQ(response.details["hasInput"], true);
    EXPECT_EQ(response.phases.back(), RequestPhase::FAILED);
}

TEST_F(RequestOrchestratorTest, LaunchFailureIsAnInternalFault) {
    RequestOrchestrator::Config config;
    config.sandbox.node_binary = "/nonexistent/algoscope/node";
    RequestOrchestrator orchestrator(config);
    ASSERT_TRUE(orchestrator.Initialize());

    auto response = orchestrator.Execute(JavascriptRequest("print('hi')"));
    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.error_kind, ErrorKind::INTERNAL_FAULT);
    EXPECT_EQ(response.http_status, 500);
    EXPECT_EQ(response.error_message, "Internal error while executing code.");
    EXPECT_EQ(response.partial_result, nullptr);
}

// ============================================================================
// Execute pipeline
// ============================================================================

TEST_F(OrchestratorExecutionTest, SuccessfulRunVisitsEveryPhase) {
    auto response = orchestrator_->Execute(JavascriptRequest("print(\"hi\")"));

    ASSERT_TRUE(response.ok) << response.error_message;
    ASSERT_NE(response.result, nullptr);
    EXPECT_TRUE(response.result->success);
    EXPECT_EQ(response.result->stdout_text, "hi\n");
    EXPECT_TRUE(response.result->trace.empty());
    EXPECT_TRUE(response.warnings.empty());
    EXPECT_FALSE(response.error_kind.has_value());
    EXPECT_EQ(response.phases,
              (std::vector<RequestPhase>{RequestPhase::VALIDATING, RequestPhase::EXECUTING,
                                         RequestPhase::TRACING, RequestPhase::ASSEMBLING,
                                         RequestPhase::DONE}));
}

TEST_F(OrchestratorExecutionTest, CatalogAlgorithmGetsReferenceTrace) {
    auto request = JavascriptRequest("print('sorting')");
    request.algorithm_id = "bubble-sort";
    request.input = json::array({5, 1, 4, 2});

    auto response = orchestrator_->Execute(request);
    ASSERT_TRUE(response.ok) << response.error_message;

    const auto& trace = response.result->trace;
    ASSERT_FALSE(trace.empty());
    EXPECT_EQ(*trace.front().array_snapshot, (std::vector<double>{5, 1, 4, 2}));
    EXPECT_EQ(*trace.back().array_snapshot, (std::vector<double>{1, 2, 4, 5}));
    ASSERT_EQ(response.warnings.size(), 1u);
}

TEST_F(OrchestratorExecutionTest, HookTraceIsUsedWithoutAlgorithm) {
    auto response = orchestrator_->Execute(
        JavascriptRequest("const a = [2, 1];\ntrace('start', a, [0]);\n[a[0], a[1]] = [a[1], a[0]];\ntrace('swapped', a, [0, 1]);"));
    ASSERT_TRUE(response.ok) << response.error_message;

    const auto& trace = response.result->trace;
    ASSERT_EQ(trace.size(), 2u);
    EXPECT_EQ(trace[0].step, 1);
    EXPECT_EQ(trace[0].current_line, 2);
    EXPECT_EQ(*trace[1].array_snapshot, (std::vector<double>{1, 2}));
}

TEST_F(OrchestratorExecutionTest, HookIndicesBeyondIntRangeAreDropped) {
    auto response = orchestrator_->Execute(
        JavascriptRequest("trace('a', [10, 20], [4294967297]);\ntrace('b', [10, 20], [1e20]);\ntrace('c', [10, 20], [1]);"));
    ASSERT_TRUE(response.ok) << response.error_message;

    const auto& trace = response.result->trace;
    ASSERT_EQ(trace.size(), 3u);
    EXPECT_FALSE(trace[0].highlighted_indices.has_value());
    EXPECT_FALSE(trace[1].highlighted_indices.has_value());
    ASSERT_TRUE(trace[2].highlighted_indices.has_value());
    EXPECT_EQ(*trace[2].highlighted_indices, (std::vector<int>{1}));

    ASSERT_EQ(response.warnings.size(), 1u);
    EXPECT_NE(response.warnings[0].find("2 trace step(s)"), std::string::npos);
}

TEST_F(OrchestratorExecutionTest, CaptureTraceFalseOnlyWarns) {
    auto request = JavascriptRequest("print(1)");
    request.capture_trace = false;

    auto response = orchestrator_->Execute(request);
    ASSERT_TRUE(response.ok);
    ASSERT_EQ(response.warnings.size(), 1u);
    EXPECT_EQ(response.warnings[0],
              "captureTrace=false is currently ignored; trace generation is controlled by algorithmId.");
}

TEST_F(OrchestratorExecutionTest, RejectedSyntheticInputDegradesToEmptyTrace) {
    auto request = JavascriptRequest("print(1)");
    request.algorithm_id = "binary-search";
    request.input = json::array({9, 3, 1});

    auto response = orchestrator_->Execute(request);
    ASSERT_TRUE(response.ok);
    EXPECT_TRUE(response.result->trace.empty());
    ASSERT_FALSE(response.warnings.empty());
    EXPECT_EQ(response.warnings.back().rfind("Trace generation failed (", 0), 0u);
}

TEST_F(OrchestratorExecutionTest, InfiniteLoopIsATimeout) {
    RequestOrchestrator::Config config;
    config.sandbox.timeout = std::chrono::milliseconds(300);
    RequestOrchestrator orchestrator(config);
    ASSERT_TRUE(orchestrator.Initialize());

    auto response = orchestrator.Execute(JavascriptRequest("print('before');\nwhile (true) {}"));
    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.error_kind, ErrorKind::TIMEOUT_ERROR);
    EXPECT_EQ(response.http_status, 200);
    EXPECT_EQ(response.error_message, "Execution timed out after 300 ms.");
    EXPECT_EQ(response.details["timeoutMs"], 300);
    EXPECT_EQ(response.result, nullptr);

    ASSERT_NE(response.partial_result, nullptr);
    EXPECT_FALSE(response.partial_result->success);
    EXPECT_EQ(response.partial_result->stdout_text, "before\n");
    EXPECT_EQ(response.partial_result->stderr_text, "Execution timed out after 300 ms.");
    EXPECT_TRUE(response.partial_result->trace.empty());
}

TEST_F(OrchestratorExecutionTest, RuntimeFaultCarriesPartialResult) {
    auto response = orchestrator_->Execute(JavascriptRequest("print('partial');\nthrow new Error('boom');"));

    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.error_kind, ErrorKind::RUNTIME_FAULT);
    EXPECT_EQ(response.error_message, "Error: boom");
    EXPECT_EQ(response.details["fault"], "RuntimeError");

    ASSERT_NE(response.partial_result, nullptr);
    EXPECT_FALSE(response.partial_result->success);
    EXPECT_EQ(response.partial_result->stdout_text, "partial\n");
    EXPECT_EQ(response.partial_result->stderr_text, "Error: boom");
    EXPECT_EQ(response.phases,
              (std::vector<RequestPhase>{RequestPhase::VALIDATING, RequestPhase::EXECUTING, RequestPhase::FAILED}));
}

TEST_F(OrchestratorExecutionTest, ConcurrentRequestsAreIndependent) {
    auto first = orchestrator_->ExecuteAsync(JavascriptRequest("print('one')"));
    auto second = orchestrator_->ExecuteAsync(JavascriptRequest("print('two')"));

    auto one = first.get();
    auto two = second.get();
    ASSERT_TRUE(one.ok);
    ASSERT_TRUE(two.ok);
    EXPECT_EQ(one.result->stdout_text, "one\n");
    EXPECT_EQ(two.result->stdout_text, "two\n");
}

// ============================================================================
// Benchmarks
// ============================================================================

TEST_F(RequestOrchestratorTest, BenchmarkReturnsOnePointPerSizeInOrder) {
    auto response = orchestrator_->RunBenchmark("bubble-sort", Language::JAVASCRIPT,
                                                QuickOverrides({8, 16, 32}));

    ASSERT_TRUE(response.ok) << response.error_message;
    ASSERT_EQ(response.summary.points.size(), 3u);
    EXPECT_EQ(response.summary.points[0].input_size, 8u);
    EXPECT_EQ(response.summary.points[1].input_size, 16u);
    EXPECT_EQ(response.summary.points[2].input_size, 32u);
    ASSERT_TRUE(response.notes.has_value());
    EXPECT_EQ(*response.notes,
              "Native benchmark of the reference Bubble Sort implementation (O(n^2)); "
              "1 warmup iteration(s) per size.");
}

TEST_F(RequestOrchestratorTest, BenchmarkUsesDefaultSizes) {
    BenchmarkOverrides overrides;
    overrides.warmup_iterations = 0;
    overrides.min_duration_ms = 0.0;
    overrides.max_iterations = 1;

    auto response = orchestrator_->RunBenchmark("binary-search", Language::JAVASCRIPT, overrides);
    ASSERT_TRUE(response.ok);
    ASSERT_EQ(response.summary.points.size(), benchmark::DefaultBenchmarkSizes().size());
    for (const auto& point : response.summary.points) {
        EXPECT_EQ(point.iterations, 1u);
    }
}

TEST_F(RequestOrchestratorTest, UnknownAlgorithmOrLanguageGivesEmptyDataset) {
    const std::string expected_notes =
        "Benchmarks are only implemented for binary-search, bubble-sort, insertion-sort, selection-sort "
        "in JavaScript. Other algorithms/languages currently return an empty dataset.";

    auto unknown = orchestrator_->RunBenchmark("bfs", Language::JAVASCRIPT);
    EXPECT_TRUE(unknown.ok);
    EXPECT_TRUE(unknown.summary.points.empty());
    EXPECT_EQ(unknown.notes, expected_notes);

    auto python = orchestrator_->RunBenchmark("bubble-sort", Language::PYTHON);
    EXPECT_TRUE(python.ok);
    EXPECT_TRUE(python.summary.points.empty());
    EXPECT_EQ(python.language, Language::PYTHON);
}

TEST_F(RequestOrchestratorTest, InvalidOverridesAreValidationErrors) {
    std::vector<BenchmarkOverrides> invalid(6);
    invalid[0].warmup_iterations = 1001;
    invalid[1].min_duration_ms = std::numeric_limits<double>::quiet_NaN();
    invalid[2].min_duration_ms = -1.0;
    invalid[3].sizes = std::vector<std::size_t>{};
    invalid[4].sizes = std::vector<std::size_t>{8, 20000};
    invalid[5].sizes = std::vector<std::size_t>(17, 8);

    for (std::size_t i = 0; i < invalid.size(); ++i) {
        auto response = orchestrator_->RunBenchmark("bubble-sort", Language::JAVASCRIPT, invalid[i]);
        EXPECT_FALSE(response.ok) << "case " << i;
        EXPECT_EQ(response.error_kind, ErrorKind::VALIDATION_ERROR) << "case " << i;
        EXPECT_EQ(response.http_status, 400) << "case " << i;
    }
}

TEST_F(RequestOrchestratorTest, CancelledBenchmarkIsATimeout) {
    benchmark::CancellationToken token;
    token.Cancel();

    auto response = orchestrator_->RunBenchmark("insertion-sort", Language::JAVASCRIPT,
                                                QuickOverrides({8}), &token);
    EXPECT_FALSE(response.ok);
    EXPECT_EQ(response.error_kind, ErrorKind::TIMEOUT_ERROR);
    EXPECT_EQ(response.http_status, 200);
    EXPECT_EQ(response.error_message, "Benchmark cancelled");
}
