/**
 * @file benchmark_harness.hpp
 * @brief Warmup + adaptive-iteration timing over a list of input sizes
 *
 * Measures vetted native routines only; user code never reaches the harness.
 *
 * **Sampling per size**:
 * 1. Generate one input for the size
 * 2. Run `warmup_iterations` unrecorded iterations
 * 3. Record iterations until the cumulative time reaches `min_duration_ms`
 *    or `max_iterations` is hit
 * 4. Force one recorded iteration when none were taken
 *
 * Each iteration receives a fresh copy of the input; the copy is not timed.
 *
 * @date 2025
 */

#pragma once

#include "algoscope/core/errors.hpp"
#include "algoscope/core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace algoscope {
namespace benchmark {

/**
 * @struct BenchmarkConfig
 * @brief Sampling policy
 */
struct BenchmarkConfig {
    std::size_t warmup_iterations{3};             ///< Unrecorded runs per size
    double min_duration_ms{50.0};                 ///< Target cumulative time per size
    std::size_t max_iterations{1000};             ///< Iteration cap per size
    std::chrono::milliseconds time_budget{10000}; ///< Whole-invocation budget
    std::uint32_t seed{0};                        ///< Input seed, 0 picks a random seed
};

/**
 * @struct BenchmarkInput
 * @brief Input handed to a routine
 */
struct BenchmarkInput {
    std::vector<int> values;  ///< Array to process
    int probe{0};             ///< Search key for searching routines
};

/// Builds the input for one size
using InputGenerator = std::function<BenchmarkInput(std::size_t size, std::mt19937& rng)>;

/// Routine under measurement; may mutate its (private) input copy
using Routine = std::function<void(BenchmarkInput& input)>;

/**
 * @class CancellationToken
 * @brief Cooperative cancellation flag checked between iterations
 */
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @class BenchmarkFault
 * @brief A routine threw; the whole benchmark is aborted
 */
class BenchmarkFault : public core::EngineError {
public:
    explicit BenchmarkFault(const std::string& message)
        : core::EngineError(core::ErrorKind::RUNTIME_FAULT, message) {
    }
};

/**
 * @class BenchmarkCancelled
 * @brief Time budget exhausted or cancellation requested
 */
class BenchmarkCancelled : public core::EngineError {
public:
    explicit BenchmarkCancelled(const std::string& message)
        : core::EngineError(core::ErrorKind::TIMEOUT_ERROR, message) {
    }
};

/**
 * @class BenchmarkHarness
 * @brief Stateless timing driver
 *
 * **Usage Example**:
 * @code
 * BenchmarkHarness harness;
 * auto summary = harness.Run("sort", {8, 16, 32},
 *     [](std::size_t n, std::mt19937& rng) { ... },
 *     [](BenchmarkInput& in) { std::sort(in.values.begin(), in.values.end()); });
 * // summary.points.size() == 3, in request order
 * @endcode
 */
class BenchmarkHarness {
public:
    explicit BenchmarkHarness(const BenchmarkConfig& config = BenchmarkConfig{});

    /**
     * @brief Benchmark @p routine at every size
     *
     * @return Summary with one point per size, in the order given
     *
     * @throws core::EngineError (VALIDATION_ERROR) for an empty size list or a zero size
     * @throws BenchmarkFault if the generator or routine throws
     * @throws BenchmarkCancelled if the budget expires or @p cancel is set
     */
    core::BenchmarkSummary Run(const std::string& label,
                               const std::vector<std::size_t>& sizes,
                               const InputGenerator& generator,
                               const Routine& routine,
                               const CancellationToken* cancel = nullptr) const;

    const BenchmarkConfig& GetConfig() const { return config_; }

    /// Totals and min/max of per-point averages
    static core::BenchmarkSummary Summarize(const std::string& label,
                                            std::vector<core::BenchmarkPoint> points);

private:
    core::BenchmarkPoint Measure(std::size_t size,
                                 const BenchmarkInput& input,
                                 const Routine& routine,
                                 std::chrono::steady_clock::time_point deadline,
                                 const CancellationToken* cancel) const;

    BenchmarkConfig config_;
};

} // namespace benchmark
} // namespace algoscope
