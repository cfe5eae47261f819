/**
 * @file sandbox_outcome.hpp
 * @brief Tagged result of one sandbox attempt
 *
 * Exactly one of Completed, TimedOut or Faulted is produced per attempt.
 * User-caused failures are values, not exceptions.
 *
 * @date 2025
 */

#pragma once

#include "algoscope/core/types.hpp"

#include <string>
#include <variant>
#include <vector>

namespace algoscope {
namespace sandbox {

/**
 * @enum FaultKind
 * @brief Reason a run ended abnormally
 */
enum class FaultKind {
    SYNTAX_ERROR,    ///< Program failed to compile
    RUNTIME_ERROR,   ///< Uncaught exception
    STACK_OVERFLOW,  ///< Maximum call stack size exceeded
    OUT_OF_MEMORY,   ///< Interpreter heap exhausted
    CPU_LIMIT,       ///< RLIMIT_CPU reached (SIGXCPU)
    OUTPUT_LIMIT,    ///< Output cap exceeded
    CRASHED,         ///< Interpreter died without a fault record
    LAUNCH_FAILURE   ///< Interpreter could not be started
};

std::string ToString(FaultKind kind);

/**
 * @brief Whether the fault is caused by the submitted program
 *
 * LAUNCH_FAILURE is the only engine-side fault.
 */
bool IsUserFault(FaultKind kind);

/// Program ran to completion
struct Completed {
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms{0.0};
    std::vector<core::TraceHookRecord> hook_records;  ///< trace() calls, in call order
    bool hook_truncated{false};                       ///< trace() cap reached
};

/// Wall-clock limit reached, process group killed
struct TimedOut {
    double elapsed_ms{0.0};
    std::string stdout_text;  ///< Partial output, diagnostics only
    std::string stderr_text;
};

/// Program or interpreter failed
struct Faulted {
    FaultKind kind{FaultKind::CRASHED};
    std::string message;      ///< Sanitised, single line, no source echo
    std::string stdout_text;  ///< Output produced before the fault
    std::string stderr_text;
    double duration_ms{0.0};
};

using SandboxOutcome = std::variant<Completed, TimedOut, Faulted>;

} // namespace sandbox
} // namespace algoscope
