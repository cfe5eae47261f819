/**
 * @file sandbox_outcome.cpp
 * @brief Fault kind names
 *
 * @date 2025
 */

#include "algoscope/sandbox/sandbox_outcome.hpp"

namespace algoscope {
namespace sandbox {

std::string ToString(FaultKind kind) {
    switch (kind) {
        case FaultKind::SYNTAX_ERROR:   return "SyntaxError";
        case FaultKind::RUNTIME_ERROR:  return "RuntimeError";
        case FaultKind::STACK_OVERFLOW: return "StackOverflow";
        case FaultKind::OUT_OF_MEMORY:  return "OutOfMemory";
        case FaultKind::CPU_LIMIT:      return "CpuLimit";
        case FaultKind::OUTPUT_LIMIT:   return "OutputLimit";
        case FaultKind::CRASHED:        return "Crashed";
        case FaultKind::LAUNCH_FAILURE: return "LaunchFailure";
    }
    return "Crashed";
}

bool IsUserFault(FaultKind kind) {
    return kind != FaultKind::LAUNCH_FAILURE;
}

} // namespace sandbox
} // namespace algoscope
