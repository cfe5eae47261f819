/**
 * @file sandbox_config.hpp
 * @brief Sandbox limits and interpreter settings
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

#ifndef ALGOSCOPE_DEFAULT_NODE_BINARY
#define ALGOSCOPE_DEFAULT_NODE_BINARY "/usr/bin/node"
#endif

namespace algoscope {
namespace sandbox {

/**
 * @struct ResourceLimits
 * @brief Hard limits applied to every sandboxed interpreter process
 */
struct ResourceLimits {
    std::size_t max_heap_mb{128};             ///< V8 old-space cap (--max-old-space-size)
    std::size_t max_address_space_mb{0};      ///< RLIMIT_AS, 0 leaves it unset
    std::size_t max_open_files{64};           ///< RLIMIT_NOFILE
    std::size_t max_output_bytes{1 << 20};    ///< Combined stdout + stderr cap (1 MiB)
    std::size_t max_trace_records{10000};     ///< trace() hook calls kept per run
};

/**
 * @struct SandboxConfig
 * @brief Complete sandbox configuration
 */
struct SandboxConfig {
    std::chrono::milliseconds timeout{2000};                       ///< Wall-clock limit per run
    ResourceLimits resource_limits;                                ///< Resource constraints
    std::filesystem::path node_binary{ALGOSCOPE_DEFAULT_NODE_BINARY};  ///< Javascript interpreter
    std::filesystem::path working_directory{"/"};                  ///< Child working directory
    std::size_t max_message_length{240};                           ///< Fault message cap
    bool verbose_logging{false};                                   ///< Per-run debug logging
};

} // namespace sandbox
} // namespace algoscope
