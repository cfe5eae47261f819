/**
 * @file language_runtime.hpp
 * @brief Closed mapping from Language to the interpreter that hosts it
 *
 * @date 2025
 */

#pragma once

#include "algoscope/core/types.hpp"
#include "algoscope/sandbox/sandbox_config.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace algoscope {
namespace sandbox {

/**
 * @struct LanguageRuntime
 * @brief How programs of one language are launched
 */
struct LanguageRuntime {
    core::Language language{core::Language::JAVASCRIPT};
    bool supported{false};                         ///< A runner exists for this language
    std::filesystem::path interpreter;             ///< Interpreter executable
    std::vector<std::string> interpreter_args;     ///< Flags placed before the bootstrap
    std::string bootstrap_source;                  ///< Program passed with -e
    std::string unsupported_reason;                ///< Message for unsupported languages
};

/**
 * @class RuntimeRegistry
 * @brief Registered runtimes, validated once at engine start-up
 */
class RuntimeRegistry {
public:
    /**
     * @brief Registry with javascript (node) and python (unsupported)
     */
    static RuntimeRegistry CreateDefault(const SandboxConfig& config);

    void Register(LanguageRuntime runtime);

    /// @return runtime or nullptr when the language was never registered
    const LanguageRuntime* Find(core::Language language) const;

    /**
     * @brief Check every supported runtime's interpreter
     * @return Problems found, empty when all interpreters are executable
     */
    std::vector<std::string> Validate() const;

    /// Supported and interpreter executable
    bool IsAvailable(core::Language language) const;

    const std::map<core::Language, LanguageRuntime>& Runtimes() const { return runtimes_; }

private:
    std::map<core::Language, LanguageRuntime> runtimes_;
};

} // namespace sandbox
} // namespace algoscope
