/**
 * @file language_runtime.cpp
 * @brief Default runtime table
 *
 * @date 2025
 */

#include "algoscope/sandbox/language_runtime.hpp"
#include "algoscope/sandbox/javascript_bootstrap.hpp"

#include <spdlog/spdlog.h>

#include <unistd.h>

namespace algoscope {
namespace sandbox {

RuntimeRegistry RuntimeRegistry::CreateDefault(const SandboxConfig& config) {
    RuntimeRegistry registry;

    LanguageRuntime javascript;
    javascript.language = core::Language::JAVASCRIPT;
    javascript.supported = true;
    javascript.interpreter = config.node_binary;
    javascript.interpreter_args = {
        "--max-old-space-size=" + std::to_string(config.resource_limits.max_heap_mb),
        "--disallow-code-generation-from-strings",
    };
    javascript.bootstrap_source = JavascriptBootstrapSource();
    registry.Register(std::move(javascript));

    LanguageRuntime python;
    python.language = core::Language::PYTHON;
    python.supported = false;
    python.unsupported_reason =
        "Python execution is not implemented yet. Use JavaScript for now.";
    registry.Register(std::move(python));

    return registry;
}

void RuntimeRegistry::Register(LanguageRuntime runtime) {
    auto language = runtime.language;
    runtimes_[language] = std::move(runtime);
}

const LanguageRuntime* RuntimeRegistry::Find(core::Language language) const {
    auto it = runtimes_.find(language);
    return it == runtimes_.end() ? nullptr : &it->second;
}

std::vector<std::string> RuntimeRegistry::Validate() const {
    std::vector<std::string> problems;

    for (const auto& [language, runtime] : runtimes_) {
        if (!runtime.supported) {
            spdlog::debug("Runtime '{}' registered without a runner", core::ToString(language));
            continue;
        }
        if (runtime.bootstrap_source.empty()) {
            problems.push_back(core::ToString(language) + ": empty bootstrap");
        }
        if (::access(runtime.interpreter.c_str(), X_OK) != 0) {
            problems.push_back(core::ToString(language) + ": interpreter not executable: " +
                               runtime.interpreter.string());
        }
    }

    return problems;
}

bool RuntimeRegistry::IsAvailable(core::Language language) const {
    const auto* runtime = Find(language);
    return runtime != nullptr && runtime->supported &&
           ::access(runtime->interpreter.c_str(), X_OK) == 0;
}

} // namespace sandbox
} // namespace algoscope
