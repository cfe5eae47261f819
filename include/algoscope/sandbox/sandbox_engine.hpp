/**
 * @file sandbox_engine.hpp
 * @brief Resource-bounded execution of untrusted scripts
 *
 * Runs one user program per call inside a fresh interpreter process with an
 * isolated evaluation context, captured output streams, hard resource limits
 * and a wall-clock timeout enforced by killing the process group.
 *
 * @date 2025
 */

#pragma once

#include "algoscope/core/types.hpp"
#include "algoscope/sandbox/language_runtime.hpp"
#include "algoscope/sandbox/sandbox_config.hpp"
#include "algoscope/sandbox/sandbox_outcome.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace algoscope {
namespace sandbox {

/**
 * @class SandboxEngine
 * @brief Per-call isolated script runner
 *
 * Each Execute() call:
 * 1. Serialises the request envelope (code, input, limits)
 * 2. Forks a child in its own session with an empty environment, rlimits,
 *    no-new-privs and a parent-death signal
 * 3. Execs the interpreter with the bootstrap program
 * 4. Multiplexes stdin/stdout/stderr/control pipes until the deadline
 * 5. Kills the process group on timeout or output overflow
 * 6. Classifies the run into a SandboxOutcome
 *
 * **Architecture**:
 * ```
 * SandboxEngine (host thread)
 *     ├─ fd 0 → request envelope
 *     ├─ fd 1 ← console.log / print
 *     ├─ fd 2 ← console.error / console.warn
 *     └─ fd 3 ← control records (trace, done, fault)
 * node -e <bootstrap>
 *     └─ vm context (console, print, input, trace)
 * ```
 *
 * **Thread Safety**: Execute() is const and keeps no per-run state in the
 * engine, so one instance serves concurrent requests.
 *
 * **Usage Example**:
 * @code
 * auto engine = SandboxBuilder()
 *     .WithTimeout(std::chrono::milliseconds(500))
 *     .Build();
 *
 * if (!engine->Initialize()) {
 *     return;
 * }
 *
 * auto outcome = engine->Execute(core::Language::JAVASCRIPT, "print('hi')");
 * if (auto* done = std::get_if<Completed>(&outcome)) {
 *     std::cout << done->stdout_text;   // "hi\n"
 * }
 * @endcode
 */
class SandboxEngine {
public:
    /**
     * @brief Construct sandbox engine with custom configuration
     * @param config Sandbox configuration
     */
    explicit SandboxEngine(const SandboxConfig& config = SandboxConfig{});

    ~SandboxEngine();

    SandboxEngine(const SandboxEngine&) = delete;
    SandboxEngine& operator=(const SandboxEngine&) = delete;

    /**
     * @brief Validate configuration and the runtime table
     *
     * Also ignores SIGPIPE process-wide so that writing to a child that has
     * already exited reports EPIPE instead of terminating the host.
     *
     * @return true if the configuration is usable. Missing interpreters are
     *         logged and leave their language unavailable.
     *
     * @note Must be called before Execute()
     */
    bool Initialize();

    /**
     * @brief Execute one program
     *
     * @param language Program language
     * @param source_code Program text
     * @param input Value exposed to the program as `input`
     * @return Completed, TimedOut or Faulted
     *
     * @throws std::runtime_error if the engine is not initialized
     * @throws core::EngineError (UNSUPPORTED_LANGUAGE) if no runner exists
     * @throws std::system_error if pipes or the child cannot be created
     */
    SandboxOutcome Execute(core::Language language,
                           const std::string& source_code,
                           const nlohmann::json& input = nullptr) const;

    /**
     * @brief Execute one program on a dedicated worker
     */
    std::future<SandboxOutcome> ExecuteAsync(core::Language language,
                                             std::string source_code,
                                             nlohmann::json input = nullptr) const;

    /// Language has a runner and its interpreter is executable
    bool IsLanguageAvailable(core::Language language) const;

    const RuntimeRegistry& Runtimes() const { return runtimes_; }
    const SandboxConfig& GetConfig() const { return config_; }

private:
    bool ValidateConfig() const;

    SandboxOutcome RunInterpreter(const LanguageRuntime& runtime,
                                  const std::string& envelope,
                                  const std::string& source_code) const;

    std::string SanitizeMessage(const std::string& name,
                                const std::string& message,
                                const std::string& source_code) const;

    SandboxConfig config_;
    RuntimeRegistry runtimes_;
    bool initialized_{false};
};

/**
 * @class SandboxBuilder
 * @brief Fluent interface for building sandbox configurations
 *
 * **Usage Example**:
 * @code
 * auto sandbox = SandboxBuilder()
 *     .WithTimeout(std::chrono::milliseconds(1000))
 *     .WithHeapLimit(64)
 *     .WithMaxOutputBytes(64 * 1024)
 *     .Build();
 * @endcode
 */
class SandboxBuilder {
public:
    SandboxBuilder& WithTimeout(std::chrono::milliseconds timeout);
    SandboxBuilder& WithNodeBinary(const std::filesystem::path& node_binary);
    SandboxBuilder& WithHeapLimit(std::size_t heap_mb);
    SandboxBuilder& WithAddressSpaceLimit(std::size_t address_space_mb);
    SandboxBuilder& WithMaxOutputBytes(std::size_t bytes);
    SandboxBuilder& WithMaxTraceRecords(std::size_t records);
    SandboxBuilder& WithVerboseLogging(bool enable);

    std::unique_ptr<SandboxEngine> Build();

private:
    SandboxConfig config_;
};

} // namespace sandbox
} // namespace algoscope
