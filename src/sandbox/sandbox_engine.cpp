/**
 * @file sandbox_engine.cpp
 * @brief Implementation of the resource-bounded script sandbox
 *
 * Implements per-call interpreter processes with confinement applied between
 * fork() and execve(), a poll()-driven pipe multiplexer bounded by a
 * monotonic deadline, and classification of the finished run.
 *
 * **Child Confinement**:
 * - **Session**: setsid(), so the whole process group can be killed at once
 * - **Privileges**: PR_SET_NO_NEW_PRIVS
 * - **Lifetime**: PR_SET_PDEATHSIG(SIGKILL) ties the child to the host
 * - **Environment**: empty envp, working directory from config
 * - **Limits**: RLIMIT_CPU, RLIMIT_FSIZE=0, RLIMIT_CORE=0, RLIMIT_NOFILE,
 *   optional RLIMIT_AS, V8 --max-old-space-size
 * - **Descriptors**: every host descriptor is O_CLOEXEC; only fds 0-3 survive exec
 *
 * **Timeout Management**:
 * - Deadline armed before fork()
 * - Expiry → SIGKILL to the process group → reap → TimedOut
 * - The bootstrap also passes the timeout to vm.Script.runInContext()
 *
 * @date 2025
 */

#include "algoscope/sandbox/sandbox_engine.hpp"
#include "algoscope/sandbox/javascript_bootstrap.hpp"
#include "algoscope/sandbox/process_handles.hpp"
#include "algoscope/core/errors.hpp"
#include "algoscope/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <optional>
#include <sstream>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;

namespace algoscope {
namespace sandbox {

using utils::StringUtils;

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr int kSetupFailureStatus = 126;
constexpr int kExecFailureStatus = 127;

double MillisecondsSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

// ============================================================================
// CHILD SIDE (between fork and exec)
// ============================================================================
// Only async-signal-safe calls are allowed here; everything is prepared
// by the parent before fork()

struct ChildLimit {
    int resource;
    rlim_t value;
};

struct ChildLaunch {
    const char* interpreter{nullptr};
    char* const* argv{nullptr};
    char* const* envp{nullptr};
    const char* working_directory{nullptr};
    int stdin_fd{-1};
    int stdout_fd{-1};
    int stderr_fd{-1};
    int control_fd{-1};
    const ChildLimit* limits{nullptr};
    std::size_t limit_count{0};
    pid_t parent_pid{0};
};

// dup2() onto itself keeps FD_CLOEXEC, so clear the flag explicitly
bool InstallFd(int from, int to) {
    if (from == to) {
        return ::fcntl(to, F_SETFD, 0) != -1;
    }
    return ::dup2(from, to) != -1;
}

[[noreturn]] void ExecChild(const ChildLaunch& launch) {
    if (!InstallFd(launch.stdin_fd, STDIN_FILENO) ||
        !InstallFd(launch.stdout_fd, STDOUT_FILENO) ||
        !InstallFd(launch.stderr_fd, STDERR_FILENO) ||
        !InstallFd(launch.control_fd, kControlFd)) {
        ::_exit(kSetupFailureStatus);
    }

    ::setsid();
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);
    if (::getppid() != launch.parent_pid) {
        ::_exit(kSetupFailureStatus);
    }
    ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);

    for (std::size_t i = 0; i < launch.limit_count; ++i) {
        struct rlimit rl;
        rl.rlim_cur = rl.rlim_max = launch.limits[i].value;
        if (::setrlimit(launch.limits[i].resource, &rl) == -1) {
            ::_exit(kSetupFailureStatus);
        }
    }

    // SIG_IGN dispositions and blocked masks survive execve
    struct sigaction dfl{};
    dfl.sa_handler = SIG_DFL;
    sigemptyset(&dfl.sa_mask);
    ::sigaction(SIGPIPE, &dfl, nullptr);
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);

    if (::chdir(launch.working_directory) == -1) {
        ::_exit(kSetupFailureStatus);
    }

    ::execve(launch.interpreter, launch.argv, launch.envp);
    ::_exit(kExecFailureStatus);
}

// ============================================================================
// PARENT SIDE PIPE HANDLING
// ============================================================================

// One read per readiness event keeps the deadline check responsive
void DrainOnce(UniqueFd& fd, std::string& sink) {
    std::array<char, kReadChunk> buffer;
    while (true) {
        ssize_t n = ::read(fd.Get(), buffer.data(), buffer.size());
        if (n > 0) {
            sink.append(buffer.data(), static_cast<std::size_t>(n));
            return;
        }
        if (n == 0) {
            fd.Reset();
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            spdlog::debug("Sandbox pipe read failed: {}", std::strerror(errno));
            fd.Reset();
        }
        return;
    }
}

void WritePending(UniqueFd& fd, const std::string& payload, std::size_t& written) {
    while (written < payload.size()) {
        ssize_t n = ::write(fd.Get(), payload.data() + written, payload.size() - written);
        if (n > 0) {
            written += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        // EPIPE: the interpreter exited before reading its request
        spdlog::debug("Sandbox stdin write stopped: {}", std::strerror(errno));
        break;
    }
    fd.Reset();
}

// ============================================================================
// CONTROL CHANNEL PARSING
// ============================================================================

struct ControlSummary {
    bool done{false};
    std::optional<double> duration_ms;
    bool has_fault{false};
    std::string fault_kind;
    std::string fault_name;
    std::string fault_message;
    std::vector<core::TraceHookRecord> records;
    bool truncated{false};
};

std::string StringField(const json& record, const char* key) {
    auto it = record.find(key);
    return (it != record.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

// Integral value within [0, INT_MAX], otherwise -1
int IndexValue(const json& value) {
    constexpr auto kMax = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        const auto number = value.get<std::uint64_t>();
        return number <= static_cast<std::uint64_t>(kMax) ? static_cast<int>(number) : -1;
    }
    if (value.is_number_integer()) {
        const auto number = value.get<std::int64_t>();
        return (number >= 0 && number <= kMax) ? static_cast<int>(number) : -1;
    }
    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (std::isfinite(number) && number >= 0.0 && number <= kMax && std::floor(number) == number) {
            return static_cast<int>(number);
        }
    }
    return -1;
}

std::optional<std::vector<double>> NumberArrayField(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_array()) {
        return std::nullopt;
    }
    std::vector<double> values;
    values.reserve(it->size());
    for (const auto& value : *it) {
        if (!value.is_number()) {
            return std::nullopt;
        }
        values.push_back(value.get<double>());
    }
    return values;
}

// Out-of-range entries become -1 so the emitter drops the highlight
std::optional<std::vector<int>> IndexArrayField(const json& record, const char* key) {
    auto it = record.find(key);
    if (it == record.end() || !it->is_array()) {
        return std::nullopt;
    }
    std::vector<int> indices;
    indices.reserve(it->size());
    for (const auto& value : *it) {
        if (!value.is_number()) {
            return std::nullopt;
        }
        indices.push_back(IndexValue(value));
    }
    return indices;
}

ControlSummary ParseControlRecords(const std::string& text) {
    ControlSummary summary;

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.empty()) {
            continue;
        }
        auto record = json::parse(line, nullptr, false);
        if (record.is_discarded() || !record.is_object()) {
            spdlog::debug("Ignoring malformed control record ({} bytes)", line.size());
            continue;
        }

        auto type = StringField(record, "type");
        if (type == "trace") {
            core::TraceHookRecord hook;
            auto line_it = record.find("line");
            if (line_it != record.end() && line_it->is_number()) {
                const int line_number = IndexValue(*line_it);
                if (line_number >= 0) {
                    hook.line = line_number;
                }
            }
            hook.description = StringField(record, "description");
            hook.array = NumberArrayField(record, "array");
            hook.highlighted = IndexArrayField(record, "highlighted");
            summary.records.push_back(std::move(hook));
        } else if (type == "trace-truncated") {
            summary.truncated = true;
        } else if (type == "done") {
            summary.done = true;
            auto it = record.find("durationMs");
            if (it != record.end() && it->is_number()) {
                summary.duration_ms = it->get<double>();
            }
        } else if (type == "fault") {
            summary.has_fault = true;
            summary.fault_kind = StringField(record, "kind");
            summary.fault_name = StringField(record, "name");
            summary.fault_message = StringField(record, "message");
        }
    }

    return summary;
}

FaultKind FaultKindFromRecord(const std::string& kind) {
    if (kind == "SyntaxError") {
        return FaultKind::SYNTAX_ERROR;
    }
    if (kind == "StackOverflow") {
        return FaultKind::STACK_OVERFLOW;
    }
    if (kind == "BootstrapError") {
        return FaultKind::LAUNCH_FAILURE;
    }
    return FaultKind::RUNTIME_ERROR;
}

// V8 prints GC diagnostics after user output when the heap is exhausted
std::string StripHeapDiagnostics(const std::string& stderr_text) {
    auto pos = stderr_text.find("<--- Last few GCs --->");
    if (pos == std::string::npos) {
        return stderr_text;
    }
    auto trimmed = stderr_text.substr(0, pos);
    while (!trimmed.empty() && (trimmed.back() == '\n' || trimmed.back() == '\r')) {
        trimmed.pop_back();
    }
    return trimmed.empty() ? trimmed : trimmed + "\n";
}

const char* OutcomeName(const SandboxOutcome& outcome) {
    switch (outcome.index()) {
        case 0: return "completed";
        case 1: return "timed out";
        default: return "faulted";
    }
}

} // namespace

// Constructor
SandboxEngine::SandboxEngine(const SandboxConfig& config)
    : config_(config)
    , runtimes_(RuntimeRegistry::CreateDefault(config)) {

    spdlog::debug("Sandbox Engine created");
    spdlog::debug("Interpreter: {}", config_.node_binary.string());
    spdlog::debug("Timeout: {}ms", config_.timeout.count());
}

// Destructor
SandboxEngine::~SandboxEngine() {
    spdlog::debug("Sandbox Engine destroyed");
}

// Initialize sandbox environment
bool SandboxEngine::Initialize() {
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("INITIALIZING SANDBOX ENGINE");
    spdlog::info("═══════════════════════════════════════════════════════════════");

    if (!ValidateConfig()) {
        spdlog::error("Invalid sandbox configuration");
        return false;
    }

    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (::sigaction(SIGPIPE, &ignore, nullptr) == -1) {
        spdlog::error("Failed to ignore SIGPIPE: {}", std::strerror(errno));
        return false;
    }

    auto problems = runtimes_.Validate();
    for (const auto& problem : problems) {
        spdlog::warn("Runtime unavailable: {}", problem);
    }

    initialized_ = true;

    spdlog::info("Timeout:        {} ms", config_.timeout.count());
    spdlog::info("Heap limit:     {} MB", config_.resource_limits.max_heap_mb);
    spdlog::info("Output limit:   {} bytes", config_.resource_limits.max_output_bytes);
    spdlog::info("✓ Sandbox Engine initialized ({} runtime problem(s))", problems.size());

    return true;
}

bool SandboxEngine::ValidateConfig() const {
    const auto& limits = config_.resource_limits;
    bool valid = true;

    if (config_.timeout.count() <= 0) {
        spdlog::error("Sandbox timeout must be positive");
        valid = false;
    }
    if (limits.max_output_bytes == 0) {
        spdlog::error("Output limit must be positive");
        valid = false;
    }
    if (limits.max_heap_mb < 16) {
        spdlog::error("Heap limit below 16 MB cannot start the interpreter");
        valid = false;
    }
    if (limits.max_open_files < 16) {
        spdlog::error("Open file limit below 16 cannot start the interpreter");
        valid = false;
    }
    if (config_.max_message_length < 16) {
        spdlog::error("Fault message length must be at least 16");
        valid = false;
    }

    return valid;
}

bool SandboxEngine::IsLanguageAvailable(core::Language language) const {
    return initialized_ && runtimes_.IsAvailable(language);
}

// ============================================================================
// EXECUTION
// ============================================================================

SandboxOutcome SandboxEngine::Execute(core::Language language,
                                      const std::string& source_code,
                                      const json& input) const {
    if (!initialized_) {
        throw std::runtime_error("Sandbox Engine not initialized");
    }

    const auto* runtime = runtimes_.Find(language);
    if (runtime == nullptr || !runtime->supported) {
        throw core::EngineError(
            core::ErrorKind::UNSUPPORTED_LANGUAGE,
            runtime != nullptr ? runtime->unsupported_reason
                               : "No runtime registered for language '" + core::ToString(language) + "'");
    }

    json envelope = {
        {"code", source_code},
        {"input", input},
        {"timeoutMs", config_.timeout.count()},
        {"maxTraceRecords", config_.resource_limits.max_trace_records}
    };
    auto payload = envelope.dump(-1, ' ', false, json::error_handler_t::replace);

    if (config_.verbose_logging) {
        spdlog::debug("Launching {} runtime ({} bytes of source)",
                      core::ToString(language), source_code.size());
    }

    auto outcome = RunInterpreter(*runtime, payload, source_code);

    if (config_.verbose_logging) {
        spdlog::debug("Sandbox run {}", OutcomeName(outcome));
    }

    return outcome;
}

std::future<SandboxOutcome> SandboxEngine::ExecuteAsync(core::Language language,
                                                        std::string source_code,
                                                        json input) const {
    return std::async(std::launch::async,
        [this, language, source_code = std::move(source_code), input = std::move(input)]() {
            return Execute(language, source_code, input);
        });
}

SandboxOutcome SandboxEngine::RunInterpreter(const LanguageRuntime& runtime,
                                             const std::string& envelope,
                                             const std::string& source_code) const {
    const auto& limits = config_.resource_limits;

    // Prepare argv/envp/limits before fork()
    std::vector<std::string> args;
    args.push_back(runtime.interpreter.string());
    args.insert(args.end(), runtime.interpreter_args.begin(), runtime.interpreter_args.end());
    args.push_back("-e");
    args.push_back(runtime.bootstrap_source);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    char* envp[] = {nullptr};

    auto cpu_seconds = std::chrono::ceil<std::chrono::seconds>(config_.timeout).count() + 1;
    std::vector<ChildLimit> child_limits = {
        {RLIMIT_CPU, static_cast<rlim_t>(cpu_seconds)},
        {RLIMIT_FSIZE, 0},
        {RLIMIT_CORE, 0},
        {RLIMIT_NOFILE, static_cast<rlim_t>(limits.max_open_files)},
    };
    if (limits.max_address_space_mb > 0) {
        child_limits.push_back(
            {RLIMIT_AS, static_cast<rlim_t>(limits.max_address_space_mb) * 1024 * 1024});
    }

    auto working_directory = config_.working_directory.string();

    Pipe stdin_pipe = CreatePipe();
    Pipe stdout_pipe = CreatePipe();
    Pipe stderr_pipe = CreatePipe();
    Pipe control_pipe = CreatePipe();

    ChildLaunch launch;
    launch.interpreter = args.front().c_str();
    launch.argv = argv.data();
    launch.envp = envp;
    launch.working_directory = working_directory.c_str();
    launch.stdin_fd = stdin_pipe.read_end.Get();
    launch.stdout_fd = stdout_pipe.write_end.Get();
    launch.stderr_fd = stderr_pipe.write_end.Get();
    launch.control_fd = control_pipe.write_end.Get();
    launch.limits = child_limits.data();
    launch.limit_count = child_limits.size();
    launch.parent_pid = ::getpid();

    const auto start = Clock::now();
    const auto deadline = start + config_.timeout;

    pid_t pid = ::fork();
    if (pid == -1) {
        throw std::system_error(errno, std::generic_category(), "fork failed");
    }
    if (pid == 0) {
        ExecChild(launch);
    }

    ChildProcess child(pid);

    // Parent keeps only its own ends
    stdin_pipe.read_end.Reset();
    stdout_pipe.write_end.Reset();
    stderr_pipe.write_end.Reset();
    control_pipe.write_end.Reset();

    SetNonBlocking(stdin_pipe.write_end.Get());
    SetNonBlocking(stdout_pipe.read_end.Get());
    SetNonBlocking(stderr_pipe.read_end.Get());
    SetNonBlocking(control_pipe.read_end.Get());

    std::string stdout_text;
    std::string stderr_text;
    std::string control_text;
    std::size_t written = 0;
    bool timed_out = false;
    bool output_exceeded = false;

    const std::size_t control_cap = (limits.max_trace_records + 16) * 4096;

    enum Role { STDIN_ROLE, STDOUT_ROLE, STDERR_ROLE, CONTROL_ROLE };

    while (stdout_pipe.read_end.IsOpen() ||
           stderr_pipe.read_end.IsOpen() ||
           control_pipe.read_end.IsOpen()) {

        auto now = Clock::now();
        if (now >= deadline) {
            timed_out = true;
            break;
        }
        auto remaining_ms = std::chrono::ceil<std::chrono::milliseconds>(deadline - now).count();

        std::array<pollfd, 4> fds{};
        std::array<Role, 4> roles{};
        nfds_t count = 0;
        auto watch = [&](const UniqueFd& fd, short events, Role role) {
            if (fd.IsOpen()) {
                fds[count] = pollfd{fd.Get(), events, 0};
                roles[count] = role;
                ++count;
            }
        };
        watch(stdin_pipe.write_end, POLLOUT, STDIN_ROLE);
        watch(stdout_pipe.read_end, POLLIN, STDOUT_ROLE);
        watch(stderr_pipe.read_end, POLLIN, STDERR_ROLE);
        watch(control_pipe.read_end, POLLIN, CONTROL_ROLE);

        int rc = ::poll(fds.data(), count, static_cast<int>(remaining_ms));
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "poll failed");
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            switch (roles[i]) {
                case STDIN_ROLE:   WritePending(stdin_pipe.write_end, envelope, written); break;
                case STDOUT_ROLE:  DrainOnce(stdout_pipe.read_end, stdout_text); break;
                case STDERR_ROLE:  DrainOnce(stderr_pipe.read_end, stderr_text); break;
                case CONTROL_ROLE: DrainOnce(control_pipe.read_end, control_text); break;
            }
        }

        if (stdout_text.size() + stderr_text.size() > limits.max_output_bytes ||
            control_text.size() > control_cap) {
            output_exceeded = true;
            break;
        }
    }

    int status = 0;
    if (timed_out || output_exceeded) {
        status = child.KillAndReap();
    } else {
        auto waited = child.WaitUntil(deadline);
        if (waited) {
            status = *waited;
        } else {
            timed_out = true;
            status = child.KillAndReap();
        }
    }
    const double elapsed_ms = MillisecondsSince(start);

    // ------------------------------------------------------------------------
    // Classification
    // ------------------------------------------------------------------------

    auto control = ParseControlRecords(control_text);

    if (timed_out || (control.has_fault && control.fault_kind == "Timeout")) {
        spdlog::debug("Sandbox timeout after {:.1f}ms", elapsed_ms);
        return TimedOut{elapsed_ms, std::move(stdout_text), std::move(stderr_text)};
    }

    if (output_exceeded) {
        stdout_text = StringUtils::Truncate(stdout_text, limits.max_output_bytes, "");
        stderr_text = StringUtils::Truncate(stderr_text, limits.max_output_bytes, "");
        return Faulted{FaultKind::OUTPUT_LIMIT,
                       "Output limit of " + std::to_string(limits.max_output_bytes) + " bytes exceeded",
                       std::move(stdout_text), std::move(stderr_text), elapsed_ms};
    }

    if (control.has_fault) {
        auto kind = FaultKindFromRecord(control.fault_kind);
        auto message = kind == FaultKind::LAUNCH_FAILURE
            ? std::string("Interpreter bootstrap failed")
            : SanitizeMessage(control.fault_name, control.fault_message, source_code);
        return Faulted{kind, std::move(message), std::move(stdout_text), std::move(stderr_text),
                       control.duration_ms.value_or(elapsed_ms)};
    }

    if (control.done && WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        Completed completed;
        completed.stdout_text = std::move(stdout_text);
        completed.stderr_text = std::move(stderr_text);
        completed.duration_ms = control.duration_ms.value_or(elapsed_ms);
        completed.hook_records = std::move(control.records);
        completed.hook_truncated = control.truncated;
        return completed;
    }

    const bool heap_exhausted = StringUtils::Contains(stderr_text, "heap out of memory");
    if (heap_exhausted) {
        return Faulted{FaultKind::OUT_OF_MEMORY, "JavaScript heap out of memory",
                       std::move(stdout_text), StripHeapDiagnostics(stderr_text), elapsed_ms};
    }

    if (WIFSIGNALED(status)) {
        int signal_number = WTERMSIG(status);
        if (signal_number == SIGXCPU) {
            return Faulted{FaultKind::CPU_LIMIT, "CPU time limit exceeded",
                           std::move(stdout_text), std::move(stderr_text), elapsed_ms};
        }
        return Faulted{FaultKind::CRASHED,
                       "Interpreter terminated by signal " + std::to_string(signal_number),
                       std::move(stdout_text), std::move(stderr_text), elapsed_ms};
    }

    int exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if ((exit_status == kSetupFailureStatus || exit_status == kExecFailureStatus) && control_text.empty()) {
        spdlog::error("Interpreter {} could not be started (status {})",
                      runtime.interpreter.string(), exit_status);
        return Faulted{FaultKind::LAUNCH_FAILURE, "Interpreter could not be started",
                       std::move(stdout_text), std::move(stderr_text), elapsed_ms};
    }

    return Faulted{FaultKind::CRASHED,
                   "Interpreter exited with status " + std::to_string(exit_status),
                   std::move(stdout_text), std::move(stderr_text), elapsed_ms};
}

std::string SandboxEngine::SanitizeMessage(const std::string& name,
                                           const std::string& message,
                                           const std::string& source_code) const {
    std::string text;
    if (name.empty()) {
        text = message;
    } else if (message.empty()) {
        text = name;
    } else {
        text = name + ": " + message;
    }

    text = StringUtils::FirstLine(text);
    text = StringUtils::Sanitize(text);
    text = StringUtils::RedactSource(text, source_code);
    return StringUtils::Truncate(text, config_.max_message_length);
}

// ============================================================================
// SANDBOX BUILDER
// ============================================================================

SandboxBuilder& SandboxBuilder::WithTimeout(std::chrono::milliseconds timeout) {
    config_.timeout = timeout;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithNodeBinary(const std::filesystem::path& node_binary) {
    config_.node_binary = node_binary;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithHeapLimit(std::size_t heap_mb) {
    config_.resource_limits.max_heap_mb = heap_mb;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithAddressSpaceLimit(std::size_t address_space_mb) {
    config_.resource_limits.max_address_space_mb = address_space_mb;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithMaxOutputBytes(std::size_t bytes) {
    config_.resource_limits.max_output_bytes = bytes;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithMaxTraceRecords(std::size_t records) {
    config_.resource_limits.max_trace_records = records;
    return *this;
}

SandboxBuilder& SandboxBuilder::WithVerboseLogging(bool enable) {
    config_.verbose_logging = enable;
    return *this;
}

std::unique_ptr<SandboxEngine> SandboxBuilder::Build() {
    return std::make_unique<SandboxEngine>(config_);
}

} // namespace sandbox
} // namespace algoscope
