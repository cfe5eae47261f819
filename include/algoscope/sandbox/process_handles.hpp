/**
 * @file process_handles.hpp
 * @brief RAII owners for descriptors and child processes
 *
 * Every descriptor and child created for a sandbox run is owned by one of
 * these handles, so all of them are released on normal return, timeout and
 * exception paths alike.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <optional>

#include <sys/types.h>

namespace algoscope {
namespace sandbox {

/**
 * @class UniqueFd
 * @brief Move-only owner of a file descriptor
 */
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd();

    UniqueFd(UniqueFd&& other) noexcept;
    UniqueFd& operator=(UniqueFd&& other) noexcept;

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int Get() const { return fd_; }
    bool IsOpen() const { return fd_ >= 0; }

    /// Close the owned descriptor (no-op when already closed)
    void Reset();

private:
    int fd_{-1};
};

/**
 * @struct Pipe
 * @brief Both ends of a pipe created with O_CLOEXEC
 */
struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

/**
 * @brief Create a close-on-exec pipe
 * @throws std::system_error if pipe2 fails
 */
Pipe CreatePipe();

/**
 * @brief Put a descriptor into non-blocking mode
 * @throws std::system_error if fcntl fails
 */
void SetNonBlocking(int fd);

/**
 * @class ChildProcess
 * @brief Owner of a forked child that leads its own process group
 *
 * The destructor kills the whole group with SIGKILL and reaps the child if
 * that has not happened yet.
 */
class ChildProcess {
public:
    explicit ChildProcess(pid_t pid) : pid_(pid) {}
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t Pid() const { return pid_; }

    /// SIGKILL the child's process group
    void KillGroup();

    /**
     * @brief Wait for the child to exit, up to a deadline
     *
     * Surviving group members are killed before the child is reaped.
     *
     * @return wait status, or std::nullopt if the deadline passed first
     */
    std::optional<int> WaitUntil(std::chrono::steady_clock::time_point deadline);

    /// Kill the group and reap the child, blocking
    int KillAndReap();

    bool IsReaped() const { return reaped_; }

private:
    int Reap();

    pid_t pid_;
    bool reaped_{false};
    int status_{0};
};

} // namespace sandbox
} // namespace algoscope
