/**
 * @file process_handles.cpp
 * @brief RAII descriptor and child process owners
 *
 * @date 2025
 */

#include "algoscope/sandbox/process_handles.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace algoscope {
namespace sandbox {

// ============================================================================
// FILE DESCRIPTORS
// ============================================================================

UniqueFd::~UniqueFd() {
    Reset();
}

UniqueFd::UniqueFd(UniqueFd&& other) noexcept
    : fd_(other.fd_) {
    other.fd_ = -1;
}

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
        Reset();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void UniqueFd::Reset() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Pipe CreatePipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1) {
        throw std::system_error(errno, std::generic_category(), "pipe2 failed");
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

void SetNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        throw std::system_error(errno, std::generic_category(), "fcntl(O_NONBLOCK) failed");
    }
}

// ============================================================================
// CHILD PROCESS
// ============================================================================

ChildProcess::~ChildProcess() {
    if (!reaped_) {
        KillAndReap();
    }
}

void ChildProcess::KillGroup() {
    // The child called setsid(), so its pid is also its process group id
    if (::kill(-pid_, SIGKILL) == -1 && errno != ESRCH) {
        spdlog::warn("kill(-{}, SIGKILL) failed: {}", pid_, std::strerror(errno));
    }
}

std::optional<int> ChildProcess::WaitUntil(std::chrono::steady_clock::time_point deadline) {
    if (reaped_) {
        return status_;
    }

    while (true) {
        // Observe the exit without reaping so the group id stays reserved
        // until the remaining members are killed
        siginfo_t info{};
        int rc = ::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT);
        if (rc == -1 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitid failed");
        }
        if (rc == 0 && info.si_pid == pid_) {
            KillGroup();
            return Reap();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
}

int ChildProcess::KillAndReap() {
    if (reaped_) {
        return status_;
    }
    KillGroup();
    return Reap();
}

int ChildProcess::Reap() {
    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1) {
        if (errno != EINTR) {
            spdlog::error("waitpid({}) failed: {}", pid_, std::strerror(errno));
            break;
        }
    }
    reaped_ = true;
    status_ = status;
    return status_;
}

} // namespace sandbox
} // namespace algoscope
