/**
 * @file test_process_handles.cpp
 * @brief Unit tests for descriptor and child process ownership.
 */

#include "algoscope/sandbox/process_handles.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace algoscope::sandbox;

class ProcessHandlesTest : public ::testing::Test {};

TEST_F(ProcessHandlesTest, PipeEndsAreCloseOnExec) {
    auto pipe = CreatePipe();
    ASSERT_TRUE(pipe.read_end.IsOpen());
    ASSERT_TRUE(pipe.write_end.IsOpen());

    EXPECT_TRUE(::fcntl(pipe.read_end.Get(), F_GETFD) & FD_CLOEXEC);
    EXPECT_TRUE(::fcntl(pipe.write_end.Get(), F_GETFD) & FD_CLOEXEC);
}

TEST_F(ProcessHandlesTest, UniqueFdMoveTransfersOwnership) {
    auto pipe = CreatePipe();
    int raw = pipe.read_end.Get();

    UniqueFd moved(std::move(pipe.read_end));
    EXPECT_EQ(moved.Get(), raw);
    EXPECT_FALSE(pipe.read_end.IsOpen());

    moved.Reset();
    EXPECT_FALSE(moved.IsOpen());
    EXPECT_EQ(::fcntl(raw, F_GETFD), -1);
}

TEST_F(ProcessHandlesTest, SetNonBlockingSetsFlag) {
    auto pipe = CreatePipe();
    SetNonBlocking(pipe.read_end.Get());
    EXPECT_TRUE(::fcntl(pipe.read_end.Get(), F_GETFL) & O_NONBLOCK);
}

TEST_F(ProcessHandlesTest, WaitUntilReturnsExitStatus) {
    pid_t pid = ::fork();
    ASSERT_NE(pid, -1);
    if (pid == 0) {
        ::setsid();
        ::_exit(7);
    }

    ChildProcess child(pid);
    auto status = child.WaitUntil(std::chrono::steady_clock::now() + std::chrono::seconds(5));
    ASSERT_TRUE(status.has_value());
    EXPECT_TRUE(WIFEXITED(*status));
    EXPECT_EQ(WEXITSTATUS(*status), 7);
    EXPECT_TRUE(child.IsReaped());
}

TEST_F(ProcessHandlesTest, WaitUntilTimesOutAndKillAndReapTerminates) {
    pid_t pid = ::fork();
    ASSERT_NE(pid, -1);
    if (pid == 0) {
        ::setsid();
        while (true) {
            ::pause();
        }
    }

    ChildProcess child(pid);
    auto status = child.WaitUntil(std::chrono::steady_clock::now() + std::chrono::milliseconds(50));
    EXPECT_FALSE(status.has_value());

    int killed = child.KillAndReap();
    EXPECT_TRUE(WIFSIGNALED(killed));
    EXPECT_EQ(WTERMSIG(killed), SIGKILL);
    EXPECT_TRUE(child.IsReaped());
}
