#include <gtest/gtest.h>
#include "supervisor/child_process.hpp"
#include "test_helpers.hpp"

#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static std::string read_all(int fd) {
    std::string out;
    char buf[256];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    return out;
}

static bool process_exists(pid_t pid) {
    return kill(pid, 0) == 0;
}

TEST(ChildProcessTest, Construction) {
    ChildProcess child(shell_engine("true"));
    EXPECT_FALSE(child.is_running());
    EXPECT_EQ(child.pid(), -1);
    EXPECT_EQ(child.stdout_fd(), -1);
}

TEST(ChildProcessTest, CapturesStdout) {
    ChildProcess child(shell_engine("echo hello; echo world"));
    std::string err;
    ASSERT_TRUE(child.spawn(err)) << err;
    EXPECT_GT(child.pid(), 0);

    EXPECT_EQ(read_all(child.stdout_fd()), "hello\nworld\n");

    auto st = child.wait_for_exit(5s);
    ASSERT_TRUE(st.has_value());
    EXPECT_TRUE(st->exited);
    EXPECT_EQ(st->code, 0);
    EXPECT_FALSE(child.is_running());
}

TEST(ChildProcessTest, MissingBinaryIsSpawnFailure) {
    EngineCommand cmd;
    cmd.binary = "/nonexistent/biodockify-engine";
    ChildProcess child(cmd);

    std::string err;
    EXPECT_FALSE(child.spawn(err));
    EXPECT_NE(err.find("/nonexistent/biodockify-engine"), std::string::npos);
    EXPECT_FALSE(child.is_running());
}

TEST(ChildProcessTest, NotExecutableIsSpawnFailure) {
    std::string path = fs::temp_directory_path() / ("eh_noexec_" + std::to_string(getpid()));
    {
        std::ofstream out(path);
        out << "#!/bin/sh\necho hi\n";
    }
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write);

    EngineCommand cmd;
    cmd.binary = path;
    ChildProcess child(cmd);
    std::string err;
    bool ok = child.spawn(err);
    fs::remove(path);

    // root may execute anything with an x bit; here there is none
    EXPECT_FALSE(ok);
    EXPECT_FALSE(err.empty());
}

TEST(ChildProcessTest, EmptyBinaryIsRejected) {
    ChildProcess child(EngineCommand{});
    std::string err;
    EXPECT_FALSE(child.spawn(err));
    EXPECT_FALSE(err.empty());
}

TEST(ChildProcessTest, SpawnTwiceIsRejected) {
    ChildProcess child(shell_engine("sleep 30"));
    std::string err;
    ASSERT_TRUE(child.spawn(err)) << err;
    EXPECT_FALSE(child.spawn(err));
    EXPECT_NE(err.find("already running"), std::string::npos);
    child.terminate(2s);
}

TEST(ChildProcessTest, ExitCodeCaptured) {
    ChildProcess child(shell_engine("exit 3"));
    std::string err;
    ASSERT_TRUE(child.spawn(err)) << err;

    auto st = child.wait_for_exit(5s);
    ASSERT_TRUE(st.has_value());
    EXPECT_TRUE(st->exited);
    EXPECT_EQ(st->code, 3);
    EXPECT_EQ(st->describe(), "code 3");
}

TEST(ChildProcessTest, TerminateStopsProcess) {
    ChildProcess child(shell_engine("sleep 30"));
    std::string err;
    ASSERT_TRUE(child.spawn(err)) << err;
    pid_t pid = child.pid();
    EXPECT_TRUE(process_exists(pid));

    bool forced = true;
    auto st = child.terminate(3s, &forced);
    EXPECT_FALSE(forced);
    EXPECT_FALSE(child.is_running());
    EXPECT_EQ(child.pid(), -1);
    EXPECT_FALSE(process_exists(pid));
    EXPECT_TRUE(st.signaled || st.exited);
}

TEST(ChildProcessTest, TerminateFallsBackToKill) {
    ChildProcess child(shell_engine("trap '' TERM; echo up; while true; do sleep 0.1; done"));
    std::string err;
    ASSERT_TRUE(child.spawn(err)) << err;

    // Wait until the trap is installed
    char c;
    ASSERT_EQ(read(child.stdout_fd(), &c, 1), 1);

    bool forced = false;
    auto start = std::chrono::steady_clock::now();
    auto st = child.terminate(300ms, &forced);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(forced);
    EXPECT_TRUE(st.signaled);
    EXPECT_EQ(st.signal, SIGKILL);
    EXPECT_LT(elapsed, 3s);
}

TEST(ChildProcessTest, TerminateAfterExitReturnsStatus) {
    ChildProcess child(shell_engine("exit 7"));
    std::string err;
    ASSERT_TRUE(child.spawn(err)) << err;
    read_all(child.stdout_fd());
    std::this_thread::sleep_for(100ms);

    bool forced = true;
    auto st = child.terminate(1s, &forced);
    EXPECT_FALSE(forced);
    EXPECT_EQ(st.code, 7);
}

TEST(ChildProcessTest, TerminateWithoutSpawnIsHarmless) {
    ChildProcess child(shell_engine("true"));
    bool forced = true;
    child.terminate(100ms, &forced);
    EXPECT_FALSE(forced);
}

TEST(ChildProcessTest, DestructorTerminatesChild) {
    pid_t pid = -1;
    {
        ChildProcess child(shell_engine("sleep 30"));
        std::string err;
        ASSERT_TRUE(child.spawn(err)) << err;
        pid = child.pid();
        EXPECT_TRUE(process_exists(pid));
    }
    EXPECT_FALSE(process_exists(pid));
}

TEST(ChildProcessTest, PassesEnvironment) {
    EngineCommand cmd = shell_engine("echo \"$ENGINE_PORT\"");
    cmd.env["ENGINE_PORT"] = "8234";
    ChildProcess child(cmd);
    std::string err;
    ASSERT_TRUE(child.spawn(err)) << err;
    EXPECT_EQ(read_all(child.stdout_fd()), "8234\n");
    child.wait_for_exit(5s);
}

TEST(ChildProcessTest, UsesWorkingDirectory) {
    EngineCommand cmd = shell_engine("pwd");
    cmd.working_dir = "/";
    ChildProcess child(cmd);
    std::string err;
    ASSERT_TRUE(child.spawn(err)) << err;
    EXPECT_EQ(read_all(child.stdout_fd()), "/\n");
    child.wait_for_exit(5s);
}

TEST(ChildProcessTest, BadWorkingDirectoryIsSpawnFailure) {
    EngineCommand cmd = shell_engine("pwd");
    cmd.working_dir = "/nonexistent/dir";
    ChildProcess child(cmd);
    std::string err;
    EXPECT_FALSE(child.spawn(err));
    EXPECT_FALSE(err.empty());
}

TEST(ChildProcessTest, MergesStderrWhenAsked) {
    EngineCommand cmd = shell_engine("echo out; echo err 1>&2");
    cmd.merge_stderr = true;
    ChildProcess child(cmd);
    std::string err;
    ASSERT_TRUE(child.spawn(err)) << err;
    std::string out = read_all(child.stdout_fd());
    EXPECT_NE(out.find("out"), std::string::npos);
    EXPECT_NE(out.find("err"), std::string::npos);
    child.wait_for_exit(5s);
}

TEST(ChildProcessTest, StdinIsDetached) {
    // read from /dev/null hits EOF immediately
    ChildProcess child(shell_engine("if read line; then echo got; else echo eof; fi"));
    std::string err;
    ASSERT_TRUE(child.spawn(err)) << err;
    EXPECT_EQ(read_all(child.stdout_fd()), "eof\n");
    child.wait_for_exit(5s);
}

TEST(ExitStatusTest, Describe) {
    ExitStatus code;
    code.exited = true;
    code.code = 0;
    EXPECT_EQ(code.describe(), "code 0");

    ExitStatus sig;
    sig.signaled = true;
    sig.signal = SIGKILL;
    EXPECT_EQ(sig.describe().rfind("signal 9", 0), 0u);

    EXPECT_EQ(ExitStatus{}.describe(), "unknown status");
}
