#include <gtest/gtest.h>
#include "../src/backend/ProcessLauncher.h"
#include "../src/utils/Logger.h"
#include <atomic>
#include <filesystem>
#include <mutex>
#include <thread>

using namespace std::chrono_literals;

class ProcessLauncherTest : public ::testing::Test {
protected:
    Logger logger{"", false};
    PosixProcessLauncher launcher{logger};

    std::mutex mtx;
    std::vector<std::string> outLines;
    std::vector<std::string> errLines;
    std::atomic<int> exitCode{-999};

    ProcessCallbacks callbacks() {
        ProcessCallbacks cb;
        cb.onStdoutLine = [this](const std::string& l) {
            std::lock_guard<std::mutex> lock(mtx);
            outLines.push_back(l);
        };
        cb.onStderrLine = [this](const std::string& l) {
            std::lock_guard<std::mutex> lock(mtx);
            errLines.push_back(l);
        };
        cb.onExit = [this](int code) { exitCode = code; };
        return cb;
    }

    bool waitForExitCallback(std::chrono::milliseconds timeout = 5000ms) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (exitCode.load() == -999 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        return exitCode.load() != -999;
    }
};

TEST_F(ProcessLauncherTest, CapturesLinesAndExitCode) {
    LaunchSpec spec{"/bin/sh", {"-c", "echo hello; echo; echo oops 1>&2; printf partial; exit 3"}, ""};
    auto handle = launcher.launch(spec, callbacks());
    ASSERT_TRUE(handle != nullptr);
    EXPECT_GT(handle->pid(), 0);

    ASSERT_TRUE(waitForExitCallback());
    EXPECT_EQ(exitCode.load(), 3);
    EXPECT_FALSE(handle->isRunning());

    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::string> expectedOut = {"hello", "partial"};
    EXPECT_EQ(outLines, expectedOut);
    ASSERT_EQ(errLines.size(), 1u);
    EXPECT_EQ(errLines[0], "oops");
}

TEST_F(ProcessLauncherTest, RunsInWorkingDirectory) {
    auto dir = std::filesystem::canonical(std::filesystem::temp_directory_path());
    LaunchSpec spec{"/bin/sh", {"-c", "pwd"}, dir.string()};
    auto handle = launcher.launch(spec, callbacks());
    ASSERT_TRUE(handle != nullptr);
    ASSERT_TRUE(waitForExitCallback());

    std::lock_guard<std::mutex> lock(mtx);
    ASSERT_EQ(outLines.size(), 1u);
    EXPECT_EQ(std::filesystem::path(outLines[0]), dir);
}

TEST_F(ProcessLauncherTest, TerminateReportsSignal) {
    LaunchSpec spec{"/bin/sh", {"-c", "exec sleep 30"}, ""};
    auto handle = launcher.launch(spec, callbacks());
    ASSERT_TRUE(handle != nullptr);
    EXPECT_TRUE(handle->isRunning());
    EXPECT_FALSE(handle->waitForExit(50ms));

    handle->terminate();
    EXPECT_TRUE(handle->waitForExit(5000ms));
    ASSERT_TRUE(waitForExitCallback());
    EXPECT_EQ(exitCode.load(), 128 + 15);
}

TEST_F(ProcessLauncherTest, MissingExecutableFails) {
    LaunchSpec spec{"/nonexistent/warden-python", {}, ""};
    EXPECT_TRUE(launcher.launch(spec, callbacks()) == nullptr);
}

TEST_F(ProcessLauncherTest, DetachedCallbacksAreNotInvoked) {
    LaunchSpec spec{"/bin/sh", {"-c", "sleep 0.2; echo late"}, ""};
    auto handle = launcher.launch(spec, callbacks());
    ASSERT_TRUE(handle != nullptr);
    handle->detachCallbacks();
    EXPECT_TRUE(handle->waitForExit(5000ms));
    std::this_thread::sleep_for(100ms);

    EXPECT_EQ(exitCode.load(), -999);
    std::lock_guard<std::mutex> lock(mtx);
    EXPECT_TRUE(outLines.empty());
}
