#include <gtest/gtest.h>
#include "../src/backend/ProcessSupervisor.h"
#include "../src/utils/Logger.h"
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

class FakeHealthProbe : public IHealthProbe {
public:
    std::atomic<bool> healthy{false};
    std::atomic<int> calls{0};
    std::atomic<int> delayMs{0};

    bool probe(const std::string&, std::chrono::milliseconds) override {
        ++calls;
        if (delayMs > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delayMs.load()));
        return healthy.load();
    }
};

class FakePortChecker : public IPortChecker {
public:
    std::atomic<bool> available{true};
    std::atomic<bool> releaseFrees{true};
    std::atomic<int> releases{0};

    bool isAvailable(int) override { return available.load(); }
    int releasePort(int) override {
        ++releases;
        if (releaseFrees) available = true;
        return 1;
    }
};

// 由测试驱动的假进程: exit() / emit() 模拟子进程退出和输出
struct FakeProcess {
    std::mutex mtx;
    ProcessCallbacks callbacks;
    bool running = true;
    int pid = 0;
    std::atomic<int> terms{0};
    std::atomic<int> kills{0};

    void exit(int code) {
        std::function<void(int)> cb;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!running) return;
            running = false;
            cb = callbacks.onExit;
        }
        if (cb) cb(code);
    }

    void emit(const std::string& line, bool err = false) {
        std::function<void(const std::string&)> cb;
        {
            std::lock_guard<std::mutex> lock(mtx);
            cb = err ? callbacks.onStderrLine : callbacks.onStdoutLine;
        }
        if (cb) cb(line);
    }

    bool isRunning() {
        std::lock_guard<std::mutex> lock(mtx);
        return running;
    }
};

class FakeProcessHandle : public IProcessHandle {
public:
    explicit FakeProcessHandle(std::shared_ptr<FakeProcess> proc) : proc(std::move(proc)) {}
    ~FakeProcessHandle() override { detachCallbacks(); }

    int pid() const override { return proc->pid; }
    bool isRunning() const override { return proc->isRunning(); }
    void terminate() override {
        ++proc->terms;
        proc->exit(143);
    }
    void kill() override {
        ++proc->kills;
        proc->exit(137);
    }
    bool waitForExit(std::chrono::milliseconds) override { return !proc->isRunning(); }
    void detachCallbacks() override {
        std::lock_guard<std::mutex> lock(proc->mtx);
        proc->callbacks = ProcessCallbacks{};
    }

private:
    std::shared_ptr<FakeProcess> proc;
};

class FakeLauncher : public IProcessLauncher {
public:
    explicit FakeLauncher(FakeHealthProbe& probe) : probe(probe) {}

    std::atomic<int> launches{0};
    std::atomic<bool> healthyOnLaunch{true};
    std::atomic<bool> failLaunch{false};
    std::atomic<int> exitCodeOnLaunch{-1};  // >= 0 时进程在 launch 返回前退出
    std::vector<std::string> linesOnLaunch;
    LaunchSpec lastSpec;

    std::unique_ptr<IProcessHandle> launch(const LaunchSpec& spec, ProcessCallbacks callbacks) override {
        if (failLaunch) return nullptr;
        auto proc = std::make_shared<FakeProcess>();
        proc->callbacks = std::move(callbacks);
        {
            std::lock_guard<std::mutex> lock(mtx);
            lastSpec = spec;
            proc->pid = 4000 + static_cast<int>(processes.size());
            processes.push_back(proc);
        }
        ++launches;
        for (const auto& line : linesOnLaunch) proc->emit(line);
        if (healthyOnLaunch) probe.healthy = true;
        auto handle = std::make_unique<FakeProcessHandle>(proc);
        if (exitCodeOnLaunch >= 0) proc->exit(exitCodeOnLaunch);
        return handle;
    }

    std::shared_ptr<FakeProcess> last() {
        std::lock_guard<std::mutex> lock(mtx);
        return processes.empty() ? nullptr : processes.back();
    }

    LaunchSpec spec() {
        std::lock_guard<std::mutex> lock(mtx);
        return lastSpec;
    }

private:
    FakeHealthProbe& probe;
    std::mutex mtx;
    std::vector<std::shared_ptr<FakeProcess>> processes;
};

template <typename Pred>
bool waitUntil(Pred pred, std::chrono::milliseconds timeout = 3000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

class ProcessSupervisorTest : public ::testing::Test {
protected:
    Logger logger{"", false};
    FakeHealthProbe probe;
    FakePortChecker ports;
    FakeLauncher launcher{probe};
    std::unique_ptr<ProcessSupervisor> supervisor;

    fs::path testDir;
    fs::path workspace;
    std::string savedPath;
    std::string savedHome;

    void SetUp() override {
        testDir = fs::temp_directory_path() /
                  (std::string("warden_supervisor_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(testDir);
        workspace = testDir / "ws";
        fs::create_directories(workspace / ".venv" / "bin");
        fs::create_directories(workspace / "copilot-engine");
        std::ofstream(workspace / ".venv" / "bin" / "python") << "#!/bin/sh\n";
        std::ofstream(workspace / "copilot-engine" / "server.py") << "app = None\n";
        fs::create_directories(testDir / "home");

        if (const char* p = std::getenv("PATH")) savedPath = p;
        if (const char* h = std::getenv("HOME")) savedHome = h;
        ::setenv("HOME", (testDir / "home").c_str(), 1);
    }

    void TearDown() override {
        supervisor.reset();
        ::setenv("PATH", savedPath.c_str(), 1);
        ::setenv("HOME", savedHome.c_str(), 1);
        fs::remove_all(testDir);
    }

    BackendConfig fastConfig() {
        BackendConfig cfg;
        cfg.workspacePath = workspace.string();
        cfg.startupTimeout = std::chrono::seconds(5);
        cfg.healthCheckInterval = 20ms;
        cfg.healthCheckTimeout = 10ms;
        cfg.startupProbeTimeout = 10ms;
        cfg.startupPollInterval = 5ms;
        cfg.startupPollTimeout = 5ms;
        cfg.progressInterval = 20ms;
        cfg.stopGrace = 50ms;
        cfg.restartDelay = 10ms;
        cfg.crashRestartDelay = 20ms;
        cfg.portReleaseWait = 5ms;
        return cfg;
    }

    ProcessSupervisor& make(const BackendConfig& cfg) {
        supervisor = std::make_unique<ProcessSupervisor>(cfg, probe, ports, launcher, logger);
        return *supervisor;
    }
};

TEST_F(ProcessSupervisorTest, StartSpawnsAndBecomesHealthy) {
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());

    EXPECT_EQ(launcher.launches.load(), 1);
    auto status = sup.getStatus();
    EXPECT_TRUE(status.running);
    EXPECT_EQ(status.health, BackendHealth::Healthy);
    ASSERT_TRUE(status.processId.has_value());
    EXPECT_EQ(*status.processId, 4000);
    EXPECT_FALSE(status.connectedToExternal);
    EXPECT_TRUE(sup.isHealthCheckActive());

    LaunchSpec spec = launcher.spec();
    EXPECT_EQ(spec.executable, (workspace / ".venv" / "bin" / "python").string());
    std::vector<std::string> expectedArgs = {"-m", "uvicorn", "server:app", "--host", "127.0.0.1", "--port", "7779"};
    EXPECT_EQ(spec.args, expectedArgs);
    EXPECT_EQ(fs::path(spec.workingDir), workspace / "copilot-engine");
}

TEST_F(ProcessSupervisorTest, StartIsIdempotent) {
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());
    EXPECT_TRUE(sup.start());
    EXPECT_EQ(launcher.launches.load(), 1);
}

TEST_F(ProcessSupervisorTest, ConcurrentStartsSpawnOnce) {
    auto& sup = make(fastConfig());
    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&]() { if (sup.start()) ++succeeded; });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(succeeded.load(), 4);
    EXPECT_EQ(launcher.launches.load(), 1);
}

TEST_F(ProcessSupervisorTest, AdoptsExternalBackendWithoutSpawning) {
    probe.healthy = true;
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());

    EXPECT_EQ(launcher.launches.load(), 0);
    auto status = sup.getStatus();
    EXPECT_TRUE(status.running);
    EXPECT_TRUE(status.connectedToExternal);
    EXPECT_FALSE(status.processId.has_value());
    EXPECT_EQ(status.health, BackendHealth::Healthy);
    EXPECT_TRUE(sup.isConnectedToExternal());
}

TEST_F(ProcessSupervisorTest, StopOnExternalOnlyDisconnects) {
    probe.healthy = true;
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());
    ASSERT_TRUE(sup.isHealthCheckActive());

    sup.stop();
    EXPECT_FALSE(sup.isHealthCheckActive());
    EXPECT_FALSE(sup.isConnectedToExternal());
    EXPECT_EQ(launcher.launches.load(), 0);
    EXPECT_EQ(ports.releases.load(), 0);
    auto status = sup.getStatus();
    EXPECT_FALSE(status.running);
    EXPECT_EQ(status.health, BackendHealth::Stopped);
}

TEST_F(ProcessSupervisorTest, DetectExistingWithNothingListening) {
    auto& sup = make(fastConfig());
    EXPECT_FALSE(sup.detectExisting());
    EXPECT_GE(probe.calls.load(), 1);
    EXPECT_EQ(launcher.launches.load(), 0);
    EXPECT_EQ(sup.getStatus().health, BackendHealth::Stopped);
}

TEST_F(ProcessSupervisorTest, DetectExistingAdoptsAndDrops) {
    auto& sup = make(fastConfig());
    std::atomic<int> notifications{0};
    sup.onStatusChange([&](const BackendStatus&) { ++notifications; });

    probe.healthy = true;
    EXPECT_TRUE(sup.detectExisting());
    EXPECT_TRUE(sup.isConnectedToExternal());
    EXPECT_GE(notifications.load(), 1);

    probe.healthy = false;
    EXPECT_FALSE(sup.detectExisting());
    EXPECT_FALSE(sup.isConnectedToExternal());
    EXPECT_EQ(launcher.launches.load(), 0);
}

TEST_F(ProcessSupervisorTest, ThreeFailedChecksTriggerOneRestart) {
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());
    auto first = launcher.last();

    probe.healthy = false;
    ASSERT_TRUE(waitUntil([&] { return launcher.launches.load() == 2; }));
    ASSERT_TRUE(waitUntil([&] { return sup.getStatus().health == BackendHealth::Healthy; }));

    EXPECT_EQ(first->terms.load(), 1);
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(launcher.launches.load(), 2);
    EXPECT_TRUE(sup.isHealthCheckActive());
}

TEST_F(ProcessSupervisorTest, FailuresBelowThresholdReportUnhealthy) {
    BackendConfig cfg = fastConfig();
    cfg.failureThreshold = 1000;
    auto& sup = make(cfg);
    ASSERT_TRUE(sup.start());

    probe.healthy = false;
    ASSERT_TRUE(waitUntil([&] { return sup.getStatus().health == BackendHealth::Unhealthy; }));
    EXPECT_EQ(launcher.launches.load(), 1);

    probe.healthy = true;
    EXPECT_TRUE(waitUntil([&] { return sup.getStatus().health == BackendHealth::Healthy; }));
}

TEST_F(ProcessSupervisorTest, ExternalDisconnectsAfterThreshold) {
    probe.healthy = true;
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());

    probe.healthy = false;
    ASSERT_TRUE(waitUntil([&] { return !sup.isConnectedToExternal(); }));
    EXPECT_EQ(launcher.launches.load(), 0);
    EXPECT_EQ(sup.getStatus().health, BackendHealth::Stopped);
}

TEST_F(ProcessSupervisorTest, CrashIsAutoRestarted) {
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());

    std::mutex seenMtx;
    std::vector<BackendHealth> seen;
    sup.onStatusChange([&](const BackendStatus& s) {
        std::lock_guard<std::mutex> lock(seenMtx);
        seen.push_back(s.health);
    });

    probe.healthy = false;
    launcher.last()->exit(1);

    ASSERT_TRUE(waitUntil([&] { return launcher.launches.load() == 2; }));
    ASSERT_TRUE(waitUntil([&] { return sup.getStatus().health == BackendHealth::Healthy; }));

    std::lock_guard<std::mutex> lock(seenMtx);
    auto unhealthy = std::find(seen.begin(), seen.end(), BackendHealth::Unhealthy);
    ASSERT_NE(unhealthy, seen.end());
    auto starting = std::find(unhealthy, seen.end(), BackendHealth::Starting);
    ASSERT_NE(starting, seen.end());
    EXPECT_NE(std::find(starting, seen.end(), BackendHealth::Healthy), seen.end());
}

TEST_F(ProcessSupervisorTest, CleanExitIsNotRestarted) {
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());

    probe.healthy = false;
    launcher.last()->exit(0);
    std::this_thread::sleep_for(100ms);

    EXPECT_EQ(launcher.launches.load(), 1);
    auto status = sup.getStatus();
    EXPECT_FALSE(status.running);
    EXPECT_EQ(status.health, BackendHealth::Stopped);
    EXPECT_FALSE(sup.isHealthCheckActive());
}

TEST_F(ProcessSupervisorTest, CrashWithAutoRestartDisabledStaysDown) {
    BackendConfig cfg = fastConfig();
    cfg.autoRestart = false;
    auto& sup = make(cfg);
    ASSERT_TRUE(sup.start());

    probe.healthy = false;
    launcher.last()->exit(1);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(launcher.launches.load(), 1);
    EXPECT_EQ(sup.getStatus().health, BackendHealth::Stopped);
}

TEST_F(ProcessSupervisorTest, StopTerminatesAndDoesNotRestart) {
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());
    auto proc = launcher.last();

    probe.healthy = false;
    sup.stop();
    EXPECT_EQ(proc->terms.load(), 1);
    EXPECT_EQ(proc->kills.load(), 0);
    EXPECT_FALSE(sup.isHealthCheckActive());

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(launcher.launches.load(), 1);
    auto status = sup.getStatus();
    EXPECT_FALSE(status.running);
    EXPECT_FALSE(status.processId.has_value());
    EXPECT_EQ(status.health, BackendHealth::Stopped);
}

TEST_F(ProcessSupervisorTest, StopWhenNotRunningIsHarmless) {
    auto& sup = make(fastConfig());
    sup.stop();
    EXPECT_EQ(sup.getStatus().health, BackendHealth::Stopped);
}

TEST_F(ProcessSupervisorTest, RestartSpawnsFreshProcess) {
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());
    probe.healthy = false;
    EXPECT_TRUE(sup.restart());
    EXPECT_EQ(launcher.launches.load(), 2);
    EXPECT_EQ(*sup.getStatus().processId, 4001);
}

TEST_F(ProcessSupervisorTest, StartupTimeoutKeepsLogs) {
    BackendConfig cfg = fastConfig();
    cfg.startupTimeout = std::chrono::seconds(1);
    launcher.healthyOnLaunch = false;
    launcher.linesOnLaunch = {"Step 1/3: loading index", "Traceback: boom"};
    auto& sup = make(cfg);

    std::mutex progressMtx;
    std::vector<std::string> progress;
    sup.onProgress([&](const std::string& msg) {
        std::lock_guard<std::mutex> lock(progressMtx);
        progress.push_back(msg);
    });

    EXPECT_FALSE(sup.start());
    EXPECT_EQ(launcher.last()->terms.load(), 1);

    auto logs = sup.getLogs();
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_EQ(logs[0], "Step 1/3: loading index");
    EXPECT_EQ(sup.getStatus().health, BackendHealth::Stopped);

    std::lock_guard<std::mutex> lock(progressMtx);
    EXPECT_NE(std::find(progress.begin(), progress.end(), "Step 1/3: loading index"), progress.end());
    bool sawWaiting = false;
    for (const auto& p : progress) {
        if (p.find("Waiting for backend...") != std::string::npos) sawWaiting = true;
    }
    EXPECT_TRUE(sawWaiting);
}

TEST_F(ProcessSupervisorTest, ExitDuringStartupIsRetried) {
    launcher.healthyOnLaunch = false;
    auto& sup = make(fastConfig());

    std::thread crasher([&]() {
        if (waitUntil([&] { return launcher.last() != nullptr; })) {
            std::this_thread::sleep_for(20ms);
            launcher.healthyOnLaunch = true;
            launcher.last()->exit(1);
        }
    });
    EXPECT_FALSE(sup.start());
    crasher.join();

    ASSERT_TRUE(waitUntil([&] { return launcher.launches.load() == 2; }));
    ASSERT_TRUE(waitUntil([&] { return sup.getStatus().health == BackendHealth::Healthy; }));
    EXPECT_TRUE(sup.getStatus().running);
    EXPECT_TRUE(sup.isHealthCheckActive());
}

TEST_F(ProcessSupervisorTest, RepeatedStartupCrashesStopAtLimit) {
    BackendConfig cfg = fastConfig();
    cfg.crashRestartLimit = 2;
    launcher.healthyOnLaunch = false;
    launcher.exitCodeOnLaunch = 1;
    auto& sup = make(cfg);

    EXPECT_FALSE(sup.start());
    ASSERT_TRUE(waitUntil([&] { return launcher.launches.load() == 3; }));
    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(launcher.launches.load(), 3);
    auto status = sup.getStatus();
    EXPECT_FALSE(status.running);
    EXPECT_EQ(status.health, BackendHealth::Stopped);
}

TEST_F(ProcessSupervisorTest, CleanExitDuringStartupIsNotRetried) {
    launcher.healthyOnLaunch = false;
    launcher.exitCodeOnLaunch = 0;
    auto& sup = make(fastConfig());

    EXPECT_FALSE(sup.start());
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(launcher.launches.load(), 1);
    EXPECT_EQ(sup.getStatus().health, BackendHealth::Stopped);
}

TEST_F(ProcessSupervisorTest, StopDuringCrashRestartProbeSpawnsNothing) {
    BackendConfig cfg = fastConfig();
    cfg.crashRestartDelay = 10ms;
    cfg.startupProbeTimeout = 200ms;
    auto& sup = make(cfg);
    ASSERT_TRUE(sup.start());

    probe.healthy = false;
    probe.delayMs = 200;
    launcher.last()->exit(1);

    // 重启任务此时正卡在首次健康探测中
    std::this_thread::sleep_for(100ms);
    sup.stop();
    std::this_thread::sleep_for(500ms);

    EXPECT_EQ(launcher.launches.load(), 1);
    auto status = sup.getStatus();
    EXPECT_FALSE(status.running);
    EXPECT_EQ(status.health, BackendHealth::Stopped);
    EXPECT_FALSE(sup.isHealthCheckActive());
}

TEST_F(ProcessSupervisorTest, StopDuringPortReleaseWaitSpawnsNothing) {
    BackendConfig cfg = fastConfig();
    cfg.crashRestartDelay = 10ms;
    cfg.portReleaseWait = 5000ms;
    auto& sup = make(cfg);
    ASSERT_TRUE(sup.start());

    probe.healthy = false;
    ports.available = false;
    launcher.last()->exit(1);
    ASSERT_TRUE(waitUntil([&] { return ports.releases.load() == 1; }));

    auto before = std::chrono::steady_clock::now();
    sup.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - before, 2000ms);

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(launcher.launches.load(), 1);
    EXPECT_FALSE(sup.getStatus().running);
}

TEST_F(ProcessSupervisorTest, MissingInterpreterFails) {
    fs::remove_all(workspace / ".venv");
    fs::create_directories(testDir / "emptybin");
    ::setenv("PATH", (testDir / "emptybin").c_str(), 1);

    auto& sup = make(fastConfig());
    EXPECT_FALSE(sup.start());
    EXPECT_EQ(launcher.launches.load(), 0);
    EXPECT_EQ(sup.getStatus().health, BackendHealth::Stopped);
}

TEST_F(ProcessSupervisorTest, MissingServerScriptFails) {
    fs::remove_all(workspace / "copilot-engine");
    auto& sup = make(fastConfig());
    EXPECT_FALSE(sup.start());
    EXPECT_EQ(launcher.launches.load(), 0);
}

TEST_F(ProcessSupervisorTest, ConfiguredServerPathWins) {
    fs::create_directories(testDir / "engine");
    std::ofstream(testDir / "engine" / "main.py") << "app = None\n";
    BackendConfig cfg = fastConfig();
    cfg.serverPath = (testDir / "engine" / "main.py").string();
    auto& sup = make(cfg);

    ASSERT_TRUE(sup.start());
    LaunchSpec spec = launcher.spec();
    EXPECT_EQ(spec.args[2], "main:app");
    EXPECT_EQ(fs::path(spec.workingDir), testDir / "engine");
}

TEST_F(ProcessSupervisorTest, OccupiedPortIsReleasedOnce) {
    ports.available = false;
    auto& sup = make(fastConfig());
    EXPECT_TRUE(sup.start());
    EXPECT_EQ(ports.releases.load(), 1);
    EXPECT_EQ(launcher.launches.load(), 1);
}

TEST_F(ProcessSupervisorTest, PortStillOccupiedIsFatal) {
    ports.available = false;
    ports.releaseFrees = false;
    auto& sup = make(fastConfig());
    EXPECT_FALSE(sup.start());
    EXPECT_EQ(ports.releases.load(), 1);
    EXPECT_EQ(launcher.launches.load(), 0);
}

TEST_F(ProcessSupervisorTest, LaunchFailureReturnsFalse) {
    launcher.failLaunch = true;
    auto& sup = make(fastConfig());
    EXPECT_FALSE(sup.start());
    EXPECT_FALSE(sup.getStatus().running);
}

TEST_F(ProcessSupervisorTest, LogBufferKeepsRecentLines) {
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());
    auto proc = launcher.last();
    for (int i = 0; i < 60; ++i) {
        proc->emit("line " + std::to_string(i), i % 2 == 1);
    }

    auto logs = sup.getLogs();
    ASSERT_EQ(logs.size(), ProcessSupervisor::kExposedLogLines);
    EXPECT_EQ(logs.front(), "line 40");
    EXPECT_EQ(logs.back(), "line 59");
    EXPECT_EQ(sup.getStatus().lastLogLine, "line 59");
}

TEST_F(ProcessSupervisorTest, ThrowingObserverDoesNotStarveOthers) {
    auto& sup = make(fastConfig());
    std::atomic<int> reached{0};
    sup.onStatusChange([](const BackendStatus&) { throw std::runtime_error("observer failure"); });
    sup.onStatusChange([&](const BackendStatus&) { ++reached; });

    ASSERT_TRUE(sup.start());
    EXPECT_GE(reached.load(), 1);
}

TEST_F(ProcessSupervisorTest, DestructorStopsOwnedProcess) {
    auto& sup = make(fastConfig());
    ASSERT_TRUE(sup.start());
    auto proc = launcher.last();

    supervisor.reset();
    EXPECT_FALSE(proc->isRunning());
    EXPECT_EQ(proc->terms.load(), 1);
}

TEST_F(ProcessSupervisorTest, AppliedConfigUsedOnNextStart) {
    auto& sup = make(fastConfig());
    BackendConfig cfg = fastConfig();
    cfg.port = 8123;
    sup.applyConfig(cfg);
    EXPECT_EQ(sup.healthUrl(), "http://127.0.0.1:8123/health");

    ASSERT_TRUE(sup.start());
    EXPECT_EQ(launcher.spec().args.back(), "8123");
    EXPECT_EQ(sup.getStatus().port, 8123);
}
