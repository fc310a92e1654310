#pragma once
#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <condition_variable>
#include <functional>
#include <optional>
#include "core/ConfigManager.h"
#include "backend/BackendStatus.h"
#include "backend/HealthProbe.h"
#include "backend/PortChecker.h"
#include "backend/ProcessLauncher.h"
#include "utils/ObserverList.h"
#include "utils/ScheduledTask.h"

class Logger;

/**
 * @brief 后端进程监管
 *
 * 负责后端服务的启动 / 停止 / 重启、输出采集、健康检查与崩溃自动重启。
 * 同一时刻要么没有后端,要么持有一个自己启动的进程,要么连接到外部已运行的后端;
 * 如果端口上已经有健康的后端,永远不会再启动第二个。
 *
 * 状态变化通过 onStatusChange 推送,启动进度通过 onProgress 推送。
 */
class ProcessSupervisor {
public:
    using StatusCallback = std::function<void(const BackendStatus&)>;
    using ProgressCallback = std::function<void(const std::string&)>;

    static constexpr size_t kMaxLogLines = 50;
    static constexpr size_t kExposedLogLines = 20;

    /**
     * 子进程输出与退出统一以事件形式进入 handleEvent
     * generation 标识产生事件的进程,已被 stop() 回收的进程的退出事件会被忽略
     */
    struct Event {
        enum class Kind { Exited, StdoutLine, StderrLine };
        Kind kind;
        uint64_t generation;
        int exitCode = 0;
        std::string text;

        static Event exited(uint64_t gen, int code) { return {Kind::Exited, gen, code, {}}; }
        static Event stdoutLine(uint64_t gen, std::string line) { return {Kind::StdoutLine, gen, 0, std::move(line)}; }
        static Event stderrLine(uint64_t gen, std::string line) { return {Kind::StderrLine, gen, 0, std::move(line)}; }
    };

    ProcessSupervisor(BackendConfig config,
                      IHealthProbe& probe,
                      IPortChecker& ports,
                      IProcessLauncher& launcher,
                      Logger& logger);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * @brief 启动后端 (已在运行或正在启动时直接返回 true)
     * 进程在变为健康之前以非零码退出时,按 crashRestartLimit 在后台重试
     * @return 后端健康可用时返回 true
     */
    bool start();

    /**
     * @brief 停止后端;外部后端只断开连接,不向进程发送信号
     * 同时放弃进行中的 start() 和已排队的自动重启
     */
    void stop();

    bool restart();

    /**
     * @brief 仅探测端口上是否已有健康的后端,不会启动进程
     */
    bool detectExisting();

    BackendStatus getStatus() const;
    std::vector<std::string> getLogs() const;

    ObserverList<const BackendStatus&>::Id onStatusChange(StatusCallback callback);
    ObserverList<const std::string&>::Id onProgress(ProgressCallback callback);

    /**
     * @brief 热更新配置,下一次 start() 生效
     */
    void applyConfig(const BackendConfig& newConfig);
    BackendConfig getConfig() const;

    bool isConnectedToExternal() const;
    bool isHealthCheckActive() const { return healthTimer.isActive(); }
    std::string healthUrl() const;

private:
    enum class StartOutcome { Ready, Failed, CrashedWhileStarting };

    BackendConfig config;
    IHealthProbe& probe;
    IPortChecker& ports;
    IProcessLauncher& launcher;
    Logger& logger;

    mutable std::mutex mtx;
    std::condition_variable wakeCv;

    std::unique_ptr<IProcessHandle> process;
    uint64_t generation = 0;
    uint64_t exitedGeneration = 0;
    uint64_t stopRequests = 0;  // 每次 stop() 递增,启动流程在各等待点之后比对
    int lastExitCode = 0;
    int startupCrashes = 0;
    bool connectedToExternal = false;
    bool lastHealthCheck = false;
    bool autoRestart = true;
    bool starting = false;
    bool restartPending = false;
    bool shuttingDown = false;
    int consecutiveFailures = 0;
    std::chrono::steady_clock::time_point startTime;
    bool hasStartTime = false;
    std::deque<std::string> logLines;

    ScheduledTask healthTimer;
    ScheduledTask restartTask;

    ObserverList<const BackendStatus&> statusObservers;
    ObserverList<const std::string&> progressObservers;

    void handleEvent(const Event& event);
    void onProcessExited(const Event& event);
    void onOutputLine(const Event& event);

    bool startFrom(uint64_t epoch);
    StartOutcome attemptStart(uint64_t epoch);
    std::optional<std::chrono::milliseconds> retryAfterStartupCrash(uint64_t epoch);

    void startHealthChecks(uint64_t epoch);
    void onHealthTick();
    void scheduleRestart(std::chrono::milliseconds delay, bool fullRestart, uint64_t epoch);
    void runRestart(bool fullRestart, uint64_t epoch);

    bool waitForHealthy(uint64_t gen, uint64_t epoch);
    // 返回 false 表示等待被 stop() 或析构打断
    bool sleepFor(std::chrono::milliseconds duration, uint64_t epoch);

    BackendHealth determineHealth() const;
    BackendStatus statusLocked() const;
    void appendLogLocked(const std::string& line);
    std::vector<std::string> recentLogs(size_t count) const;

    void notifyStatusChange();
    void notifyProgress(const std::string& message);

    static bool isProgressLine(const std::string& line);
};
