#include "backend/ProcessSupervisor.h"
#include "backend/InterpreterLocator.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace {
std::string toLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

long long secondsSince(std::chrono::steady_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - t).count();
}
} // namespace

ProcessSupervisor::ProcessSupervisor(BackendConfig config,
                                     IHealthProbe& probe,
                                     IPortChecker& ports,
                                     IProcessLauncher& launcher,
                                     Logger& logger)
    : config(std::move(config)),
      probe(probe),
      ports(ports),
      launcher(launcher),
      logger(logger),
      statusObservers(logger, "Backend"),
      progressObservers(logger, "Backend") {
    autoRestart = this->config.autoRestart;
}

ProcessSupervisor::~ProcessSupervisor() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        shuttingDown = true;
        autoRestart = false;
        ++stopRequests;
    }
    wakeCv.notify_all();

    // 正在进行的 start() 会因 shuttingDown 提前返回
    restartTask.cancel();
    healthTimer.cancel();

    std::unique_ptr<IProcessHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mtx);
        handle = std::move(process);
        ++generation;
    }
    if (handle) {
        handle->detachCallbacks();
        handle->terminate();
        if (!handle->waitForExit(config.stopGrace)) {
            handle->kill();
            handle->waitForExit(std::chrono::seconds(1));
        }
    }
}

ObserverList<const BackendStatus&>::Id ProcessSupervisor::onStatusChange(StatusCallback callback) {
    return statusObservers.add(std::move(callback));
}

ObserverList<const std::string&>::Id ProcessSupervisor::onProgress(ProgressCallback callback) {
    return progressObservers.add(std::move(callback));
}

std::string ProcessSupervisor::healthUrl() const {
    std::lock_guard<std::mutex> lock(mtx);
    return config.baseUrl() + "/health";
}

BackendConfig ProcessSupervisor::getConfig() const {
    std::lock_guard<std::mutex> lock(mtx);
    return config;
}

void ProcessSupervisor::applyConfig(const BackendConfig& newConfig) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (newConfig.port != config.port && (process || connectedToExternal)) {
            logger.warn("Port change to " + std::to_string(newConfig.port) + " takes effect after restart");
        }
        config = newConfig;
        if (process) autoRestart = config.autoRestart;
    }
    logger.info("Backend configuration updated");
}

bool ProcessSupervisor::isConnectedToExternal() const {
    std::lock_guard<std::mutex> lock(mtx);
    return connectedToExternal;
}

// ────────────────────────────────────────────────────────────
// Status
// ────────────────────────────────────────────────────────────

BackendHealth ProcessSupervisor::determineHealth() const {
    if (connectedToExternal) {
        return lastHealthCheck ? BackendHealth::Healthy : BackendHealth::Unhealthy;
    }
    if (!process) {
        if (starting) return BackendHealth::Starting;
        // 崩溃后等待自动重启
        if (restartPending) return BackendHealth::Unhealthy;
        return BackendHealth::Stopped;
    }
    if (lastHealthCheck) return BackendHealth::Healthy;
    if (consecutiveFailures > 0) return BackendHealth::Unhealthy;
    return BackendHealth::Starting;
}

BackendStatus ProcessSupervisor::statusLocked() const {
    BackendStatus status;
    status.running = process != nullptr || connectedToExternal;
    status.port = config.port;
    if (process) status.processId = process->pid();
    status.uptimeSeconds = hasStartTime ? secondsSince(startTime) : 0;
    status.health = determineHealth();
    status.lastLogLine = logLines.empty() ? "" : logLines.back();
    status.connectedToExternal = connectedToExternal;
    return status;
}

BackendStatus ProcessSupervisor::getStatus() const {
    std::lock_guard<std::mutex> lock(mtx);
    return statusLocked();
}

std::vector<std::string> ProcessSupervisor::recentLogs(size_t count) const {
    std::lock_guard<std::mutex> lock(mtx);
    size_t n = std::min(count, logLines.size());
    return std::vector<std::string>(logLines.end() - static_cast<std::ptrdiff_t>(n), logLines.end());
}

std::vector<std::string> ProcessSupervisor::getLogs() const {
    return recentLogs(kExposedLogLines);
}

void ProcessSupervisor::appendLogLocked(const std::string& line) {
    logLines.push_back(line);
    while (logLines.size() > kMaxLogLines) {
        logLines.pop_front();
    }
}

void ProcessSupervisor::notifyStatusChange() {
    BackendStatus status = getStatus();
    logger.debug(std::string("[NotifyStatus] running=") + (status.running ? "true" : "false") +
                 ", health=" + toString(status.health));
    statusObservers.notify(status);
}

void ProcessSupervisor::notifyProgress(const std::string& message) {
    progressObservers.notify(message);
}

// ────────────────────────────────────────────────────────────
// Lifecycle
// ────────────────────────────────────────────────────────────

bool ProcessSupervisor::detectExisting() {
    logger.info("[DetectExisting] Checking health...");
    std::string url;
    std::chrono::milliseconds timeout;
    {
        std::lock_guard<std::mutex> lock(mtx);
        url = config.baseUrl() + "/health";
        timeout = config.startupProbeTimeout;
    }

    bool healthy = probe.probe(url, timeout);
    logger.info(std::string("[DetectExisting] Health result: ") + (healthy ? "true" : "false"));

    bool adopted = false;
    bool dropped = false;
    int port = 0;
    uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        port = config.port;
        epoch = stopRequests;
        if (healthy) {
            if (!connectedToExternal && !process && !starting) {
                connectedToExternal = true;
                consecutiveFailures = 0;
                if (!hasStartTime) {
                    startTime = std::chrono::steady_clock::now();
                    hasStartTime = true;
                }
                adopted = true;
            }
            if (connectedToExternal || process) lastHealthCheck = true;
        } else if (connectedToExternal) {
            connectedToExternal = false;
            lastHealthCheck = false;
            hasStartTime = false;
            dropped = true;
        }
    }

    if (adopted) {
        startHealthChecks(epoch);
        logger.success("Detected running backend on port " + std::to_string(port));
    }
    if (dropped) {
        healthTimer.cancel();
        logger.info("[DetectExisting] Backend not running, disconnected");
    }
    notifyStatusChange();
    return healthy;
}

bool ProcessSupervisor::start() {
    uint64_t epoch;
    {
        std::lock_guard<std::mutex> lock(mtx);
        epoch = stopRequests;
        startupCrashes = 0;
    }
    return startFrom(epoch);
}

bool ProcessSupervisor::startFrom(uint64_t epoch) {
    StartOutcome outcome = attemptStart(epoch);
    if (outcome == StartOutcome::CrashedWhileStarting) {
        if (auto delay = retryAfterStartupCrash(epoch)) {
            notifyStatusChange();
            scheduleRestart(*delay, false, epoch);
        }
    }
    return outcome == StartOutcome::Ready;
}

ProcessSupervisor::StartOutcome ProcessSupervisor::attemptStart(uint64_t epoch) {
    BackendConfig cfg;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (shuttingDown || stopRequests != epoch) return StartOutcome::Failed;
        if (process || connectedToExternal) {
            logger.warn("Backend already running");
            return StartOutcome::Ready;
        }
        if (starting) {
            logger.warn("Backend start already in progress");
            return StartOutcome::Ready;
        }
        starting = true;
        restartPending = false;
        autoRestart = config.autoRestart;
        lastHealthCheck = false;
        consecutiveFailures = 0;
        cfg = config;
    }

    // 无论从哪个分支返回都要清除 starting,并推送最终状态
    struct StartingReset {
        ProcessSupervisor& self;
        ~StartingReset() {
            {
                std::lock_guard<std::mutex> lock(self.mtx);
                self.starting = false;
            }
            self.notifyStatusChange();
        }
    } startingReset{*this};

    const std::string url = cfg.baseUrl() + "/health";
    const std::string portStr = std::to_string(cfg.port);

    logger.section("BACKEND MANAGER");
    logger.info("Checking for backend on port " + portStr + "...");
    notifyStatusChange();

    // 1. 端口上已有健康后端: 直接接管,绝不重复启动
    const bool alreadyServing = probe.probe(url, cfg.startupProbeTimeout);
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopRequests != epoch) {
            logger.info("Backend start cancelled");
            return StartOutcome::Failed;
        }
        if (alreadyServing) {
            connectedToExternal = true;
            lastHealthCheck = true;
            startTime = std::chrono::steady_clock::now();
            hasStartTime = true;
        }
    }
    if (alreadyServing) {
        logger.success("Found healthy backend already running on port " + portStr);
        startHealthChecks(epoch);
        return StartOutcome::Ready;
    }

    logger.info("No existing backend found. Attempting to start new backend...");

    // 2. 解释器与入口脚本
    InterpreterLocator locator(cfg, logger);
    auto pythonPath = locator.findPython();
    if (!pythonPath) {
        logger.error("Python not found. Install Python 3.8+ or set backend.python_path");
        return StartOutcome::Failed;
    }
    auto serverPath = locator.findServerScript();
    if (!serverPath) {
        logger.error("server.py not found - cannot start backend locally");
        logger.separator();
        logger.warn("WORKAROUND OPTIONS:");
        logger.info("  1. Start backend manually: cd " + cfg.engineDir +
                    " && python -m uvicorn server:app --port " + portStr);
        logger.info("  2. Configure path in settings: backend.server_path");
        logger.info("  3. Add the engine directory to backend.server_search_paths");
        logger.separator();
        return StartOutcome::Failed;
    }

    // 3. 端口被无响应的进程占用 (前面已确认它不是健康后端)
    if (!ports.isAvailable(cfg.port)) {
        logger.warn("Port " + portStr + " is occupied by non-responsive process. Killing it...");
        ports.releasePort(cfg.port);
        if (!sleepFor(cfg.portReleaseWait, epoch)) {
            logger.info("Backend start cancelled");
            return StartOutcome::Failed;
        }
        if (!ports.isAvailable(cfg.port)) {
            logger.error("Failed to free port " + portStr + ". Please close any process using this port manually.");
            return StartOutcome::Failed;
        }
    }

    // 4. 启动进程
    fs::path script = fs::u8path(*serverPath);
    LaunchSpec spec;
    spec.executable = *pythonPath;
    spec.args = {"-m", "uvicorn", script.stem().u8string() + ":app",
                 "--host", cfg.host, "--port", portStr};
    spec.workingDir = script.parent_path().u8string();

    uint64_t gen;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopRequests != epoch) {
            logger.info("Backend start cancelled");
            return StartOutcome::Failed;
        }
        gen = ++generation;
    }

    ProcessCallbacks callbacks;
    callbacks.onStdoutLine = [this, gen](const std::string& line) { handleEvent(Event::stdoutLine(gen, line)); };
    callbacks.onStderrLine = [this, gen](const std::string& line) { handleEvent(Event::stderrLine(gen, line)); };
    callbacks.onExit = [this, gen](int code) { handleEvent(Event::exited(gen, code)); };

    auto handle = launcher.launch(spec, std::move(callbacks));
    if (!handle) {
        logger.error("Failed to spawn backend process: " + *pythonPath);
        return StartOutcome::Failed;
    }

    int pid = handle->pid();
    bool orphaned = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (generation != gen) {
            // launch 期间收到了 stop(),这个进程不再归我们所有
            orphaned = true;
        } else if (exitedGeneration != gen) {
            // 进程可能在 launch 返回之前就已经退出
            process = std::move(handle);
            startTime = std::chrono::steady_clock::now();
            hasStartTime = true;
        }
    }
    if (orphaned) {
        logger.info("Backend start cancelled, terminating PID " + std::to_string(pid));
        handle->detachCallbacks();
        handle->terminate();
        if (!handle->waitForExit(cfg.stopGrace)) {
            handle->kill();
            if (!handle->waitForExit(std::chrono::seconds(1))) {
                logger.error("Backend process " + std::to_string(pid) + " did not exit after SIGKILL");
            }
        }
        return StartOutcome::Failed;
    }
    notifyStatusChange();

    // 5. 等待健康
    auto timeoutMinutes = std::chrono::duration_cast<std::chrono::minutes>(cfg.startupTimeout).count();
    logger.info("Waiting for backend to initialize (timeout: " + std::to_string(timeoutMinutes) + " min)...");

    if (waitForHealthy(gen, epoch)) {
        bool owned;
        {
            std::lock_guard<std::mutex> lock(mtx);
            owned = process != nullptr && generation == gen && stopRequests == epoch;
            if (owned) {
                lastHealthCheck = true;
                consecutiveFailures = 0;
                startupCrashes = 0;
            }
        }
        if (owned) {
            logger.success("Backend started on port " + portStr + " (PID " + std::to_string(pid) + ")");
            startHealthChecks(epoch);
            return StartOutcome::Ready;
        }
    }

    bool stillOwned;
    bool crashed;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (stopRequests != epoch) {
            logger.info("Backend start cancelled");
            return StartOutcome::Failed;
        }
        stillOwned = process != nullptr && generation == gen;
        crashed = !stillOwned && exitedGeneration == gen && lastExitCode != 0;
    }

    logger.separator();
    logger.error("RECENT BACKEND LOGS:");
    auto recent = recentLogs(10);
    if (!recent.empty()) {
        for (const auto& line : recent) logger.info("  " + line);
    } else {
        logger.warn("  No log output captured - backend may have crashed immediately");
    }
    logger.separator();

    if (!stillOwned) {
        logger.error("Backend exited before becoming healthy");
        return crashed ? StartOutcome::CrashedWhileStarting : StartOutcome::Failed;
    }

    logger.error("Backend failed to become healthy within " + std::to_string(timeoutMinutes) + " minutes");
    logger.error("TROUBLESHOOTING:");
    logger.info("  1. Check if Python 3.8+ is installed");
    logger.info("  2. Check if required packages are installed: pip install -r requirements.txt");
    logger.info("  3. Check if port " + portStr + " is in use: lsof -i:" + portStr);
    logger.info("  4. Try starting manually in terminal to see full errors");
    logger.info("  5. Check server.py exists in the " + cfg.engineDir + " folder");
    logger.separator();
    logger.warn("Large projects may take longer. Increase backend.startup_timeout_seconds in settings.");
    stop();
    return StartOutcome::Failed;
}

std::optional<std::chrono::milliseconds> ProcessSupervisor::retryAfterStartupCrash(uint64_t epoch) {
    int attempt;
    int limit;
    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!autoRestart || shuttingDown || stopRequests != epoch) return std::nullopt;
        limit = config.crashRestartLimit;
        delay = config.crashRestartDelay;
        attempt = ++startupCrashes;
        if (attempt <= limit) restartPending = true;
    }

    if (attempt > limit) {
        logger.error("Backend crashed during startup " + std::to_string(attempt) +
                     " times in a row. Auto-restart gives up until the next start");
        return std::nullopt;
    }
    logger.warn("Backend crashed during startup. Retrying in " + std::to_string(delay.count()) + "ms (" +
                std::to_string(attempt) + "/" + std::to_string(limit) + ")...");
    return delay;
}

bool ProcessSupervisor::waitForHealthy(uint64_t gen, uint64_t epoch) {
    std::string url;
    BackendConfig cfg;
    {
        std::lock_guard<std::mutex> lock(mtx);
        url = config.baseUrl() + "/health";
        cfg = config;
    }

    const auto begin = std::chrono::steady_clock::now();
    const auto deadline = begin + cfg.startupTimeout;
    const auto timeoutMinutes = std::chrono::duration_cast<std::chrono::minutes>(cfg.startupTimeout).count();
    auto lastProgress = std::chrono::milliseconds(0);
    auto lastHint = std::chrono::seconds(0);

    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (shuttingDown || stopRequests != epoch || generation != gen || exitedGeneration == gen) return false;
        }

        if (probe.probe(url, cfg.startupPollTimeout)) {
            return true;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);
        if (elapsed - lastProgress >= cfg.progressInterval) {
            auto seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed);
            std::string msg = "Waiting for backend... (" + std::to_string(seconds.count()) + "s / " +
                              std::to_string(timeoutMinutes) + "min)";
            logger.info("⏳ " + msg);
            notifyProgress(msg);
            if (seconds.count() > 60 && seconds - lastHint >= std::chrono::seconds(30)) {
                std::string scanMsg = "Large projects (1000+ files) may take " + std::to_string(timeoutMinutes) +
                                      " minutes to scan all files...";
                logger.info("   " + scanMsg);
                notifyProgress(scanMsg);
                lastHint = seconds;
            }
            lastProgress = elapsed;
        }

        if (!sleepFor(cfg.startupPollInterval, epoch)) return false;
    }
    return false;
}

bool ProcessSupervisor::sleepFor(std::chrono::milliseconds duration, uint64_t epoch) {
    std::unique_lock<std::mutex> lock(mtx);
    return !wakeCv.wait_for(lock, duration, [&] { return shuttingDown || stopRequests != epoch; });
}

void ProcessSupervisor::stop() {
    std::unique_ptr<IProcessHandle> handle;
    bool wasExternal = false;
    bool wasStarting = false;
    bool hadPendingRestart = false;
    std::chrono::milliseconds grace;
    {
        std::lock_guard<std::mutex> lock(mtx);
        // 进行中的 start() 和已排队的重启都以 stopRequests 为准放弃
        ++stopRequests;
        ++generation;
        hadPendingRestart = restartPending;
        restartPending = false;
        wasStarting = starting;
        startupCrashes = 0;
        if (connectedToExternal) {
            connectedToExternal = false;
            lastHealthCheck = false;
            consecutiveFailures = 0;
            hasStartTime = false;
            wasExternal = true;
        } else if (process) {
            autoRestart = false;
            handle = std::move(process);
            lastHealthCheck = false;
            consecutiveFailures = 0;
            hasStartTime = false;
        }
        grace = config.stopGrace;
    }
    wakeCv.notify_all();

    // 在重启任务自身线程中调用时不能等待它结束
    if (!restartTask.isWorkerThread()) restartTask.cancel();
    healthTimer.cancel();

    if (wasExternal) {
        logger.info("Disconnecting from external backend...");
        notifyStatusChange();
        logger.success("Disconnected from backend");
        return;
    }

    if (!handle) {
        logger.info(wasStarting ? "Backend start cancelled by stop request" : "Backend not running");
        if (hadPendingRestart || wasStarting) notifyStatusChange();
        return;
    }

    logger.info("Stopping backend...");
    handle->terminate();
    if (!handle->waitForExit(grace)) {
        logger.warn("Backend did not exit within " + std::to_string(grace.count()) + "ms, sending SIGKILL");
        handle->kill();
        if (!handle->waitForExit(std::chrono::seconds(1))) {
            logger.error("Backend process " + std::to_string(handle->pid()) + " did not exit after SIGKILL");
        }
    }
    handle.reset();

    notifyStatusChange();
    logger.success("Backend stopped");
}

bool ProcessSupervisor::restart() {
    logger.info("Restarting backend...");
    stop();
    uint64_t epoch;
    std::chrono::milliseconds delay;
    {
        std::lock_guard<std::mutex> lock(mtx);
        epoch = stopRequests;
        delay = config.restartDelay;
    }
    if (!sleepFor(delay, epoch)) return false;
    return startFrom(epoch);
}

void ProcessSupervisor::scheduleRestart(std::chrono::milliseconds delay, bool fullRestart, uint64_t epoch) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        restartPending = true;
    }
    restartTask.startOnce(delay, [this, fullRestart, epoch]() { runRestart(fullRestart, epoch); });
}

void ProcessSupervisor::runRestart(bool fullRestart, uint64_t epoch) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        restartPending = false;
        if (shuttingDown || stopRequests != epoch) return;
    }

    if (fullRestart) {
        logger.info("Restarting backend...");
        stop();
        std::chrono::milliseconds delay;
        {
            std::lock_guard<std::mutex> lock(mtx);
            epoch = stopRequests;
            delay = config.restartDelay;
        }
        if (!sleepFor(delay, epoch)) return;
    }

    // 启动阶段的崩溃在本线程内重试,不再重新调度 restartTask
    while (attemptStart(epoch) == StartOutcome::CrashedWhileStarting) {
        auto delay = retryAfterStartupCrash(epoch);
        if (!delay) return;
        notifyStatusChange();
        if (!sleepFor(*delay, epoch)) return;
    }
}

// ────────────────────────────────────────────────────────────
// Events
// ────────────────────────────────────────────────────────────

void ProcessSupervisor::handleEvent(const Event& event) {
    switch (event.kind) {
        case Event::Kind::Exited:
            onProcessExited(event);
            break;
        case Event::Kind::StdoutLine:
        case Event::Kind::StderrLine:
            onOutputLine(event);
            break;
    }
}

void ProcessSupervisor::onOutputLine(const Event& event) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        appendLogLocked(event.text);
    }

    const std::string& line = event.text;
    if (event.kind == Event::Kind::StdoutLine) {
        logger.info("[Backend] " + line);
        if (isProgressLine(line)) {
            notifyProgress(line);
        }
    } else {
        std::string lower = toLower(line);
        if (lower.find("error") != std::string::npos || lower.find("exception") != std::string::npos ||
            lower.find("traceback") != std::string::npos) {
            logger.error("[Backend ERROR] " + line);
        } else if (lower.find("warning") != std::string::npos) {
            logger.warn("[Backend WARN] " + line);
        } else {
            logger.warn("[Backend] " + line);
        }
    }
    notifyStatusChange();
}

void ProcessSupervisor::onProcessExited(const Event& event) {
    std::unique_ptr<IProcessHandle> handle;
    bool scheduleCrashRestart = false;
    std::chrono::milliseconds delay;
    uint64_t epoch;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (event.generation != generation) {
            logger.debug("Ignoring exit of retired backend process (code=" + std::to_string(event.exitCode) + ")");
            return;
        }
        exitedGeneration = event.generation;
        lastExitCode = event.exitCode;
        handle = std::move(process);
        lastHealthCheck = false;
        consecutiveFailures = 0;
        hasStartTime = false;
        // 启动过程中的退出由 start() 处理重试
        scheduleCrashRestart = autoRestart && event.exitCode != 0 && !starting && !shuttingDown;
        if (scheduleCrashRestart) restartPending = true;
        delay = config.crashRestartDelay;
        epoch = stopRequests;
    }

    logger.warn("Backend exited (code=" + std::to_string(event.exitCode) + ")");
    healthTimer.cancel();
    // 在进程自身的回调线程中释放句柄
    handle.reset();
    notifyStatusChange();

    if (scheduleCrashRestart) {
        logger.info("Auto-restarting backend in " + std::to_string(delay.count()) + "ms...");
        scheduleRestart(delay, false, epoch);
    }
}

// ────────────────────────────────────────────────────────────
// Health checks
// ────────────────────────────────────────────────────────────

void ProcessSupervisor::startHealthChecks(uint64_t epoch) {
    std::chrono::milliseconds interval;
    {
        std::lock_guard<std::mutex> lock(mtx);
        interval = config.healthCheckInterval;
        consecutiveFailures = 0;
    }
    healthTimer.startPeriodic(interval, [this]() { onHealthTick(); });

    // stop() 可能在定时器启动之前就已经取消过它
    bool stale;
    {
        std::lock_guard<std::mutex> lock(mtx);
        stale = stopRequests != epoch;
    }
    if (stale) healthTimer.cancel();
}

void ProcessSupervisor::onHealthTick() {
    std::string url;
    std::chrono::milliseconds timeout;
    uint64_t epoch;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!process && !connectedToExternal) return;
        url = config.baseUrl() + "/health";
        timeout = config.healthCheckTimeout;
        epoch = stopRequests;
    }

    bool healthy = probe.probe(url, timeout);

    bool doRestart = false;
    std::string message;
    bool isWarning = true;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if ((!process && !connectedToExternal) || stopRequests != epoch) return;
        const int threshold = config.failureThreshold;
        lastHealthCheck = healthy;
        if (!healthy) {
            ++consecutiveFailures;
            if (connectedToExternal) {
                if (consecutiveFailures >= threshold) {
                    message = "External backend unresponsive after " + std::to_string(consecutiveFailures) + " failed checks";
                    connectedToExternal = false;
                    hasStartTime = false;
                    consecutiveFailures = 0;
                } else {
                    message = "External backend health check failed (" + std::to_string(consecutiveFailures) + "/" +
                              std::to_string(threshold) + ")";
                }
            } else if (autoRestart && consecutiveFailures >= threshold) {
                message = "Backend health check failed " + std::to_string(consecutiveFailures) + " times. Restarting...";
                consecutiveFailures = 0;
                doRestart = !restartPending;
            } else {
                message = "Backend health check failed (" + std::to_string(consecutiveFailures) + "/" +
                          std::to_string(threshold) + (autoRestart ? " before restart)" : ")");
            }
        } else {
            consecutiveFailures = 0;
            isWarning = false;
        }
    }

    if (!message.empty()) {
        if (isWarning) logger.warn(message); else logger.info(message);
    }
    notifyStatusChange();

    if (doRestart) {
        // 重启在独立任务上执行,stop() 可以正常取消本定时器
        scheduleRestart(std::chrono::milliseconds(0), true, epoch);
    }
}

bool ProcessSupervisor::isProgressLine(const std::string& line) {
    return line.find("Scanning:") != std::string::npos || line.find("Step ") != std::string::npos ||
           line.find("Found ") != std::string::npos || line.find("initialization") != std::string::npos;
}
