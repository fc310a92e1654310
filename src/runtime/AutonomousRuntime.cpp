#include "runtime/AutonomousRuntime.h"
#include "utils/HttpUrl.h"
#include "utils/Logger.h"

nlohmann::json AutonomousRuntime::Stats::toJson() const {
    nlohmann::json j = {
        {"running", running},
        {"initialized", initialized},
        {"eventStream", eventStream.toJson()},
        {"healthLevel", healthLevel}
    };
    j["latestRisk"] = latestRisk ? nlohmann::json(*latestRisk) : nlohmann::json(nullptr);
    return j;
}

AutonomousRuntime::AutonomousRuntime(EngineClient& client, EventStream& events, RuntimeConfig config, Logger& logger)
    : client(client),
      events(events),
      config(std::move(config)),
      logger(logger),
      listeners(logger, "Autonomous") {
    workspacePath = this->config.workspacePath;
}

AutonomousRuntime::~AutonomousRuntime() {
    stop();
}

void AutonomousRuntime::start(const std::string& workspace) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (running) return;
        running = true;
        workspacePath = workspace;
    }

    {
        std::lock_guard<std::mutex> lock(queueMtx);
        dispatcherStop = false;
        pending.clear();
    }
    dispatcher = std::thread(&AutonomousRuntime::dispatchLoop, this);

    // 1. 事件流
    auto id = events.onEvent([this](const ChangeEvent& e) { onChangeEvent(e); });
    {
        std::lock_guard<std::mutex> lock(mtx);
        eventSubscription = id;
    }
    events.start(workspace);

    // 2. 初始化工作区,然后立即拉取一次,之后按间隔轮询
    bool first = true;
    pollTask.startPeriodic(config.pollInterval, [this, first]() mutable {
        if (first) {
            first = false;
            initializeWorkspace();
        }
        pollDashboard();
    }, true);

    logger.info("[Autonomous] Runtime started - all events are being captured");
}

void AutonomousRuntime::stop() {
    std::optional<ObserverList<const ChangeEvent&>::Id> subscription;
    bool wasRunning;
    {
        std::lock_guard<std::mutex> lock(mtx);
        wasRunning = running;
        running = false;
        subscription = eventSubscription;
        eventSubscription.reset();
    }

    if (subscription) events.removeListener(*subscription);
    if (wasRunning) events.stop();
    pollTask.cancel();

    {
        std::lock_guard<std::mutex> lock(queueMtx);
        dispatcherStop = true;
    }
    queueCv.notify_all();
    if (dispatcher.joinable()) dispatcher.join();
    {
        std::lock_guard<std::mutex> lock(queueMtx);
        pending.clear();
    }
    {
        // 轮询任务已结束,下次 start() 会重新初始化
        std::lock_guard<std::mutex> lock(mtx);
        initialized = false;
    }

    if (wasRunning) logger.info("[Autonomous] Runtime stopped");
}

ObserverList<const AutonomousRuntime::SnapshotPtr&>::Id AutonomousRuntime::onDashboardUpdate(DashboardListener listener) {
    auto id = listeners.add(listener);
    SnapshotPtr current = getLatestDashboard();
    if (current) {
        try {
            listener(current);
        } catch (const std::exception& e) {
            logger.warn(std::string("[Autonomous] Dashboard listener error: ") + e.what());
        }
    }
    return id;
}

void AutonomousRuntime::removeDashboardListener(ObserverList<const SnapshotPtr&>::Id id) {
    listeners.remove(id);
}

AutonomousRuntime::SnapshotPtr AutonomousRuntime::getLatestDashboard() const {
    std::lock_guard<std::mutex> lock(mtx);
    return latest;
}

bool AutonomousRuntime::isRunning() const {
    std::lock_guard<std::mutex> lock(mtx);
    return running;
}

bool AutonomousRuntime::isInitialized() const {
    std::lock_guard<std::mutex> lock(mtx);
    return initialized;
}

AutonomousRuntime::Stats AutonomousRuntime::getStats() const {
    Stats stats;
    SnapshotPtr snap;
    {
        std::lock_guard<std::mutex> lock(mtx);
        stats.running = running;
        stats.initialized = initialized;
        snap = latest;
    }
    stats.eventStream = events.getStats();
    if (snap) {
        stats.latestRisk = snap->overallScore();
        stats.healthLevel = snap->healthLevel();
    }
    return stats;
}

// ────────────────────────────────────────────────────────────
// Events
// ────────────────────────────────────────────────────────────

void AutonomousRuntime::onChangeEvent(const ChangeEvent& event) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running) return;
    }
    {
        std::lock_guard<std::mutex> lock(queueMtx);
        if (dispatcherStop) return;
        pending.push_back(event);
        if (pending.size() > kMaxPendingEvents) {
            pending.pop_front();
            logger.debug("[Autonomous] Event queue full, dropped oldest event");
        }
    }
    queueCv.notify_all();
}

void AutonomousRuntime::dispatchLoop() {
    while (true) {
        ChangeEvent event;
        {
            std::unique_lock<std::mutex> lock(queueMtx);
            queueCv.wait(lock, [&] { return dispatcherStop || !pending.empty(); });
            if (dispatcherStop) return;
            event = std::move(pending.front());
            pending.pop_front();
            dispatching = true;
        }
        sendEvent(event);
        {
            std::lock_guard<std::mutex> lock(queueMtx);
            dispatching = false;
        }
        queueCv.notify_all();
    }
}

void AutonomousRuntime::sendEvent(const ChangeEvent& event) {
    nlohmann::json body = {
        {"file_path", event.filePath},
        {"workspace_path", event.workspacePath},
        {"change_type", toString(event.changeType)},
        {"git_branch", event.gitBranch}
    };
    try {
        client.post("/autonomous/event", body);
    } catch (const std::exception& e) {
        // 后端可能正在重启,不重试
        logger.debug(std::string("[Autonomous] Event not delivered: ") + e.what());
    }
}

bool AutonomousRuntime::waitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queueMtx);
    return queueCv.wait_for(lock, timeout, [&] { return pending.empty() && !dispatching; });
}

// ────────────────────────────────────────────────────────────
// Dashboard
// ────────────────────────────────────────────────────────────

void AutonomousRuntime::initializeWorkspace() {
    std::string workspace;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running) return;
        workspace = workspacePath;
    }

    logger.info("[Autonomous] Initializing workspace analysis...");
    try {
        nlohmann::json result = client.post("/autonomous/initialize", {{"workspace_path", workspace}});
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (running) initialized = true;
        }

        long long entities = 0;
        long long edges = 0;
        if (result.is_object() && result.contains("steps") && result["steps"].is_object()) {
            const auto& steps = result["steps"];
            if (steps.contains("index") && steps["index"].is_object()) {
                entities = steps["index"].value("entities_found", 0LL);
            }
            if (steps.contains("graph") && steps["graph"].is_object()) {
                edges = steps["graph"].value("file_edges", 0LL);
            }
        }
        logger.success("[Autonomous] Workspace initialized: " + std::to_string(entities) + " entities, " +
                       std::to_string(edges) + " graph edges");
    } catch (const std::exception& e) {
        logger.warn(std::string("[Autonomous] Init failed (engine may be starting): ") + e.what());
    }
}

void AutonomousRuntime::pollDashboard() {
    std::string workspace;
    uint64_t seq;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!running || workspacePath.empty()) return;
        workspace = workspacePath;
        seq = ++fetchSeq;
    }
    auto snap = fetchDashboard(workspace, true);
    if (snap) publish(snap, seq);
}

AutonomousRuntime::SnapshotPtr AutonomousRuntime::refreshDashboard(const std::optional<std::string>& workspaceOverride) {
    std::string workspace;
    uint64_t seq;
    {
        std::lock_guard<std::mutex> lock(mtx);
        workspace = (workspaceOverride && !workspaceOverride->empty()) ? *workspaceOverride : workspacePath;
        seq = ++fetchSeq;
    }

    if (!workspace.empty()) {
        auto snap = fetchDashboard(workspace, false);
        if (snap && publish(snap, seq)) {
            return snap;
        }
    }
    return getLatestDashboard();
}

AutonomousRuntime::SnapshotPtr AutonomousRuntime::fetchDashboard(const std::string& workspace, bool quiet) {
    try {
        nlohmann::json data = client.get("/autonomous/dashboard/" + urlEncodeComponent(workspace));
        auto parsed = DashboardSnapshot::fromJson(data);
        if (!parsed) {
            logger.warn("[Autonomous] Ignoring malformed dashboard payload");
            return nullptr;
        }
        return std::make_shared<const DashboardSnapshot>(std::move(*parsed));
    } catch (const std::exception& e) {
        if (quiet) {
            logger.debug(std::string("[Autonomous] Dashboard poll failed: ") + e.what());
        } else {
            logger.warn(std::string("[Autonomous] Dashboard refresh failed: ") + e.what());
        }
        return nullptr;
    }
}

bool AutonomousRuntime::publish(const SnapshotPtr& snapshot, uint64_t seq) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        // 更晚发出的请求已经发布过,这个响应已过期
        if (seq < publishedSeq) return false;
        latest = snapshot;
        publishedSeq = seq;
    }
    listeners.notify(snapshot);
    return true;
}
