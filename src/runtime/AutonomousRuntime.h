#pragma once
#include <string>
#include <deque>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <optional>
#include <functional>
#include <condition_variable>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "runtime/ChangeEvent.h"
#include "runtime/DashboardSnapshot.h"
#include "runtime/EngineClient.h"
#include "runtime/EventStream.h"
#include "utils/ObserverList.h"
#include "utils/ScheduledTask.h"

class Logger;

/**
 * @brief 自主监控运行时
 *
 * - 把 EventStream 的事件转发给后端 (/autonomous/event),不阻塞事件来源线程
 * - 首次连接时初始化工作区 (/autonomous/initialize)
 * - 定期拉取健康面板并缓存最新快照,推送给所有监听者
 */
class AutonomousRuntime {
public:
    using SnapshotPtr = std::shared_ptr<const DashboardSnapshot>;
    using DashboardListener = std::function<void(const SnapshotPtr&)>;

    // 未发送事件的上限,超出时丢弃最旧的
    static constexpr size_t kMaxPendingEvents = 1000;

    struct Stats {
        bool running = false;
        bool initialized = false;
        EventStream::Stats eventStream;
        std::optional<double> latestRisk;
        std::string healthLevel = "UNKNOWN";

        nlohmann::json toJson() const;
    };

    AutonomousRuntime(EngineClient& client, EventStream& events, RuntimeConfig config, Logger& logger);
    ~AutonomousRuntime();

    AutonomousRuntime(const AutonomousRuntime&) = delete;
    AutonomousRuntime& operator=(const AutonomousRuntime&) = delete;

    /**
     * @brief 启动运行时;已在运行时忽略。初始化与首次拉取在后台完成
     */
    void start(const std::string& workspacePath);
    void stop();

    /**
     * @brief 注册面板监听者;已有快照时立即回放一次
     */
    ObserverList<const SnapshotPtr&>::Id onDashboardUpdate(DashboardListener listener);
    void removeDashboardListener(ObserverList<const SnapshotPtr&>::Id id);

    SnapshotPtr getLatestDashboard() const;

    /**
     * @brief 立即拉取面板,未 start() 也可使用
     * @return 新快照;失败时返回之前缓存的快照 (可能为空)
     */
    SnapshotPtr refreshDashboard(const std::optional<std::string>& workspaceOverride = std::nullopt);

    Stats getStats() const;
    bool isRunning() const;
    bool isInitialized() const;

    // 等待事件队列清空,主要用于测试与退出前
    bool waitForIdle(std::chrono::milliseconds timeout);

private:
    EngineClient& client;
    EventStream& events;
    RuntimeConfig config;
    Logger& logger;

    mutable std::mutex mtx;
    bool running = false;
    bool initialized = false;
    std::string workspacePath;
    SnapshotPtr latest;
    uint64_t fetchSeq = 0;      // 每次拉取面板前递增
    uint64_t publishedSeq = 0;  // 已发布快照对应的拉取序号
    std::optional<ObserverList<const ChangeEvent&>::Id> eventSubscription;

    std::mutex queueMtx;
    std::condition_variable queueCv;
    std::deque<ChangeEvent> pending;
    bool dispatching = false;
    bool dispatcherStop = false;
    std::thread dispatcher;

    ScheduledTask pollTask;
    ObserverList<const SnapshotPtr&> listeners;

    void onChangeEvent(const ChangeEvent& event);
    void dispatchLoop();
    void sendEvent(const ChangeEvent& event);

    void initializeWorkspace();
    void pollDashboard();
    SnapshotPtr fetchDashboard(const std::string& workspace, bool quiet);
    bool publish(const SnapshotPtr& snapshot, uint64_t seq);
};
