#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include "runtime/ChangeEvent.h"
#include "runtime/EditorEventSource.h"
#include "runtime/GitBranchProvider.h"
#include "runtime/SourceFileFilter.h"
#include "utils/ObserverList.h"
#include "utils/ScheduledTask.h"

class Logger;

/**
 * @brief 统一的工作区事件采集
 *
 * 订阅编辑器信号,按 SourceFileFilter 过滤后生成 ChangeEvent 并同步分发;
 * 同时定期轮询 git 分支,写入之后的事件。
 */
class EventStream {
public:
    using EventCallback = std::function<void(const ChangeEvent&)>;

    struct Stats {
        bool running = false;
        uint64_t eventCount = 0;
        std::string gitBranch;

        nlohmann::json toJson() const {
            return {{"running", running}, {"eventCount", eventCount}, {"gitBranch", gitBranch}};
        }
    };

    EventStream(IEditorEventSource& source,
                IBranchProvider& branches,
                Logger& logger,
                std::chrono::milliseconds branchPollInterval = std::chrono::milliseconds(15000),
                SourceFileFilter filter = SourceFileFilter());
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /**
     * @brief 开始采集;已在运行时忽略
     */
    void start(const std::string& workspacePath);

    /**
     * @brief 取消所有订阅并停止分支轮询;未运行时调用也是安全的
     */
    void stop();

    ObserverList<const ChangeEvent&>::Id onEvent(EventCallback callback);
    void removeListener(ObserverList<const ChangeEvent&>::Id id);

    Stats getStats() const;
    bool isRunning() const;

private:
    IEditorEventSource& source;
    IBranchProvider& branches;
    Logger& logger;
    std::chrono::milliseconds branchPollInterval;
    SourceFileFilter filter;

    mutable std::mutex mtx;
    bool running = false;
    std::string workspacePath;
    std::string gitBranch;
    uint64_t eventCount = 0;

    std::vector<Subscription> subscriptions;
    ScheduledTask branchPoll;
    ObserverList<const ChangeEvent&> listeners;

    void emit(const std::string& filePath, ChangeType type,
              nlohmann::json metadata = nlohmann::json::object());
    void pollGitBranch();
};
