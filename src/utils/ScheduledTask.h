#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

/**
 * @brief 可取消的定时任务 (周期 / 单次)
 *
 * 每个 ScheduledTask 对应一个后台线程,由启动它的组件持有。
 * cancel() 之后回调不会再次触发;在回调自身线程中调用 cancel() 也是安全的。
 * 回调需要自行处理异常。
 */
class ScheduledTask {
public:
    using Task = std::function<void()>;

    ScheduledTask() = default;
    ~ScheduledTask();

    ScheduledTask(const ScheduledTask&) = delete;
    ScheduledTask& operator=(const ScheduledTask&) = delete;

    /**
     * @brief 每隔 interval 执行一次 task;runImmediately 为 true 时先立即执行一次
     * 已有任务会先被取消
     */
    void startPeriodic(std::chrono::milliseconds interval, Task task, bool runImmediately = false);

    /**
     * @brief delay 之后执行一次 task
     */
    void startOnce(std::chrono::milliseconds delay, Task task);

    void cancel();

    bool isActive() const;

    /**
     * @brief 当前线程是否就是本任务的后台线程 (此时 cancel() 不会等待回调结束)
     */
    bool isWorkerThread() const;

private:
    struct State {
        std::mutex mtx;
        std::condition_variable cv;
        bool cancelled = false;
        bool finished = false;
    };

    mutable std::mutex ownerMtx;
    std::shared_ptr<State> state;
    std::thread worker;

    void launch(std::shared_ptr<State> st, std::function<void()> body);
};
