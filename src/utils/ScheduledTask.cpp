#include "utils/ScheduledTask.h"

ScheduledTask::~ScheduledTask() {
    cancel();
}

void ScheduledTask::startPeriodic(std::chrono::milliseconds interval, Task task, bool runImmediately) {
    cancel();
    auto st = std::make_shared<State>();
    launch(st, [st, interval, task = std::move(task), runImmediately]() {
        if (runImmediately) {
            {
                std::lock_guard<std::mutex> lock(st->mtx);
                if (st->cancelled) return;
            }
            task();
        }
        while (true) {
            std::unique_lock<std::mutex> lock(st->mtx);
            if (st->cv.wait_for(lock, interval, [&] { return st->cancelled; })) break;
            lock.unlock();
            task();
        }
        std::lock_guard<std::mutex> lock(st->mtx);
        st->finished = true;
    });
}

void ScheduledTask::startOnce(std::chrono::milliseconds delay, Task task) {
    cancel();
    auto st = std::make_shared<State>();
    launch(st, [st, delay, task = std::move(task)]() {
        {
            std::unique_lock<std::mutex> lock(st->mtx);
            if (st->cv.wait_for(lock, delay, [&] { return st->cancelled; })) {
                st->finished = true;
                return;
            }
        }
        task();
        std::lock_guard<std::mutex> lock(st->mtx);
        st->finished = true;
    });
}

void ScheduledTask::launch(std::shared_ptr<State> st, std::function<void()> body) {
    // 持锁创建线程: 回调里的 cancel() / isWorkerThread() 一定能看到自己的 worker
    std::lock_guard<std::mutex> lock(ownerMtx);
    state = std::move(st);
    worker = std::thread(std::move(body));
}

void ScheduledTask::cancel() {
    std::shared_ptr<State> st;
    std::thread th;
    {
        std::lock_guard<std::mutex> lock(ownerMtx);
        st = std::move(state);
        th = std::move(worker);
    }
    if (st) {
        {
            std::lock_guard<std::mutex> lock(st->mtx);
            st->cancelled = true;
        }
        st->cv.notify_all();
    }
    if (th.joinable()) {
        // 在自身回调中取消: 线程持有 State 的 shared_ptr,回调返回后自行退出
        if (th.get_id() == std::this_thread::get_id()) {
            th.detach();
        } else {
            th.join();
        }
    }
}

bool ScheduledTask::isActive() const {
    std::lock_guard<std::mutex> lock(ownerMtx);
    if (!state) return false;
    std::lock_guard<std::mutex> stateLock(state->mtx);
    return !state->cancelled && !state->finished;
}

bool ScheduledTask::isWorkerThread() const {
    std::lock_guard<std::mutex> lock(ownerMtx);
    return worker.get_id() == std::this_thread::get_id();
}
