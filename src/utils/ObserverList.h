#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <functional>
#include <exception>
#include <utility>
#include "utils/Logger.h"

/**
 * @brief 订阅者注册表
 *
 * 发布者持有一个 ObserverList,按注册顺序同步通知每个订阅者。
 * 单个订阅者抛出的异常会被捕获并记录,不影响其余订阅者。
 */
template <typename... Args>
class ObserverList {
public:
    using Callback = std::function<void(Args...)>;
    using Id = size_t;

    ObserverList(Logger& logger, std::string owner)
        : logger(logger), owner(std::move(owner)) {}

    Id add(Callback cb) {
        std::lock_guard<std::mutex> lock(mtx);
        Id id = ++lastId;
        entries.push_back({id, std::move(cb)});
        return id;
    }

    void remove(Id id) {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto it = entries.begin(); it != entries.end(); ++it) {
            if (it->first == id) {
                entries.erase(it);
                return;
            }
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx);
        entries.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return entries.size();
    }

    // 回调在锁外执行,订阅者可以在回调中增删其他订阅者
    void notify(Args... args) const {
        std::vector<std::pair<Id, Callback>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mtx);
            snapshot = entries;
        }
        for (const auto& entry : snapshot) {
            try {
                entry.second(args...);
            } catch (const std::exception& e) {
                logger.warn("[" + owner + "] Callback error: " + e.what());
            } catch (...) {
                logger.warn("[" + owner + "] Callback error: unknown exception");
            }
        }
    }

private:
    Logger& logger;
    std::string owner;
    mutable std::mutex mtx;
    std::vector<std::pair<Id, Callback>> entries;
    Id lastId = 0;
};
