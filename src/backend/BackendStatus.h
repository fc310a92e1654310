#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

enum class BackendHealth {
    Stopped,
    Starting,
    Healthy,
    Unhealthy
};

inline const char* toString(BackendHealth health) {
    switch (health) {
        case BackendHealth::Stopped: return "stopped";
        case BackendHealth::Starting: return "starting";
        case BackendHealth::Healthy: return "healthy";
        case BackendHealth::Unhealthy: return "unhealthy";
    }
    return "stopped";
}

/**
 * @brief 后端状态快照
 * 每次 getStatus() 重新计算,返回后不再变化
 */
struct BackendStatus {
    bool running = false;
    int port = 0;
    std::optional<int> processId;  // 外部后端没有 PID
    long long uptimeSeconds = 0;
    BackendHealth health = BackendHealth::Stopped;
    std::string lastLogLine;
    bool connectedToExternal = false;

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"running", running},
            {"port", port},
            {"pid", nullptr},
            {"uptime", uptimeSeconds},
            {"health", toString(health)},
            {"last_log", lastLogLine},
            {"external", connectedToExternal}
        };
        if (processId) j["pid"] = *processId;
        return j;
    }
};
