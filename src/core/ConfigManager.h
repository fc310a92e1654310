#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

struct BackendConfig {
    std::string host = "127.0.0.1";
    int port = 7779;
    bool autoRestart = true;
    std::chrono::seconds startupTimeout{600};  // 首次索引大型工作区可能需要数分钟

    std::string pythonPath;  // 解释器覆盖路径
    std::string serverPath;  // 入口脚本覆盖路径
    std::string engineDir = "copilot-engine";
    std::vector<std::string> serverSearchPaths;
    std::string workspacePath;

    std::chrono::milliseconds healthCheckInterval{15000};
    std::chrono::milliseconds healthCheckTimeout{10000};
    std::chrono::milliseconds startupProbeTimeout{5000};
    std::chrono::milliseconds startupPollInterval{1000};
    std::chrono::milliseconds startupPollTimeout{2000};
    std::chrono::milliseconds progressInterval{5000};
    std::chrono::milliseconds stopGrace{5000};
    std::chrono::milliseconds restartDelay{3000};
    std::chrono::milliseconds crashRestartDelay{5000};
    std::chrono::milliseconds portReleaseWait{3000};
    int failureThreshold = 3;
    int crashRestartLimit = 3;  // 启动阶段连续崩溃后最多自动重试的次数

    std::string baseUrl() const {
        return "http://" + host + ":" + std::to_string(port);
    }
};

struct RuntimeConfig {
    std::string workspacePath;
    std::chrono::milliseconds pollInterval{15000};
    std::chrono::milliseconds branchPollInterval{15000};
    std::chrono::milliseconds requestTimeout{10000};
};

struct Config {
    BackendConfig backend;
    RuntimeConfig runtime;

    struct Log {
        std::string file = "warden.log";
        bool debug = false;
    } log;

    static Config defaults() {
        return Config{};
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        try {
            return fromJson(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config in " + path.string() + ": " + e.what());
        }
    }

    // 所有键都是可选的,缺省值与 Config{} 一致
    static Config fromJson(const nlohmann::json& j) {
        Config cfg;
        if (!j.is_object()) {
            throw std::runtime_error("config root must be a JSON object");
        }

        if (j.contains("backend")) {
            const auto& b = j.at("backend");
            auto& be = cfg.backend;
            be.host = b.value("host", be.host);
            be.port = b.value("port", be.port);
            be.autoRestart = b.value("auto_restart", be.autoRestart);
            be.startupTimeout = std::chrono::seconds(b.value("startup_timeout_seconds", static_cast<long long>(be.startupTimeout.count())));
            be.pythonPath = b.value("python_path", "");
            be.serverPath = b.value("server_path", "");
            be.engineDir = b.value("engine_dir", be.engineDir);
            be.serverSearchPaths = b.value("server_search_paths", std::vector<std::string>{});
            be.healthCheckInterval = millis(b, "health_check_interval_ms", be.healthCheckInterval);
            be.healthCheckTimeout = millis(b, "health_check_timeout_ms", be.healthCheckTimeout);
            be.startupProbeTimeout = millis(b, "startup_probe_timeout_ms", be.startupProbeTimeout);
            be.startupPollInterval = millis(b, "startup_poll_interval_ms", be.startupPollInterval);
            be.startupPollTimeout = millis(b, "startup_poll_timeout_ms", be.startupPollTimeout);
            be.progressInterval = millis(b, "progress_interval_ms", be.progressInterval);
            be.stopGrace = millis(b, "stop_grace_ms", be.stopGrace);
            be.restartDelay = millis(b, "restart_delay_ms", be.restartDelay);
            be.crashRestartDelay = millis(b, "crash_restart_delay_ms", be.crashRestartDelay);
            be.portReleaseWait = millis(b, "port_release_wait_ms", be.portReleaseWait);
            be.failureThreshold = b.value("failure_threshold", be.failureThreshold);
            be.crashRestartLimit = b.value("crash_restart_limit", be.crashRestartLimit);
        }

        if (j.contains("runtime")) {
            const auto& r = j.at("runtime");
            auto& rt = cfg.runtime;
            rt.workspacePath = r.value("workspace_path", "");
            rt.pollInterval = millis(r, "poll_interval_ms", rt.pollInterval);
            rt.branchPollInterval = millis(r, "branch_poll_interval_ms", rt.branchPollInterval);
            rt.requestTimeout = millis(r, "request_timeout_ms", rt.requestTimeout);
        }
        cfg.backend.workspacePath = cfg.runtime.workspacePath;

        if (j.contains("log")) {
            cfg.log.file = j.at("log").value("file", cfg.log.file);
            cfg.log.debug = j.at("log").value("debug", false);
        }

        if (cfg.backend.port <= 0 || cfg.backend.port > 65535) {
            throw std::runtime_error("backend.port out of range: " + std::to_string(cfg.backend.port));
        }
        if (cfg.backend.failureThreshold < 1) {
            throw std::runtime_error("backend.failure_threshold must be >= 1");
        }
        if (cfg.backend.crashRestartLimit < 0) {
            throw std::runtime_error("backend.crash_restart_limit must be >= 0");
        }
        return cfg;
    }

private:
    static std::chrono::milliseconds millis(const nlohmann::json& j, const char* key, std::chrono::milliseconds def) {
        return std::chrono::milliseconds(j.value(key, static_cast<long long>(def.count())));
    }
};
