#include "backend/InterpreterLocator.h"
#include "utils/Logger.h"
#include <cstdlib>
#include <filesystem>
#include <unordered_set>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {
const char* kServerScript = "server.py";

bool isExecutableFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
}

bool isFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}
} // namespace

InterpreterLocator::InterpreterLocator(const BackendConfig& config, Logger& logger)
    : config(config), logger(logger) {}

std::string InterpreterLocator::findExecutableInPath(const std::vector<std::string>& names) {
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";
    std::string paths = pathEnv;
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(':', start);
        std::string dir = (end == std::string::npos) ? paths.substr(start) : paths.substr(start, end - start);
        if (!dir.empty()) {
            for (const auto& name : names) {
                fs::path candidate = fs::path(dir) / name;
                if (isExecutableFile(candidate)) {
                    return candidate.u8string();
                }
            }
        }
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return "";
}

std::optional<std::string> InterpreterLocator::findPython() const {
    // 1. 工作区虚拟环境
    if (!config.workspacePath.empty()) {
        fs::path ws = fs::u8path(config.workspacePath);
        for (const auto& venv : {ws / ".venv" / "bin" / "python", ws / "venv" / "bin" / "python"}) {
            if (isFile(venv)) {
                logger.info("Using venv: " + venv.u8string());
                return venv.u8string();
            }
        }
    }

    // 2. 配置的解释器
    if (!config.pythonPath.empty()) {
        if (isFile(fs::u8path(config.pythonPath))) {
            logger.info("Using configured Python: " + config.pythonPath);
            return config.pythonPath;
        }
        logger.warn("Configured python_path does not exist: " + config.pythonPath);
    }

    // 3. 系统 PATH
    std::string systemPython = findExecutableInPath({"python3", "python"});
    if (!systemPython.empty()) {
        logger.info("Using system Python: " + systemPython);
        return systemPython;
    }
    return std::nullopt;
}

std::vector<std::string> InterpreterLocator::serverSearchPaths() const {
    std::vector<fs::path> candidates;

    for (const auto& extra : config.serverSearchPaths) {
        fs::path p = fs::u8path(extra);
        if (p.filename() != kServerScript) p /= kServerScript;
        candidates.push_back(p);
    }

    if (!config.workspacePath.empty()) {
        fs::path ws = fs::u8path(config.workspacePath);
        candidates.push_back(ws / config.engineDir / kServerScript);
        candidates.push_back(ws / kServerScript);

        // 向上最多 5 级
        fs::path dir = ws;
        for (int i = 0; i < 5; ++i) {
            fs::path parent = dir.parent_path();
            if (parent.empty() || parent == dir) break;
            dir = parent;
            candidates.push_back(dir / config.engineDir / kServerScript);
        }
    }

    if (const char* home = std::getenv("HOME")) {
        fs::path h = fs::u8path(home);
        candidates.push_back(h / config.engineDir / kServerScript);
        candidates.push_back(h / "projects" / config.engineDir / kServerScript);
    }

    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (const auto& c : candidates) {
        std::string s = c.lexically_normal().u8string();
        if (seen.insert(s).second) unique.push_back(s);
    }
    return unique;
}

std::optional<std::string> InterpreterLocator::findServerScript() const {
    if (!config.serverPath.empty()) {
        if (isFile(fs::u8path(config.serverPath))) {
            logger.info("Using configured server path: " + config.serverPath);
            return config.serverPath;
        }
        logger.warn("Configured server_path does not exist: " + config.serverPath);
    }

    auto paths = serverSearchPaths();
    logger.info("Searching for " + std::string(kServerScript) + " in " + std::to_string(paths.size()) + " locations...");
    for (const auto& p : paths) {
        if (isFile(fs::u8path(p))) {
            logger.success("Found " + std::string(kServerScript) + ": " + p);
            return p;
        }
    }

    logger.error(std::string(kServerScript) + " not found! Searched in:");
    for (size_t i = 0; i < paths.size(); ++i) {
        logger.info("  " + std::to_string(i + 1) + ". " + paths[i]);
    }
    logger.warn("TIP: Configure the path in settings: backend.server_path");
    return std::nullopt;
}
