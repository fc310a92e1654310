#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <filesystem>

#include <poll.h>
#include <unistd.h>

#include "core/ConfigManager.h"
#include "utils/Logger.h"
#include "backend/HealthProbe.h"
#include "backend/PortChecker.h"
#include "backend/ProcessLauncher.h"
#include "backend/ProcessSupervisor.h"
#include "runtime/AutonomousRuntime.h"
#include "runtime/EditorEventSource.h"
#include "runtime/EngineClient.h"
#include "runtime/EventStream.h"
#include "runtime/GitBranchProvider.h"
#include "runtime/StatusIndicator.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";

namespace {

volatile std::sig_atomic_t g_stopRequested = 0;

void handleSignal(int) {
    g_stopRequested = 1;
}

void printUsage() {
    std::cout << "Usage: warden [config.json] [--workspace <path>] [--no-start]" << std::endl;
}

void printHelp() {
    std::cout << GRAY << "  ┌──────────────────────────────────────────────────────────┐" << RESET << std::endl;
    std::cout << GRAY << "  │ " << RESET << BOLD << "saved|created|deleted|opened <path>" << RESET << GRAY << "  editor event    │" << RESET << std::endl;
    std::cout << GRAY << "  │ " << RESET << BOLD << "renamed <old> <new>" << RESET << GRAY << "                  editor event    │" << RESET << std::endl;
    std::cout << GRAY << "  │ " << RESET << BOLD << "status | logs" << RESET << GRAY << "                        backend state   │" << RESET << std::endl;
    std::cout << GRAY << "  │ " << RESET << BOLD << "start | stop | restart | detect" << RESET << GRAY << "      lifecycle       │" << RESET << std::endl;
    std::cout << GRAY << "  │ " << RESET << BOLD << "refresh | dashboard | stats" << RESET << GRAY << "          monitoring      │" << RESET << std::endl;
    std::cout << GRAY << "  │ " << RESET << BOLD << "reload | quit" << RESET << GRAY << "                        config / exit   │" << RESET << std::endl;
    std::cout << GRAY << "  └──────────────────────────────────────────────────────────┘" << RESET << std::endl;
}

/**
 * 等待一行输入,期间每 200ms 检查一次退出信号
 * @return false 表示 EOF 或收到信号
 */
bool readCommand(std::string& line) {
    while (!g_stopRequested) {
        if (std::cin.rdbuf()->in_avail() > 0) {
            return static_cast<bool>(std::getline(std::cin, line));
        }
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        int rc = ::poll(&pfd, 1, 200);
        if (rc > 0) {
            return static_cast<bool>(std::getline(std::cin, line));
        }
    }
    return false;
}

std::vector<std::string> splitArgs(const std::string& line) {
    std::vector<std::string> parts;
    std::istringstream ss(line);
    std::string part;
    while (ss >> part) parts.push_back(part);
    return parts;
}

std::string restOfLine(const std::string& line, const std::string& command) {
    std::string rest = line.substr(line.find(command) + command.size());
    size_t b = rest.find_first_not_of(" \t");
    if (b == std::string::npos) return "";
    size_t e = rest.find_last_not_of(" \t\r");
    return rest.substr(b, e - b + 1);
}

void printDashboardSummary(const AutonomousRuntime::SnapshotPtr& snap) {
    if (!snap) {
        std::cout << GRAY << "  No dashboard data yet" << RESET << std::endl;
        return;
    }
    auto score = snap->overallScore();
    std::cout << CYAN << "  Health: " << RESET << BOLD << snap->healthLevel() << RESET
              << GRAY << "  risk=" << (score ? std::to_string(*score) : "n/a")
              << "  drifts=" << snap->unresolvedDrifts.size()
              << "  cycles=" << snap->circularDependencies.size()
              << "  dead_code=" << snap->deadCodeFiles.size() << RESET << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath;
    std::string workspaceArg;
    bool noStart = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--workspace" && i + 1 < argc) {
            workspaceArg = argv[++i];
        } else if (arg == "--no-start") {
            noStart = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else if (!arg.empty() && arg[0] != '-' && configPath.empty()) {
            configPath = arg;
        } else {
            std::cerr << RED << "✖ Unknown argument: " << arg << RESET << std::endl;
            printUsage();
            return 1;
        }
    }

    if (configPath.empty() && fs::exists(fs::u8path("config.json"))) {
        configPath = "config.json";
    }

    Config cfg;
    try {
        cfg = configPath.empty() ? Config::defaults() : Config::load(configPath);
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        printUsage();
        return 1;
    }

    std::string workspace = !workspaceArg.empty() ? workspaceArg : cfg.runtime.workspacePath;
    if (workspace.empty()) {
        std::error_code ec;
        workspace = fs::current_path(ec).u8string();
    }
    cfg.runtime.workspacePath = workspace;
    cfg.backend.workspacePath = workspace;

    Logger logger(cfg.log.file);
    logger.setDebugEnabled(cfg.log.debug);
    if (!configPath.empty()) {
        logger.success("Loaded configuration from: " + configPath);
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);
    // 后端关闭管道时不应终止本进程
    std::signal(SIGPIPE, SIG_IGN);

    HttpHealthProbe probe(logger);
    PortChecker ports(logger);
    PosixProcessLauncher launcher(logger);
    ProcessSupervisor supervisor(cfg.backend, probe, ports, launcher, logger);

    EngineClient client(cfg.backend.baseUrl(), cfg.runtime.requestTimeout, logger);
    EditorSignalHub editor(logger);
    GitBranchProvider branches;
    EventStream eventStream(editor, branches, logger, cfg.runtime.branchPollInterval);
    AutonomousRuntime runtime(client, eventStream, cfg.runtime, logger);
    StatusIndicator indicator(logger);

    indicator.onChange([&logger](const IndicatorView& view) {
        logger.info("[Status] " + view.text + (view.detail.empty() ? "" : " (" + view.detail + ")"));
    });
    supervisor.onStatusChange([&indicator](const BackendStatus& status) { indicator.applyStatus(status); });
    supervisor.onProgress([&indicator](const std::string& message) { indicator.applyProgress(message); });
    runtime.onDashboardUpdate([&logger](const AutonomousRuntime::SnapshotPtr& snap) {
        auto score = snap->overallScore();
        logger.info("[Dashboard] " + snap->healthLevel() +
                    (score ? " (risk " + std::to_string(*score) + ")" : ""));
    });

    auto startRuntimeIfReachable = [&](bool reachable) {
        if (reachable && !runtime.isRunning()) {
            runtime.start(workspace);
        }
    };

    logger.section("WARDEN");
    logger.info("Workspace: " + workspace);

    if (noStart) {
        startRuntimeIfReachable(supervisor.detectExisting());
    } else {
        startRuntimeIfReachable(supervisor.start());
    }

    printHelp();

    std::string line;
    while (!g_stopRequested) {
        std::cout << CYAN << BOLD << "❯ " << RESET << std::flush;
        if (!readCommand(line)) break;

        auto args = splitArgs(line);
        if (args.empty()) continue;
        const std::string& cmd = args[0];

        if (cmd == "quit" || cmd == "exit") {
            break;
        } else if (cmd == "help") {
            printHelp();
        } else if (cmd == "saved" || cmd == "created" || cmd == "deleted" || cmd == "opened") {
            std::string path = restOfLine(line, cmd);
            if (path.empty()) {
                std::cout << GRAY << "  Usage: " << cmd << " <path>" << RESET << std::endl;
                continue;
            }
            if (cmd == "saved") editor.fileSaved(path);
            else if (cmd == "created") editor.fileCreated(path);
            else if (cmd == "deleted") editor.fileDeleted(path);
            else editor.activeFileChanged(path);
        } else if (cmd == "renamed") {
            if (args.size() != 3) {
                std::cout << GRAY << "  Usage: renamed <old> <new>" << RESET << std::endl;
                continue;
            }
            editor.fileRenamed(args[1], args[2]);
        } else if (cmd == "status") {
            std::cout << supervisor.getStatus().toJson().dump(2) << std::endl;
            std::cout << CYAN << "  Indicator: " << RESET << indicator.render() << std::endl;
        } else if (cmd == "logs") {
            auto logs = supervisor.getLogs();
            if (logs.empty()) {
                std::cout << GRAY << "  (no backend output captured)" << RESET << std::endl;
            }
            for (const auto& l : logs) std::cout << "  " << l << std::endl;
        } else if (cmd == "start") {
            startRuntimeIfReachable(supervisor.start());
        } else if (cmd == "stop") {
            supervisor.stop();
        } else if (cmd == "restart") {
            startRuntimeIfReachable(supervisor.restart());
        } else if (cmd == "detect") {
            bool found = supervisor.detectExisting();
            std::cout << (found ? GREEN + "  ✔ Backend is reachable" : RED + "  ✖ No backend on port " +
                          std::to_string(supervisor.getConfig().port)) << RESET << std::endl;
            startRuntimeIfReachable(found);
        } else if (cmd == "refresh") {
            printDashboardSummary(runtime.refreshDashboard());
        } else if (cmd == "dashboard") {
            auto snap = runtime.getLatestDashboard();
            if (snap) {
                std::cout << snap->raw.dump(2) << std::endl;
            } else {
                printDashboardSummary(snap);
            }
        } else if (cmd == "stats") {
            std::cout << runtime.getStats().toJson().dump(2) << std::endl;
        } else if (cmd == "reload") {
            if (configPath.empty()) {
                std::cout << GRAY << "  No config file to reload" << RESET << std::endl;
                continue;
            }
            try {
                Config updated = Config::load(configPath);
                updated.backend.workspacePath = workspace;
                supervisor.applyConfig(updated.backend);
                client.setBaseUrl(updated.backend.baseUrl());
                logger.setDebugEnabled(updated.log.debug);
                logger.success("Configuration reloaded from: " + configPath);
            } catch (const std::exception& e) {
                logger.error(std::string("Failed to reload config: ") + e.what());
            }
        } else {
            std::cout << GRAY << "  Unknown command: " << cmd << " (type 'help')" << RESET << std::endl;
        }
    }

    std::cout << std::endl;
    logger.info("Shutting down...");
    runtime.stop();
    supervisor.stop();
    return 0;
}
