#include "backend/PortChecker.h"
#include "utils/Logger.h"
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <sstream>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

PortChecker::PortChecker(Logger& logger) : logger(logger) {}

bool PortChecker::isAvailable(int port) {
    // port 0 会被内核分配为任意端口
    if (port <= 0 || port > 65535) return false;

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        logger.warn(std::string("[PortChecker] socket() failed: ") + std::strerror(errno));
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    // 不设置 SO_REUSEADDR,与正在监听的进程冲突时 bind 必然失败
    bool ok = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
              ::listen(fd, 1) == 0;
    ::close(fd);
    return ok;
}

std::string PortChecker::executeCommand(const std::string& command) {
    std::array<char, 128> buffer;
    std::string result;

    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command.c_str(), "r"), pclose);
    if (!pipe) {
        return "";
    }

    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result += buffer.data();
    }

    return result;
}

int PortChecker::releasePort(int port) {
    std::string output = executeCommand("lsof -ti:" + std::to_string(port) + " 2>/dev/null");
    std::istringstream iss(output);
    std::string token;
    int killed = 0;
    while (iss >> token) {
        pid_t pid = 0;
        try {
            pid = static_cast<pid_t>(std::stol(token));
        } catch (const std::exception&) {
            continue;
        }
        if (pid <= 0 || pid == ::getpid()) continue;
        if (::kill(pid, SIGKILL) == 0) {
            logger.info("[PortChecker] Killed process " + std::to_string(pid) + " on port " + std::to_string(port));
            ++killed;
        } else {
            logger.warn("[PortChecker] Could not kill " + std::to_string(pid) + ": " + std::strerror(errno));
        }
    }
    if (killed == 0) {
        logger.warn("[PortChecker] No process found holding port " + std::to_string(port));
    }
    return killed;
}
