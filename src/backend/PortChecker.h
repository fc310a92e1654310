#pragma once
#include <string>

class Logger;

class IPortChecker {
public:
    virtual ~IPortChecker() = default;

    /**
     * @brief 在 127.0.0.1:port 上尝试 bind,成功并关闭后返回 true
     */
    virtual bool isAvailable(int port) = 0;

    /**
     * @brief 强制结束占用 port 的进程 (SIGKILL)
     * @return 发送了信号的进程数
     */
    virtual int releasePort(int port) = 0;
};

class PortChecker : public IPortChecker {
public:
    explicit PortChecker(Logger& logger);

    bool isAvailable(int port) override;
    int releasePort(int port) override;

private:
    Logger& logger;

    std::string executeCommand(const std::string& command);
};
