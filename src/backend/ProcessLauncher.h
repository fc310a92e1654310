#pragma once
#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <functional>

class Logger;

struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;
    std::string workingDir;
};

/**
 * @brief 子进程输出与退出回调
 * 行回调在读取线程上触发,onExit 在进程被回收且输出读尽之后触发
 * exitCode: 正常退出为退出码,被信号终止为 128 + 信号值
 */
struct ProcessCallbacks {
    std::function<void(const std::string&)> onStdoutLine;
    std::function<void(const std::string&)> onStderrLine;
    std::function<void(int exitCode)> onExit;
};

class IProcessHandle {
public:
    virtual ~IProcessHandle() = default;

    virtual int pid() const = 0;
    virtual bool isRunning() const = 0;

    virtual void terminate() = 0;  // SIGTERM
    virtual void kill() = 0;       // SIGKILL

    /**
     * @return 在 timeout 内退出返回 true
     */
    virtual bool waitForExit(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief 清空回调;返回后不会再有回调被调用
     */
    virtual void detachCallbacks() = 0;
};

class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    // 进程无法启动时返回 nullptr
    virtual std::unique_ptr<IProcessHandle> launch(const LaunchSpec& spec, ProcessCallbacks callbacks) = 0;
};

class PosixProcessLauncher : public IProcessLauncher {
public:
    explicit PosixProcessLauncher(Logger& logger);

    std::unique_ptr<IProcessHandle> launch(const LaunchSpec& spec, ProcessCallbacks callbacks) override;

private:
    Logger& logger;
};
