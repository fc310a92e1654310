#pragma once
#include <string>
#include <mutex>

enum class LogLevel {
    INFO,
    SUCCESS,
    WARNING,
    ERROR,
    DEBUG
};

/**
 * @brief 日志输出
 *
 * 每条日志同时写入日志文件 (带时间戳) 和控制台 (带颜色前缀)。
 * 在 main 中构造一次,以引用传入各组件。
 */
class Logger {
public:
    /**
     * @param logFilePath 日志文件路径,为空则不写文件
     * @param console 是否输出到控制台
     */
    explicit Logger(std::string logFilePath = "warden.log", bool console = true);

    void setDebugEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        debugEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message);

    // 便捷方法
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }

    void separator();
    void section(const std::string& title);

private:
    std::string logFilePath;
    bool console;
    bool debugEnabled = false;
    std::mutex mtx;

    void writeLine(LogLevel level, const std::string& message);
};
