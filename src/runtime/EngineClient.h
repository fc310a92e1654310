#pragma once
#include <string>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "utils/HttpUrl.h"

class Logger;

/**
 * @brief 传输失败、HTTP 错误状态或响应不是合法 JSON
 */
class EngineRequestError : public std::runtime_error {
public:
    explicit EngineRequestError(const std::string& message, int status = 0)
        : std::runtime_error(message), status(status) {}

    int httpStatus() const { return status; }

private:
    int status;
};

/**
 * @brief 分析引擎 HTTP/JSON 客户端
 *
 * get / post 为虚函数,测试中以 Mock 子类替换。
 */
class EngineClient {
public:
    EngineClient(const std::string& baseUrl, std::chrono::milliseconds timeout, Logger& logger);
    virtual ~EngineClient() = default;

    /**
     * @throws EngineRequestError
     */
    virtual nlohmann::json get(const std::string& path);

    /**
     * @throws EngineRequestError
     */
    virtual nlohmann::json post(const std::string& path, const nlohmann::json& body);

    // 后端端口变化后调用
    void setBaseUrl(const std::string& baseUrl);
    std::string getBaseUrl() const;

protected:
    Logger& logger;

private:
    mutable std::mutex mtx;
    std::string baseUrl;
    HttpUrl target;
    std::chrono::milliseconds timeout;

    nlohmann::json request(const std::string& method, const std::string& path, const nlohmann::json* body);
};
