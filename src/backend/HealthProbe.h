#pragma once
#include <string>
#include <chrono>

class Logger;

class IHealthProbe {
public:
    virtual ~IHealthProbe() = default;

    // 仅当 timeout 内收到 HTTP 200 时返回 true;不重试
    virtual bool probe(const std::string& url, std::chrono::milliseconds timeout) = 0;
};

class HttpHealthProbe : public IHealthProbe {
public:
    explicit HttpHealthProbe(Logger& logger);

    bool probe(const std::string& url, std::chrono::milliseconds timeout) override;

private:
    Logger& logger;
};
