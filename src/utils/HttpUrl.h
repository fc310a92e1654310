#pragma once
#include <string>
#include <optional>

/**
 * @brief http(s)://host[:port][/path] 的拆分结果
 */
struct HttpUrl {
    bool isSsl = false;
    std::string host;
    int port = 80;
    std::string path;  // 含前导 '/',可能为空

    static std::optional<HttpUrl> parse(const std::string& url);
};

/**
 * @brief 与 JavaScript encodeURIComponent 相同的编码规则
 */
std::string urlEncodeComponent(const std::string& value);
