#include "runtime/EngineClient.h"
#include "utils/Logger.h"
#include <httplib.h>

EngineClient::EngineClient(const std::string& baseUrl, std::chrono::milliseconds timeout, Logger& logger)
    : logger(logger), timeout(timeout) {
    setBaseUrl(baseUrl);
}

void EngineClient::setBaseUrl(const std::string& url) {
    auto parsed = HttpUrl::parse(url);
    std::lock_guard<std::mutex> lock(mtx);
    baseUrl = url;
    if (parsed) {
        target = *parsed;
    } else {
        logger.warn("[EngineClient] Invalid base URL: " + url);
        target = HttpUrl{};
    }
}

std::string EngineClient::getBaseUrl() const {
    std::lock_guard<std::mutex> lock(mtx);
    return baseUrl;
}

nlohmann::json EngineClient::get(const std::string& path) {
    return request("GET", path, nullptr);
}

nlohmann::json EngineClient::post(const std::string& path, const nlohmann::json& body) {
    return request("POST", path, &body);
}

nlohmann::json EngineClient::request(const std::string& method, const std::string& path, const nlohmann::json* body) {
    HttpUrl t;
    {
        std::lock_guard<std::mutex> lock(mtx);
        t = target;
    }
    if (t.host.empty()) {
        throw EngineRequestError("Engine base URL not configured");
    }
    if (t.isSsl) {
        throw EngineRequestError("HTTPS engine URLs are not supported: " + t.host);
    }

    std::string endpoint = t.path + path;
    httplib::Client cli(t.host, t.port);
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    httplib::Result res;
    if (method == "POST") {
        std::string bodyStr = body ? body->dump() : "{}";
        res = cli.Post(endpoint.c_str(), bodyStr, "application/json");
    } else {
        res = cli.Get(endpoint.c_str());
    }

    if (!res) {
        throw EngineRequestError(method + " " + path + " failed: " + httplib::to_string(res.error()));
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error&) {
        throw EngineRequestError("Invalid JSON response: " + res->body.substr(0, 200), res->status);
    }

    if (res->status >= 400) {
        std::string detail = "HTTP " + std::to_string(res->status);
        if (parsed.is_object() && parsed.contains("detail") && parsed["detail"].is_string()) {
            detail = parsed["detail"].get<std::string>();
        }
        throw EngineRequestError(detail, res->status);
    }
    return parsed;
}
