#include "backend/HealthProbe.h"
#include "utils/HttpUrl.h"
#include "utils/Logger.h"
#include <httplib.h>

HttpHealthProbe::HttpHealthProbe(Logger& logger) : logger(logger) {}

bool HttpHealthProbe::probe(const std::string& url, std::chrono::milliseconds timeout) {
    auto parsed = HttpUrl::parse(url);
    if (!parsed || parsed->isSsl) {
        logger.warn("[HealthProbe] Unsupported URL: " + url);
        return false;
    }

    std::string path = parsed->path.empty() ? "/" : parsed->path;
    auto started = std::chrono::steady_clock::now();
    try {
        httplib::Client cli(parsed->host, parsed->port);
        // 三个超时共同约束整个请求,超时后连接被关闭
        cli.set_connection_timeout(timeout);
        cli.set_read_timeout(timeout);
        cli.set_write_timeout(timeout);
        cli.set_keep_alive(false);

        auto res = cli.Get(path.c_str());
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        if (!res) {
            logger.debug("[HealthProbe] " + url + " failed: " + httplib::to_string(res.error()) +
                         " after " + std::to_string(elapsed) + "ms");
            return false;
        }
        logger.debug("[HealthProbe] " + url + " status=" + std::to_string(res->status) +
                     " in " + std::to_string(elapsed) + "ms");
        return res->status == 200 && elapsed <= timeout.count();
    } catch (const std::exception& e) {
        logger.warn(std::string("[HealthProbe] exception: ") + e.what());
        return false;
    }
}
