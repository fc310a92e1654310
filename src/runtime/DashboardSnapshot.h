#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

struct RiskScores {
    double overallScore = 0.0;
    std::string healthLevel;
    double schemaRisk = 0.0;
    double contractRisk = 0.0;
    double migrationRisk = 0.0;
    double dependencyRisk = 0.0;
    double securityRisk = 0.0;
    double namingRisk = 0.0;
    double driftRisk = 0.0;
};

struct RiskTrendPoint {
    std::string timestamp;
    double overallScore = 0.0;
};

/**
 * @brief 工作区健康面板数据 (GET /autonomous/dashboard/<workspace>)
 *
 * 只能通过 fromJson 构造;缓存中以 shared_ptr<const DashboardSnapshot> 整体替换。
 * raw 保留完整响应,便于原样转发给视图层。
 */
struct DashboardSnapshot {
    std::string workspace;
    std::optional<RiskScores> riskScores;
    nlohmann::json graph = nlohmann::json::object();
    nlohmann::json drift = nlohmann::json::object();
    nlohmann::json worker = nlohmann::json::object();

    std::vector<RiskTrendPoint> riskTrend;
    nlohmann::json unresolvedDrifts = nlohmann::json::array();
    std::vector<std::vector<std::string>> circularDependencies;
    std::vector<std::string> deadCodeFiles;
    std::string timestamp;

    nlohmann::json raw;

    /**
     * @brief 解析响应;顶层不是对象或缺少 health 对象时返回 nullopt
     *
     * 其余字段缺失或类型不符时取空值,不会抛异常。
     */
    static std::optional<DashboardSnapshot> fromJson(const nlohmann::json& j);

    std::optional<double> overallScore() const;
    std::string healthLevel() const;  // 无数据时为 "UNKNOWN"
};
