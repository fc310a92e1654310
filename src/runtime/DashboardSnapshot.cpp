#include "runtime/DashboardSnapshot.h"

namespace {
double number(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0.0;
    return it->get<double>();
}

std::string text(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

nlohmann::json objectOrEmpty(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return nlohmann::json::object();
    return *it;
}

std::vector<std::string> stringList(const nlohmann::json& j) {
    std::vector<std::string> out;
    if (!j.is_array()) return out;
    for (const auto& item : j) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}
} // namespace

std::optional<DashboardSnapshot> DashboardSnapshot::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto healthIt = j.find("health");
    if (healthIt == j.end() || !healthIt->is_object()) return std::nullopt;
    const auto& health = *healthIt;

    DashboardSnapshot snap;
    snap.workspace = text(health, "workspace");

    auto riskIt = health.find("risk_scores");
    if (riskIt != health.end() && riskIt->is_object()) {
        const auto& r = *riskIt;
        RiskScores scores;
        scores.overallScore = number(r, "overall_score");
        scores.healthLevel = text(r, "health_level");
        scores.schemaRisk = number(r, "schema_risk");
        scores.contractRisk = number(r, "contract_risk");
        scores.migrationRisk = number(r, "migration_risk");
        scores.dependencyRisk = number(r, "dependency_risk");
        scores.securityRisk = number(r, "security_risk");
        scores.namingRisk = number(r, "naming_risk");
        scores.driftRisk = number(r, "drift_risk");
        snap.riskScores = scores;
    }

    snap.graph = objectOrEmpty(health, "graph");
    snap.drift = objectOrEmpty(health, "drift");
    snap.worker = objectOrEmpty(health, "worker");

    auto trendIt = j.find("risk_trend");
    if (trendIt != j.end() && trendIt->is_array()) {
        for (const auto& point : *trendIt) {
            if (!point.is_object()) continue;
            snap.riskTrend.push_back({text(point, "timestamp"), number(point, "overall_score")});
        }
    }

    auto driftsIt = j.find("unresolved_drifts");
    if (driftsIt != j.end() && driftsIt->is_array()) {
        snap.unresolvedDrifts = *driftsIt;
    }

    auto cyclesIt = j.find("circular_dependencies");
    if (cyclesIt != j.end() && cyclesIt->is_array()) {
        for (const auto& cycle : *cyclesIt) {
            snap.circularDependencies.push_back(stringList(cycle));
        }
    }

    auto deadIt = j.find("dead_code_files");
    if (deadIt != j.end()) {
        snap.deadCodeFiles = stringList(*deadIt);
    }

    snap.timestamp = text(j, "timestamp");
    snap.raw = j;
    return snap;
}

std::optional<double> DashboardSnapshot::overallScore() const {
    if (!riskScores) return std::nullopt;
    return riskScores->overallScore;
}

std::string DashboardSnapshot::healthLevel() const {
    if (!riskScores || riskScores->healthLevel.empty()) return "UNKNOWN";
    return riskScores->healthLevel;
}
