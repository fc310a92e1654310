#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

enum class ChangeType {
    Saved,
    Created,
    Deleted,
    Opened,
    Renamed
};

inline const char* toString(ChangeType type) {
    switch (type) {
        case ChangeType::Saved: return "saved";
        case ChangeType::Created: return "created";
        case ChangeType::Deleted: return "deleted";
        case ChangeType::Opened: return "opened";
        case ChangeType::Renamed: return "renamed";
    }
    return "saved";
}

/**
 * @brief 一次经过过滤的工作区文件变化
 */
struct ChangeEvent {
    std::string filePath;
    ChangeType changeType = ChangeType::Saved;
    std::string workspacePath;
    int64_t timestampMillis = 0;
    std::string gitBranch;
    nlohmann::json metadata = nlohmann::json::object();  // renamed: {"old_path": ...}
};
