#pragma once
#include <string>
#include <vector>
#include <optional>
#include "core/ConfigManager.h"

class Logger;

/**
 * @brief 查找后端解释器与入口脚本
 *
 * 解释器: 工作区虚拟环境 → 配置的解释器 → 系统 PATH
 * 入口脚本: 配置路径 → 额外搜索目录 → 工作区 → 工作区上级目录 → HOME
 */
class InterpreterLocator {
public:
    InterpreterLocator(const BackendConfig& config, Logger& logger);

    std::optional<std::string> findPython() const;
    std::optional<std::string> findServerScript() const;

    /**
     * @brief 入口脚本的候选位置 (去重,按优先级排列)
     */
    std::vector<std::string> serverSearchPaths() const;

    static std::string findExecutableInPath(const std::vector<std::string>& names);

private:
    BackendConfig config;
    Logger& logger;
};
