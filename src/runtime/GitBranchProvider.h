#pragma once
#include <string>

/**
 * @brief 查询工作区当前 git 分支
 */
class IBranchProvider {
public:
    virtual ~IBranchProvider() = default;

    /**
     * @return 分支名;非 git 仓库、detached HEAD 或读取失败时返回空串
     */
    virtual std::string currentBranch(const std::string& workspacePath) = 0;
};

/**
 * @brief 直接读取 <workspace>/.git/HEAD,不依赖 git 命令
 *
 * 支持 .git 为文件的情况 (worktree / submodule: "gitdir: <path>")。
 */
class GitBranchProvider : public IBranchProvider {
public:
    std::string currentBranch(const std::string& workspacePath) override;

    static std::string parseHead(const std::string& headContent);
};
