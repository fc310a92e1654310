#include "runtime/GitBranchProvider.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {
std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool readFile(const fs::path& path, std::string& out) {
    std::ifstream f(path);
    if (!f.is_open()) return false;
    std::stringstream buffer;
    buffer << f.rdbuf();
    out = buffer.str();
    return true;
}
} // namespace

std::string GitBranchProvider::parseHead(const std::string& headContent) {
    const std::string prefix = "ref: refs/heads/";
    std::string head = trim(headContent);
    if (head.compare(0, prefix.size(), prefix) != 0) return "";
    return head.substr(prefix.size());
}

std::string GitBranchProvider::currentBranch(const std::string& workspacePath) {
    if (workspacePath.empty()) return "";

    std::error_code ec;
    fs::path gitPath = fs::u8path(workspacePath) / ".git";
    fs::path gitDir = gitPath;

    if (fs::is_regular_file(gitPath, ec)) {
        std::string content;
        if (!readFile(gitPath, content)) return "";
        const std::string prefix = "gitdir:";
        content = trim(content);
        if (content.compare(0, prefix.size(), prefix) != 0) return "";
        fs::path target = fs::u8path(trim(content.substr(prefix.size())));
        gitDir = target.is_absolute() ? target : fs::u8path(workspacePath) / target;
    } else if (!fs::is_directory(gitPath, ec)) {
        return "";
    }

    std::string head;
    if (!readFile(gitDir / "HEAD", head)) return "";
    return parseHead(head);
}
