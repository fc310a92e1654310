#include "runtime/SourceFileFilter.h"
#include <algorithm>
#include <cctype>

namespace {
std::string toLower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}
} // namespace

const std::vector<std::string>& SourceFileFilter::defaultIgnoredDirs() {
    static const std::vector<std::string> dirs = {
        "node_modules", ".git", "__pycache__", ".next", "dist",
        "build", ".venv", "venv", ".turbo", ".cache",
    };
    return dirs;
}

const std::vector<std::string>& SourceFileFilter::defaultExtensions() {
    static const std::vector<std::string> exts = {
        ".py", ".ts", ".tsx", ".js", ".jsx", ".prisma",
        ".json", ".toml", ".yaml", ".yml", ".sql",
        ".graphql", ".gql", ".env",
    };
    return exts;
}

SourceFileFilter::SourceFileFilter(std::vector<std::string> dirs, std::vector<std::string> exts) {
    if (dirs.empty()) dirs = defaultIgnoredDirs();
    if (exts.empty()) exts = defaultExtensions();
    ignoredDirs.insert(dirs.begin(), dirs.end());
    for (const auto& e : exts) extensions.insert(toLower(e));
}

bool SourceFileFilter::accepts(const std::string& path) const {
    return hasSourceExtension(path) && !isInIgnoredDir(path);
}

bool SourceFileFilter::hasSourceExtension(const std::string& path) const {
    auto dot = path.find_last_of('.');
    if (dot == std::string::npos) return false;
    // "a.d/file" 的点属于目录名
    auto slash = path.find_last_of("/\\");
    if (slash != std::string::npos && slash > dot) return false;
    return extensions.count(toLower(path.substr(dot))) > 0;
}

bool SourceFileFilter::isInIgnoredDir(const std::string& path) const {
    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    // 只检查目录部分,最后一段是文件名
    size_t start = 0;
    while (true) {
        size_t end = normalized.find('/', start);
        if (end == std::string::npos) break;
        if (end > start && ignoredDirs.count(normalized.substr(start, end - start))) {
            return true;
        }
        start = end + 1;
    }
    return false;
}
