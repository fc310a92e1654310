#pragma once

#include <string>
#include <unordered_set>
#include <vector>

/**
 * 事件过滤规则：EventStream 用来决定一个路径是否值得上报。
 * - 扩展名（小写，取最后一个 '.' 之后）必须属于源码扩展名集合；
 * - 任一路径段等于忽略目录（依赖 / 构建 / 缓存目录）则忽略。
 * 结果只取决于路径字符串本身。
 */
class SourceFileFilter {
public:
    /** 参数为空时使用内置列表 */
    explicit SourceFileFilter(std::vector<std::string> ignoredDirs = {},
                              std::vector<std::string> extensions = {});

    bool accepts(const std::string& path) const;

    bool hasSourceExtension(const std::string& path) const;
    bool isInIgnoredDir(const std::string& path) const;

    static const std::vector<std::string>& defaultIgnoredDirs();
    static const std::vector<std::string>& defaultExtensions();

private:
    std::unordered_set<std::string> ignoredDirs;
    std::unordered_set<std::string> extensions;
};
