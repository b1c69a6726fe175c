#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * 扫描忽略规则：图构建、重命名、签名迁移、上下文加载共用的「是否跳过路径」逻辑。
 * - 内置：以 . 开头的路径段（除 . / ..）一律忽略。
 * - ignoreDirs：任一路径段与之相同则忽略（如 node_modules、__pycache__）。
 * - patterns：正则（ECMAScript），与相对路径的 generic 形式匹配则忽略。
 */
class ScanIgnoreRules {
public:
    /** 无效正则在构造时跳过并记录警告 */
    ScanIgnoreRules(std::vector<std::string> ignoreDirs, std::vector<std::string> patterns);
    ~ScanIgnoreRules();
    ScanIgnoreRules(ScanIgnoreRules&&) noexcept;
    ScanIgnoreRules& operator=(ScanIgnoreRules&&) noexcept;

    /** relPath 为相对于扫描根目录的路径 */
    bool shouldIgnore(const fs::path& relPath) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
