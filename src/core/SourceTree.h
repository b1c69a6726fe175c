#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include "core/ConfigManager.h"
#include "utils/ScanIgnore.h"

namespace fs = std::filesystem;

/**
 * @brief 仓库源码文件视图
 *
 * 负责在根目录下枚举代码文件（按扩展名过滤、应用忽略规则），
 * 所有路径都以相对根目录的 generic 形式（"a/b.py"）对外暴露。
 */
class SourceTree {
public:
    SourceTree(const std::string& rootPath, const Config& config);

    const fs::path& root() const { return rootPath; }

    /** 排序后的相对路径列表 */
    std::vector<std::string> listFiles() const;

    bool isCodeFile(const std::string& relPath) const;
    bool isIgnored(const std::string& relPath) const;

    fs::path absolute(const std::string& relPath) const;

private:
    fs::path rootPath;
    std::vector<std::string> extensions;
    ScanIgnoreRules rules;
};
