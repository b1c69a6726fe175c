#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "analysis/SymbolTypes.h"

namespace fs = std::filesystem;

/**
 * @brief 交叉引用图上的只读查询
 *
 * 名字匹配区分大小写；前缀搜索不区分大小写。
 * 查不到时返回空结果，不抛异常。
 */
class GraphQuery {
public:
    explicit GraphQuery(const CrossRefGraph& graph) : graph(graph) {}

    struct UsageEntry {
        SymbolOccurrence occurrence;
        std::string context; // 去除首尾空白的源码行
    };

    std::vector<SymbolOccurrence> query(const std::string& name) const;
    std::vector<SymbolOccurrence> definitions(const std::string& name) const;
    std::vector<SymbolOccurrence> usages(const std::string& name) const;

    /** 以 prefix 开头（不区分大小写）的符号名，按字典序 */
    std::vector<std::string> prefixSearch(const std::string& prefix) const;

    std::optional<FileSymbolTable> symbolsInFile(const std::string& relPath) const;

    /** "classes: A, B | functions: f, g | vars: X"，无内容时为 "(empty)" */
    std::string fileSummary(const std::string& relPath) const;

    /** 带上下文行的出现列表；文件不可读时上下文为空 */
    std::vector<UsageEntry> usagesWithContext(const fs::path& root, const std::string& name) const;

private:
    const CrossRefGraph& graph;
};
