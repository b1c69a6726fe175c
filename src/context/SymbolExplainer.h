#pragma once
#include <optional>
#include <string>
#include "analysis/ParserRegistry.h"
#include "analysis/SymbolTypes.h"
#include "core/SourceTree.h"
#include "refactor/Edit.h"

/**
 * @brief 终端用的符号说明：定义位置、文档、源码预览与调用处
 */
class SymbolExplainer {
public:
    SymbolExplainer(const SourceTree& tree, const ParserRegistry& parsers, const CrossRefGraph& graph)
        : tree(tree), parsers(parsers), graph(graph) {}

    std::string explain(const std::string& symbol) const;

    /** 第 start 到 end 行（含，1-based）的结构化一句话描述；空块返回空串 */
    static std::string summarizeBlock(const std::string& content, int start, int end);

    /** 在第 startLine 行之上插入同缩进的 "<prefix> summary" 行；行号越界时原样返回 */
    static std::string insertSummaryComment(const std::string& content, int startLine, const std::string& summary,
                                            const std::string& commentPrefix = "#");

    /**
     * relPath 中 symbol（函数 / 类 / 模块变量）定义上方的摘要注释，表示为插入型 Edit：
     * oldText 为空，插入位置在装饰器之上。图中没有该定义或文件不可读时返回 std::nullopt。
     */
    std::optional<Edit> summaryCommentEdit(const std::string& relPath, const std::string& symbol) const;

    /** .py / .pyi 为 "#"，其余为 "//" */
    static std::string commentPrefixFor(const std::string& relPath);

private:
    std::string docOf(const std::string& relPath, const std::string& symbol) const;

    const SourceTree& tree;
    const ParserRegistry& parsers;
    const CrossRefGraph& graph;
};
