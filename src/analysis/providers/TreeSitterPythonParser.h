#pragma once
#include "analysis/IParser.h"
#include <string>
#include <vector>
#include <tree_sitter/api.h>

/**
 * @brief 基于 tree-sitter 语法树的 Python 解析器（精确）
 *
 * - 声明：任意深度的函数 / 方法、类，模块级赋值 / 注解，所有 import
 * - 出现：definition / call / attr / store / ref 按语法角色区分
 * - 重命名只命中 identifier 节点，字符串与注释内容不会被误改
 * 含语法错误的源码仍返回部分结果（hasErrors = true）。
 */
class TreeSitterPythonParser : public IParser {
public:
    TreeSitterPythonParser();

    std::string name() const override { return "tree-sitter-python"; }
    std::string confidence() const override { return "exact"; }
    bool supportsExtension(const std::string& ext) const override;

    FileSymbolTable extractSymbols(const std::string& content, const std::string& relPath) const override;
    std::vector<SymbolOccurrence> scanOccurrences(const std::string& content, const std::string& relPath) const override;
    std::vector<TokenSpan> renameTokens(const std::string& content, const std::string& name) const override;
    std::vector<CallSite> callSites(const std::string& content, const std::string& functionName) const override;
    std::vector<Chunk> extractChunks(const std::string& content, const std::string& relPath) const override;
    std::optional<std::string> definitionBlock(const std::string& content, const std::string& symbol) const override;
    bool isValidIdentifier(const std::string& name) const override;

private:
    const TSLanguage* language;
};
