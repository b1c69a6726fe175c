#pragma once
#include "analysis/IParser.h"

/**
 * 行模式启发式解析（JavaScript / TypeScript / Java）。
 * 结果为低可信度：可能多报或漏报；重命名按单词边界匹配，
 * 可能误改字符串或注释中的同名文本。
 */
class RegexParser : public IParser {
public:
    std::string name() const override { return "regex"; }
    std::string confidence() const override { return "heuristic"; }
    bool supportsExtension(const std::string& ext) const override;

    FileSymbolTable extractSymbols(const std::string& content, const std::string& relPath) const override;
    std::vector<SymbolOccurrence> scanOccurrences(const std::string& content, const std::string& relPath) const override;
    std::vector<TokenSpan> renameTokens(const std::string& content, const std::string& name) const override;
    std::vector<CallSite> callSites(const std::string& content, const std::string& functionName) const override;
    std::vector<Chunk> extractChunks(const std::string& content, const std::string& relPath) const override;
    std::optional<std::string> definitionBlock(const std::string& content, const std::string& symbol) const override;
    bool isValidIdentifier(const std::string& name) const override;
};
