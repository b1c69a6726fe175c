#pragma once
#include <optional>
#include <string>
#include <vector>
#include "analysis/ParserRegistry.h"
#include "analysis/SymbolTypes.h"
#include "core/SourceTree.h"

/**
 * @brief 按查询相关度加载最小代码块
 *
 * 从不整文件加载：候选文件由交叉引用图预筛，按函数 / 类 / 常量切块，
 * 以词重叠打分后在字符预算内装入。
 */
class ChunkLoader {
public:
    ChunkLoader(const SourceTree& tree, const ParserRegistry& parsers, size_t fileLimit = 20)
        : tree(tree), parsers(parsers), fileLimit(fileLimit) {}

    /** 小写的标识符词，长度至少为 2 */
    static std::vector<std::string> tokenize(const std::string& text);

    /** 重叠词数 / 查询词数，符号名与某个查询词相同再加 kExactBonus */
    static double scoreChunk(const Chunk& chunk, const std::vector<std::string>& queryTokens);

    /**
     * 丢弃非正分，按分数稳定降序，累加到下一个会超出 budget 为止。
     * 第一个块总是保留，即使它本身超出预算。
     */
    static std::vector<Chunk> selectWithinBudget(std::vector<Chunk> chunks, size_t budget);

    /** graph 可为 nullptr，此时扫描全部代码文件 */
    std::vector<Chunk> relevantChunks(const std::string& query, const CrossRefGraph* graph, size_t budget) const;

    /** relevantChunks 的结果经 formatChunks 拼成文本 */
    std::string loadContextForQuery(const std::string& query, const CrossRefGraph* graph, size_t budget) const;

    /** [RELEVANT CODE CHUNKS] 文本块，每块一个 "# file::symbol (Lstart-end)" 标题；无块时为空串 */
    static std::string formatChunks(const std::vector<Chunk>& chunks);

    /** 只加载 symbol 的定义块；找不到定义时退回到首次出现处附近的行窗口 */
    std::optional<std::string> loadSymbolChunk(const std::string& relPath, const std::string& symbol) const;

    /**
     * @brief 指定文件 + 指定符号的上下文
     *
     * 每个可读文件输出 "### <file>"，其后是各 symbol 的代码块（每块最多 600 字节）；
     * symbols 为空时改为该文件顶层函数 / 类的签名提纲（最多 20 条）。
     * 已输出内容超过 budget 后追加 "[budget exceeded]" 并停止。不可读的文件跳过。
     */
    std::string loadMultiFileContext(const std::vector<std::string>& files, const std::vector<std::string>& symbols,
                                     size_t budget) const;

    std::vector<std::string> candidateFiles(const std::vector<std::string>& queryTokens,
                                            const CrossRefGraph* graph) const;

    static constexpr double kExactBonus = 3.0;

private:
    const SourceTree& tree;
    const ParserRegistry& parsers;
    size_t fileLimit;
};
