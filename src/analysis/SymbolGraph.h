#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "analysis/ParserRegistry.h"
#include "analysis/SymbolTypes.h"
#include "core/SourceTree.h"

namespace fs = std::filesystem;

/**
 * @brief 交叉引用图构建器
 *
 * 枚举源码文件，按内容哈希决定是否重新提取声明表；
 * 出现列表每次都重新扫描，crossRefs 每次构建都从头汇总，不做增量合并。
 * 构建结果持久化到 <root>/.codemap/xref_graph.json，持久化失败只记录警告。
 *
 * 同一根目录同一时间只应有一个构建者。
 */
class GraphBuilder {
public:
    struct BuildStats {
        size_t files = 0;
        size_t reindexed = 0;
        size_t reused = 0;
        size_t skipped = 0;
        size_t symbols = 0;
    };

    GraphBuilder(const SourceTree& tree, const ParserRegistry& parsers, size_t minSymbolLength = 2);

    /** incremental 为 true 时复用哈希未变文件的声明表 */
    CrossRefGraph build(bool incremental = true);

    /** 读取持久化的图；文件缺失、损坏或 schemaVersion 不符时返回 std::nullopt */
    std::optional<CrossRefGraph> load() const;

    bool save(const CrossRefGraph& graph, std::string* error = nullptr) const;

    fs::path graphPath() const;

    const BuildStats& lastStats() const { return stats; }

    static constexpr const char* kGraphFile = "xref_graph.json";

private:
    const SourceTree& tree;
    const ParserRegistry& parsers;
    size_t minSymbolLength;
    BuildStats stats;
};
