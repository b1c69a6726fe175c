#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include "analysis/ParserRegistry.h"
#include "analysis/SymbolGraph.h"
#include "analysis/SymbolTypes.h"
#include "core/ConfigManager.h"
#include "core/SourceTree.h"

namespace fs = std::filesystem;

/**
 * @brief 一个仓库根目录的运行时上下文
 *
 * 持有配置、文件视图、解析器注册表与当前交叉引用图。
 * 图对读者不可变：rebuild() 构建一个新图并整体替换指针，
 * 已取得旧指针的读者继续看到旧图。
 */
class Workspace {
public:
    Workspace(const std::string& rootPath, Config config);

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    const fs::path& root() const { return tree.root(); }
    const Config& config() const { return cfg; }
    const SourceTree& sourceTree() const { return tree; }
    const ParserRegistry& parsers() const { return registry; }

    /** 当前图；首次调用时先尝试读取持久化结果，没有则增量构建 */
    std::shared_ptr<const CrossRefGraph> graph();

    /** 重新构建并替换当前图 */
    std::shared_ptr<const CrossRefGraph> rebuild(bool incremental = true);

    const GraphBuilder::BuildStats& lastBuildStats() const { return builder.lastStats(); }

private:
    Config cfg;
    SourceTree tree;
    ParserRegistry registry;
    GraphBuilder builder;

    std::mutex graphMutex;
    std::shared_ptr<const CrossRefGraph> current;
};
