#pragma once
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "analysis/SymbolTypes.h"
#include "core/SourceTree.h"

namespace fs = std::filesystem;

/**
 * @brief 由交叉引用图生成 Markdown 文档
 *
 * 输出目录：
 *   README.md          模块索引与导入依赖图（mermaid）
 *   symbols.md         被多个文件使用的符号
 *   call_graph.md      调用次数最多的符号
 *   modules/<name>.md  单个文件的声明表、导入、依赖与被依赖
 *
 * 依赖只解析 Python 导入（含相对导入）到仓库内存在于图中的文件。
 */
class DocGenerator {
public:
    struct Dependencies {
        std::map<std::string, std::vector<std::string>> imports;    // 文件 -> 它导入的仓库文件
        std::map<std::string, std::vector<std::string>> importedBy; // 文件 -> 导入它的仓库文件
    };

    struct Result {
        fs::path outputDir;
        size_t written = 0;
        std::vector<std::string> errors;
    };

    DocGenerator(const SourceTree& tree, const CrossRefGraph& graph) : tree(tree), graph(graph) {}

    /** 写出全部文档；单个文件写入失败记入 errors，其余照常写出 */
    Result generate(const fs::path& outputDir) const;

    Dependencies dependencies() const;

    std::string readme(const Dependencies& deps) const;
    std::string symbolReference() const;
    std::string callGraph() const;
    std::string moduleDoc(const std::string& relPath, const Dependencies& deps) const;

    /** "pkg/mod.py" -> "pkg_mod.md"，其余扩展名保留："web/app.js" -> "web_app.js.md" */
    static std::string moduleDocName(const std::string& relPath);

    static constexpr size_t kMaxSymbolRows = 300;
    static constexpr size_t kMaxCallRows = 40;

private:
    std::string resolveModule(const std::string& module, const std::string& fromFile) const;

    const SourceTree& tree;
    const CrossRefGraph& graph;
};
