#pragma once
#include <string>
#include "analysis/ParserRegistry.h"
#include "core/SourceTree.h"
#include "refactor/Edit.h"

/**
 * @brief 仓库级符号重命名
 *
 * 精确解析器的语言按标识符 token 匹配，字符串与注释内容不会被改写；
 * 启发式语言按单词边界匹配，可能误中字符串或注释中的同名文本。
 * 新名字按每个文件所属语言校验（见 IParser::isValidIdentifier），任一文件不接受时整批不写入。
 * 多文件写入没有事务，已写入的文件在后续失败时不会回滚。
 */
class RenameEngine {
public:
    RenameEngine(const SourceTree& tree, const ParserRegistry& parsers)
        : tree(tree), parsers(parsers) {}

    RenameResult rename(const std::string& oldName, const std::string& newName, bool dryRun = true) const;

private:
    const SourceTree& tree;
    const ParserRegistry& parsers;
};
