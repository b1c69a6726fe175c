#pragma once
#include <optional>
#include <string>
#include <vector>
#include "analysis/ParserRegistry.h"
#include "core/SourceTree.h"
#include "refactor/Edit.h"

/** 新签名中的一个参数："name" 或 "name=default" */
struct ParamSpec {
    std::string name;
    std::optional<std::string> defaultExpr;
};

/**
 * @brief 函数签名变更后的调用点迁移
 *
 * 流程：
 * 1. 按相对路径排序遍历文件，取第一个名为 functionName 的定义作为旧签名；
 * 2. 对每个调用点按新参数表重排位置参数，缺失时填默认值或 None，关键字参数原样追加；
 * 3. 只替换括号内的参数列表，括号外的文本不动。
 *
 * 含 *args / **kwargs 展开、生成器参数，或仅由启发式解析器找到的调用点
 * 放入 flagged，不生成 edit。
 */
class SignatureMigrator {
public:
    SignatureMigrator(const SourceTree& tree, const ParserRegistry& parsers)
        : tree(tree), parsers(parsers) {}

    MigrationResult migrate(const std::string& functionName, const std::vector<ParamSpec>& newParams,
                            bool dryRun = true) const;

    /** 解析 "a, b=1, c=(1, 2)"，只在最外层逗号处切分 */
    static std::vector<ParamSpec> parseParamSpecs(const std::string& text);

    /**
     * 按新参数表重写一个调用的参数列表（含括号）。
     * oldPositional 为旧签名中可按位置传入的参数名；argTexts / keywordTexts 为调用中已有实参文本。
     */
    static std::string renderArguments(const std::vector<std::string>& oldPositional,
                                       const std::vector<ParamSpec>& newParams,
                                       const std::vector<std::string>& argTexts,
                                       const std::vector<std::pair<std::string, std::string>>& keywordArgs);

private:
    struct Definition {
        std::string file;
        int line = 0;
        std::vector<std::string> params;
    };

    std::optional<Definition> findDefinition(const std::string& functionName) const;

    const SourceTree& tree;
    const ParserRegistry& parsers;
};
