#pragma once
#include <memory>
#include <string>
#include <vector>
#include "analysis/IParser.h"

/**
 * @brief 解析器注册中心
 *
 * 按文件扩展名选择解析器。先注册的解析器优先，新增语言只需注册，不改调用方。
 */
class ParserRegistry {
public:
    ParserRegistry() = default;

    void registerParser(std::unique_ptr<IParser> parser);

    /** relPath 的扩展名对应的解析器，没有则返回 nullptr */
    const IParser* parserFor(const std::string& relPath) const;
    const IParser* parserForExtension(const std::string& ext) const;

    size_t size() const { return parsers.size(); }

    /** 至少一种已注册语言接受 name 作为标识符 */
    bool acceptsIdentifier(const std::string& name) const;

    /** tree-sitter Python 解析器 + 其余语言的启发式解析器 */
    static ParserRegistry createDefault();

private:
    std::vector<std::unique_ptr<IParser>> parsers;
};
