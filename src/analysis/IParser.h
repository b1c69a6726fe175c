#pragma once
#include <optional>
#include <string>
#include <vector>
#include "analysis/SymbolTypes.h"

/** 一个标识符 token 的位置：1-based 行号，字节列 [colStart, colEnd) */
struct TokenSpan {
    int line = 0;
    int colStart = 0;
    int colEnd = 0;
};

/** 调用的一个实参，[begin, end) 为文件内容中的字节偏移 */
struct CallArgument {
    size_t begin = 0;
    size_t end = 0;
    std::string text;
    std::string keyword; // 非空表示 keyword=value 形式
};

/**
 * @brief 一个调用点
 *
 * argsBegin / argsEnd 覆盖包括左右括号在内的参数列表。
 * lowConfidence 的调用点只报告，不改写。
 */
struct CallSite {
    int line = 0;          // 参数列表起始行
    int colStart = 0;      // 参数列表起始字节列
    size_t argsBegin = 0;
    size_t argsEnd = 0;
    std::vector<CallArgument> positional;
    std::vector<CallArgument> keywords;
    bool lowConfidence = false;
    std::string reason;
};

/**
 * @brief 源码解析器接口
 *
 * 按能力分两类：基于真实语法树的精确解析（confidence() == "exact"）与
 * 基于行模式的启发式解析（"heuristic"）。由 ParserRegistry 按扩展名选择。
 * 所有方法都是纯函数，解析失败返回空或部分结果，绝不抛出。
 */
class IParser {
public:
    virtual ~IParser() = default;

    virtual std::string name() const = 0;
    virtual std::string confidence() const = 0;
    virtual bool supportsExtension(const std::string& ext) const = 0;

    /** 声明表：函数、类、变量、导入、赋值、注解 */
    virtual FileSymbolTable extractSymbols(const std::string& content, const std::string& relPath) const = 0;

    /** 所有标识符出现及其语法角色（file 字段留空） */
    virtual std::vector<SymbolOccurrence> scanOccurrences(const std::string& content, const std::string& relPath) const = 0;

    /** 文本等于 name 的标识符 token 位置，用于重命名 */
    virtual std::vector<TokenSpan> renameTokens(const std::string& content, const std::string& name) const = 0;

    /** 被调用名（裸名或成员访问）等于 functionName 的调用点 */
    virtual std::vector<CallSite> callSites(const std::string& content, const std::string& functionName) const = 0;

    /** 检索单元：顶层函数 / 类 / 方法 / 常量 */
    virtual std::vector<Chunk> extractChunks(const std::string& content, const std::string& relPath) const = 0;

    /** 名为 symbol 的定义块（含装饰器）；找不到返回 std::nullopt */
    virtual std::optional<std::string> definitionBlock(const std::string& content, const std::string& symbol) const = 0;

    /** name 能否作为本语言的标识符（非关键字），重命名前校验新名字 */
    virtual bool isValidIdentifier(const std::string& name) const = 0;
};
