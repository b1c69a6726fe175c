#include "analysis/providers/TreeSitterPythonParser.h"
#include "utils/FileIO.h"
#include "tree_sitter/tree-sitter-python.h"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <deque>
#include <iterator>
#include <memory>

namespace {

struct TreeDeleter {
    void operator()(TSTree* tree) const { ts_tree_delete(tree); }
};
struct ParserDeleter {
    void operator()(TSParser* parser) const { ts_parser_delete(parser); }
};
using TreePtr = std::unique_ptr<TSTree, TreeDeleter>;

TreePtr parseSource(const TSLanguage* language, const std::string& content) {
    std::unique_ptr<TSParser, ParserDeleter> parser(ts_parser_new());
    if (!parser || !language || !ts_parser_set_language(parser.get(), language)) {
        return nullptr;
    }
    return TreePtr(ts_parser_parse_string(parser.get(), nullptr, content.c_str(),
                                          static_cast<uint32_t>(content.size())));
}

bool isType(TSNode node, const char* type) {
    return std::strcmp(ts_node_type(node), type) == 0;
}

TSNode field(TSNode node, const char* name) {
    return ts_node_child_by_field_name(node, name, static_cast<uint32_t>(std::strlen(name)));
}

bool sameNode(TSNode a, TSNode b) {
    return !ts_node_is_null(b) && ts_node_eq(a, b);
}

std::string nodeText(TSNode node, const std::string& content) {
    if (ts_node_is_null(node)) return "";
    uint32_t start = ts_node_start_byte(node);
    uint32_t end = ts_node_end_byte(node);
    if (end <= start || end > content.size()) return "";
    return content.substr(start, end - start);
}

int startLine(TSNode node) {
    return static_cast<int>(ts_node_start_point(node).row) + 1;
}

// 节点结束于下一行第 0 列时，结束行取上一行
int endLine(TSNode node) {
    TSPoint start = ts_node_start_point(node);
    TSPoint end = ts_node_end_point(node);
    if (end.column == 0 && end.row > start.row) return static_cast<int>(end.row);
    return static_cast<int>(end.row) + 1;
}

std::string stripStringQuotes(const std::string& literal) {
    size_t i = 0;
    while (i < literal.size() && std::isalpha(static_cast<unsigned char>(literal[i]))) ++i;
    std::string body = literal.substr(i);
    for (const char* quote : {"\"\"\"", "'''"}) {
        if (body.size() >= 6 && body.compare(0, 3, quote) == 0 && body.compare(body.size() - 3, 3, quote) == 0) {
            return body.substr(3, body.size() - 6);
        }
    }
    if (body.size() >= 2 && (body.front() == '"' || body.front() == '\'') && body.back() == body.front()) {
        return body.substr(1, body.size() - 2);
    }
    return body;
}

std::string docstringOf(TSNode definition, const std::string& content) {
    TSNode body = field(definition, "body");
    if (ts_node_is_null(body)) return "";
    uint32_t count = ts_node_named_child_count(body);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode stmt = ts_node_named_child(body, i);
        if (isType(stmt, "comment")) continue;
        if (!isType(stmt, "expression_statement") || ts_node_named_child_count(stmt) == 0) return "";
        TSNode expr = ts_node_named_child(stmt, 0);
        if (!isType(expr, "string")) return "";
        return FileIO::truncateUtf8(FileIO::trim(stripStringQuotes(nodeText(expr, content))), 200);
    }
    return "";
}

std::vector<std::string> parameterNames(TSNode params, const std::string& content) {
    std::vector<std::string> names;
    if (ts_node_is_null(params)) return names;
    uint32_t count = ts_node_named_child_count(params);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode p = ts_node_named_child(params, i);
        if (isType(p, "identifier") || isType(p, "list_splat_pattern") ||
            isType(p, "dictionary_splat_pattern") || isType(p, "tuple_pattern")) {
            names.push_back(nodeText(p, content));
        } else if (isType(p, "typed_parameter")) {
            if (ts_node_named_child_count(p) > 0) {
                names.push_back(nodeText(ts_node_named_child(p, 0), content));
            }
        } else if (isType(p, "default_parameter") || isType(p, "typed_default_parameter")) {
            names.push_back(nodeText(field(p, "name"), content));
        } else if (isType(p, "keyword_separator")) {
            names.push_back("*");
        }
        // positional_separator ("/") 与注释不计入
    }
    return names;
}

bool isUpperName(const std::string& name) {
    bool hasAlpha = false;
    for (unsigned char c : name) {
        if (std::islower(c)) return false;
        if (std::isalpha(c)) hasAlpha = true;
    }
    return hasAlpha;
}

/** 定义节点外层的 decorated_definition（若有），否则返回节点本身 */
TSNode outerDefinition(TSNode definition) {
    TSNode parent = ts_node_parent(definition);
    if (!ts_node_is_null(parent) && isType(parent, "decorated_definition")) return parent;
    return definition;
}

std::vector<std::string> decoratorsOf(TSNode definition, const std::string& content) {
    std::vector<std::string> decorators;
    TSNode outer = outerDefinition(definition);
    if (sameNode(definition, outer)) return decorators;
    uint32_t count = ts_node_named_child_count(outer);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode child = ts_node_named_child(outer, i);
        if (!isType(child, "decorator")) continue;
        std::string text = nodeText(child, content);
        if (!text.empty() && text[0] == '@') text.erase(0, 1);
        decorators.push_back(FileIO::trim(text));
    }
    return decorators;
}

std::string joinLines(const std::vector<std::string>& lines, int firstLine, int lastLine) {
    std::string out;
    for (int ln = std::max(firstLine, 1); ln <= lastLine && ln <= static_cast<int>(lines.size()); ++ln) {
        out += lines[ln - 1];
    }
    return out;
}

FunctionDecl makeFunction(TSNode node, const std::string& content) {
    FunctionDecl fn;
    fn.name = nodeText(field(node, "name"), content);
    fn.start = startLine(node);
    fn.end = endLine(node);
    fn.params = parameterNames(field(node, "parameters"), content);
    fn.doc = docstringOf(node, content);
    fn.decorators = decoratorsOf(node, content);
    fn.isAsync = ts_node_child_count(node) > 0 && isType(ts_node_child(node, 0), "async");
    return fn;
}

ClassDecl makeClass(TSNode node, const std::string& content) {
    ClassDecl cls;
    cls.name = nodeText(field(node, "name"), content);
    cls.start = startLine(node);
    cls.end = endLine(node);
    cls.doc = docstringOf(node, content);

    TSNode supers = field(node, "superclasses");
    if (!ts_node_is_null(supers)) {
        uint32_t count = ts_node_named_child_count(supers);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode base = ts_node_named_child(supers, i);
            if (isType(base, "comment")) continue;
            cls.bases.push_back(nodeText(base, content));
        }
    }

    TSNode body = field(node, "body");
    if (!ts_node_is_null(body)) {
        uint32_t count = ts_node_named_child_count(body);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode member = ts_node_named_child(body, i);
            if (isType(member, "decorated_definition")) member = field(member, "definition");
            if (!ts_node_is_null(member) && isType(member, "function_definition")) {
                cls.methods.push_back(nodeText(field(member, "name"), content));
            }
        }
    }
    return cls;
}

void collectDeclarations(TSNode node, const std::string& content, FileSymbolTable& table) {
    if (isType(node, "function_definition")) {
        table.functions.push_back(makeFunction(node, content));
    } else if (isType(node, "class_definition")) {
        table.classes.push_back(makeClass(node, content));
    }
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        collectDeclarations(ts_node_named_child(node, i), content, table);
    }
}

void collectModuleAssignment(TSNode assignment, const std::string& content, FileSymbolTable& table) {
    int line = startLine(assignment);
    TSNode left = field(assignment, "left");
    TSNode type = field(assignment, "type");
    if (!ts_node_is_null(type)) {
        table.annotations.push_back({nodeText(left, content), nodeText(type, content), line});
    }

    // a = b = 1 解析为嵌套的 assignment
    std::vector<TSNode> targets{left};
    TSNode value = field(assignment, "right");
    while (!ts_node_is_null(value) && isType(value, "assignment")) {
        targets.push_back(field(value, "left"));
        value = field(value, "right");
    }
    if (ts_node_is_null(value)) return;

    std::string valueText = FileIO::truncateUtf8(nodeText(value, content), 80);
    for (TSNode target : targets) {
        if (ts_node_is_null(target)) continue;
        table.assignments.push_back({nodeText(target, content), line, valueText});
        if (isType(target, "identifier")) {
            table.variables.push_back({nodeText(target, content), line, valueText});
        }
    }
}

void collectImports(TSNode node, const std::string& content, FileSymbolTable& table) {
    bool isImport = isType(node, "import_statement");
    bool isFrom = isType(node, "import_from_statement");
    if (isImport || isFrom) {
        int line = startLine(node);
        TSNode moduleName = field(node, "module_name");
        std::string source = isFrom ? nodeText(moduleName, content) : "";
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (sameNode(child, moduleName) || isType(child, "comment")) continue;
            ImportDecl imp;
            imp.source = source;
            imp.line = line;
            imp.kind = isFrom ? "from" : "import";
            if (isType(child, "wildcard_import")) {
                imp.name = "*";
            } else if (!isType(child, "dotted_name") && !isType(child, "aliased_import")) {
                continue;
            } else if (isType(child, "aliased_import")) {
                imp.name = nodeText(field(child, "name"), content);
                imp.alias = nodeText(field(child, "alias"), content);
            } else {
                imp.name = nodeText(child, content);
            }
            table.imports.push_back(std::move(imp));
        }
        return;
    }
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        collectImports(ts_node_named_child(node, i), content, table);
    }
}

/**
 * 按语法角色遍历，产出标识符出现。
 * import / global / nonlocal 语句、形参名、关键字实参名不产生出现。
 */
class OccurrenceWalker {
public:
    OccurrenceWalker(const std::string& content, std::vector<SymbolOccurrence>& out)
        : content(content), out(out) {}

    void visit(TSNode node) {
        if (ts_node_is_null(node)) return;
        if (isType(node, "comment") ||
            isType(node, "import_statement") || isType(node, "import_from_statement") ||
            isType(node, "future_import_statement") ||
            isType(node, "global_statement") || isType(node, "nonlocal_statement")) {
            return;
        }

        if (isType(node, "identifier")) {
            emit(node, OccurrenceKind::Ref);
        } else if (isType(node, "function_definition") || isType(node, "class_definition")) {
            visitDefinition(node);
        } else if (isType(node, "lambda")) {
            TSNode params = field(node, "parameters");
            visitParameters(params);
            visitNamedChildrenExcept(node, params);
        } else if (isType(node, "call")) {
            visitCall(node);
        } else if (isType(node, "attribute")) {
            visit(field(node, "object"));
            emit(field(node, "attribute"), OccurrenceKind::Attr);
        } else if (isType(node, "keyword_argument")) {
            visit(field(node, "value"));
        } else if (isType(node, "assignment") || isType(node, "augmented_assignment") ||
                   isType(node, "for_statement") || isType(node, "for_in_clause")) {
            TSNode left = field(node, "left");
            visitStore(left);
            visitNamedChildrenExcept(node, left);
        } else if (isType(node, "named_expression")) {
            TSNode name = field(node, "name");
            visitStore(name);
            visitNamedChildrenExcept(node, name);
        } else {
            visitChildren(node);
        }
    }

private:
    const std::string& content;
    std::vector<SymbolOccurrence>& out;

    void emit(TSNode ident, OccurrenceKind kind) {
        if (ts_node_is_null(ident)) return;
        std::string name = nodeText(ident, content);
        if (name.empty()) return;
        out.push_back({"", startLine(ident), kind, name});
    }

    // "alias" 字段（as 目标）按赋值处理，其余命名子节点正常遍历
    void visitChildren(TSNode node) {
        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_child(node, i);
            if (!ts_node_is_named(child)) continue;
            const char* fieldName = ts_node_field_name_for_child(node, i);
            if (fieldName && std::strcmp(fieldName, "alias") == 0) {
                visitStore(child);
            } else {
                visit(child);
            }
        }
    }

    void visitNamedChildrenExcept(TSNode node, TSNode skip) {
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (sameNode(child, skip)) continue;
            visit(child);
        }
    }

    void visitDefinition(TSNode node) {
        TSNode name = field(node, "name");
        TSNode params = field(node, "parameters");
        emit(name, OccurrenceKind::Definition);
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode child = ts_node_named_child(node, i);
            if (sameNode(child, name)) continue;
            if (sameNode(child, params)) {
                visitParameters(child);
            } else {
                visit(child);
            }
        }
    }

    void visitParameters(TSNode params) {
        if (ts_node_is_null(params)) return;
        uint32_t count = ts_node_named_child_count(params);
        for (uint32_t i = 0; i < count; ++i) {
            TSNode p = ts_node_named_child(params, i);
            if (isType(p, "typed_parameter")) {
                visit(field(p, "type"));
            } else if (isType(p, "default_parameter")) {
                visit(field(p, "value"));
            } else if (isType(p, "typed_default_parameter")) {
                visit(field(p, "type"));
                visit(field(p, "value"));
            } else if (isType(p, "identifier") || isType(p, "list_splat_pattern") ||
                       isType(p, "dictionary_splat_pattern") || isType(p, "keyword_separator") ||
                       isType(p, "positional_separator") || isType(p, "tuple_pattern")) {
                continue;
            } else {
                visit(p);
            }
        }
    }

    void visitCall(TSNode node) {
        TSNode fn = field(node, "function");
        if (!ts_node_is_null(fn) && isType(fn, "identifier")) {
            emit(fn, OccurrenceKind::Call);
        } else if (!ts_node_is_null(fn) && isType(fn, "attribute")) {
            visit(field(fn, "object"));
            emit(field(fn, "attribute"), OccurrenceKind::Call);
        } else {
            visit(fn);
        }
        visitNamedChildrenExcept(node, fn);
    }

    void visitStore(TSNode node) {
        if (ts_node_is_null(node)) return;
        if (isType(node, "identifier")) {
            emit(node, OccurrenceKind::Store);
        } else if (isType(node, "pattern_list") || isType(node, "tuple_pattern") ||
                   isType(node, "list_pattern") || isType(node, "tuple") || isType(node, "list") ||
                   isType(node, "parenthesized_expression") || isType(node, "list_splat_pattern") ||
                   isType(node, "list_splat") || isType(node, "as_pattern_target")) {
            uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                visitStore(ts_node_named_child(node, i));
            }
        } else {
            // 属性、下标等作为目标时，其组成部分按读取处理
            visit(node);
        }
    }
};

void collectIdentifiers(TSNode node, const std::string& content, const std::string& name,
                        std::vector<TokenSpan>& out) {
    if (isType(node, "identifier")) {
        if (nodeText(node, content) == name) {
            TSPoint start = ts_node_start_point(node);
            TSPoint end = ts_node_end_point(node);
            out.push_back({static_cast<int>(start.row) + 1, static_cast<int>(start.column),
                           static_cast<int>(end.column)});
        }
        return;
    }
    uint32_t count = ts_node_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        collectIdentifiers(ts_node_child(node, i), content, name, out);
    }
}

bool calleeMatches(TSNode fn, const std::string& content, const std::string& functionName) {
    if (ts_node_is_null(fn)) return false;
    if (isType(fn, "identifier")) return nodeText(fn, content) == functionName;
    if (isType(fn, "attribute")) return nodeText(field(fn, "attribute"), content) == functionName;
    return false;
}

CallSite makeCallSite(TSNode call, TSNode args, const std::string& content) {
    CallSite site;
    TSPoint start = ts_node_start_point(args);
    site.line = static_cast<int>(start.row) + 1;
    site.colStart = static_cast<int>(start.column);
    site.argsBegin = ts_node_start_byte(args);
    site.argsEnd = ts_node_end_byte(args);

    if (ts_node_has_error(call)) {
        site.lowConfidence = true;
        site.reason = "syntax error in call";
    }
    if (isType(args, "generator_expression")) {
        site.lowConfidence = true;
        site.reason = "generator argument";
        return site;
    }

    uint32_t count = ts_node_named_child_count(args);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode arg = ts_node_named_child(args, i);
        if (isType(arg, "comment")) continue;
        CallArgument ca;
        ca.begin = ts_node_start_byte(arg);
        ca.end = ts_node_end_byte(arg);
        ca.text = nodeText(arg, content);
        if (isType(arg, "keyword_argument")) {
            ca.keyword = nodeText(field(arg, "name"), content);
            site.keywords.push_back(std::move(ca));
        } else if (isType(arg, "list_splat") || isType(arg, "dictionary_splat")) {
            site.lowConfidence = true;
            site.reason = "unpacked arguments";
        } else {
            site.positional.push_back(std::move(ca));
        }
    }
    return site;
}

void collectCalls(TSNode node, const std::string& content, const std::string& functionName,
                  std::vector<CallSite>& out) {
    if (isType(node, "call")) {
        TSNode args = field(node, "arguments");
        if (!ts_node_is_null(args) && calleeMatches(field(node, "function"), content, functionName)) {
            out.push_back(makeCallSite(node, args, content));
        }
    }
    uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
        collectCalls(ts_node_named_child(node, i), content, functionName, out);
    }
}

Chunk definitionChunk(TSNode definition, const std::vector<std::string>& lines, const std::string& content,
                      const std::string& relPath, const std::string& symbol, const std::string& kind) {
    Chunk chunk;
    chunk.file = relPath;
    chunk.symbol = symbol;
    chunk.kind = kind;
    chunk.startLine = startLine(definition);
    chunk.endLine = endLine(definition);
    chunk.source = joinLines(lines, startLine(outerDefinition(definition)), chunk.endLine);
    chunk.doc = docstringOf(definition, content);
    return chunk;
}

bool isPythonKeyword(const std::string& word) {
    static const char* const kKeywords[] = {
        "False", "None", "True", "and", "as", "assert", "async", "await", "break", "class",
        "continue", "def", "del", "elif", "else", "except", "finally", "for", "from", "global",
        "if", "import", "in", "is", "lambda", "nonlocal", "not", "or", "pass", "raise",
        "return", "try", "while", "with", "yield"
    };
    return std::any_of(std::begin(kKeywords), std::end(kKeywords),
                       [&](const char* kw) { return word == kw; });
}

} // namespace

TreeSitterPythonParser::TreeSitterPythonParser() : language(tree_sitter_python()) {}

// PEP 3131：ASCII 部分为 [A-Za-z_][A-Za-z0-9_]*，非 ASCII 字节（UTF-8 编码的 Unicode 字母）放行
bool TreeSitterPythonParser::isValidIdentifier(const std::string& name) const {
    if (name.empty() || isPythonKeyword(name)) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (first < 0x80 && !(std::isalpha(first) || first == '_')) return false;
    for (unsigned char c : name) {
        if (c < 0x80 && !(std::isalnum(c) || c == '_')) return false;
    }
    return true;
}

bool TreeSitterPythonParser::supportsExtension(const std::string& ext) const {
    return ext == ".py" || ext == ".pyi";
}

FileSymbolTable TreeSitterPythonParser::extractSymbols(const std::string& content, const std::string& relPath) const {
    (void)relPath;
    FileSymbolTable table;
    table.confidence = confidence();
    TreePtr tree = parseSource(language, content);
    if (!tree) {
        table.hasErrors = true;
        return table;
    }
    TSNode root = ts_tree_root_node(tree.get());
    table.hasErrors = ts_node_has_error(root);

    collectDeclarations(root, content, table);
    collectImports(root, content, table);

    uint32_t count = ts_node_named_child_count(root);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode stmt = ts_node_named_child(root, i);
        if (!isType(stmt, "expression_statement") || ts_node_named_child_count(stmt) == 0) continue;
        TSNode expr = ts_node_named_child(stmt, 0);
        if (isType(expr, "assignment")) {
            collectModuleAssignment(expr, content, table);
        }
    }
    return table;
}

std::vector<SymbolOccurrence> TreeSitterPythonParser::scanOccurrences(const std::string& content, const std::string& relPath) const {
    (void)relPath;
    std::vector<SymbolOccurrence> occurrences;
    TreePtr tree = parseSource(language, content);
    if (!tree) return occurrences;
    OccurrenceWalker walker(content, occurrences);
    walker.visit(ts_tree_root_node(tree.get()));
    return occurrences;
}

std::vector<TokenSpan> TreeSitterPythonParser::renameTokens(const std::string& content, const std::string& name) const {
    std::vector<TokenSpan> spans;
    if (name.empty()) return spans;
    TreePtr tree = parseSource(language, content);
    if (!tree) return spans;
    collectIdentifiers(ts_tree_root_node(tree.get()), content, name, spans);
    std::sort(spans.begin(), spans.end(), [](const TokenSpan& a, const TokenSpan& b) {
        return a.line != b.line ? a.line < b.line : a.colStart < b.colStart;
    });
    return spans;
}

std::vector<CallSite> TreeSitterPythonParser::callSites(const std::string& content, const std::string& functionName) const {
    std::vector<CallSite> sites;
    TreePtr tree = parseSource(language, content);
    if (!tree) return sites;
    collectCalls(ts_tree_root_node(tree.get()), content, functionName, sites);
    return sites;
}

std::vector<Chunk> TreeSitterPythonParser::extractChunks(const std::string& content, const std::string& relPath) const {
    std::vector<Chunk> chunks;
    TreePtr tree = parseSource(language, content);
    if (!tree) return chunks;
    std::vector<std::string> lines = FileIO::splitLinesKeepEnds(content);
    TSNode root = ts_tree_root_node(tree.get());

    // 只取顶层定义与类的直接方法，不进入嵌套函数
    uint32_t count = ts_node_named_child_count(root);
    for (uint32_t i = 0; i < count; ++i) {
        TSNode node = ts_node_named_child(root, i);
        if (isType(node, "decorated_definition")) node = field(node, "definition");
        if (ts_node_is_null(node)) continue;

        if (isType(node, "function_definition")) {
            chunks.push_back(definitionChunk(node, lines, content, relPath,
                                             nodeText(field(node, "name"), content), "function"));
        } else if (isType(node, "class_definition")) {
            std::string className = nodeText(field(node, "name"), content);
            chunks.push_back(definitionChunk(node, lines, content, relPath, className, "class"));
            TSNode body = field(node, "body");
            if (ts_node_is_null(body)) continue;
            uint32_t memberCount = ts_node_named_child_count(body);
            for (uint32_t m = 0; m < memberCount; ++m) {
                TSNode member = ts_node_named_child(body, m);
                if (isType(member, "decorated_definition")) member = field(member, "definition");
                if (ts_node_is_null(member) || !isType(member, "function_definition")) continue;
                chunks.push_back(definitionChunk(member, lines, content, relPath,
                                                 className + "." + nodeText(field(member, "name"), content),
                                                 "method"));
            }
        } else if (isType(node, "expression_statement") && ts_node_named_child_count(node) > 0) {
            TSNode expr = ts_node_named_child(node, 0);
            if (!isType(expr, "assignment")) continue;
            TSNode left = field(expr, "left");
            TSNode right = field(expr, "right");
            if (ts_node_is_null(left) || ts_node_is_null(right) || !isType(left, "identifier")) continue;
            std::string name = nodeText(left, content);
            if (!isUpperName(name)) continue;
            Chunk chunk;
            chunk.file = relPath;
            chunk.symbol = name;
            chunk.kind = "variable";
            chunk.startLine = startLine(expr);
            chunk.endLine = chunk.startLine;
            chunk.source = name + " = " + FileIO::truncateUtf8(nodeText(right, content), 80);
            chunks.push_back(std::move(chunk));
        }
    }
    return chunks;
}

std::optional<std::string> TreeSitterPythonParser::definitionBlock(const std::string& content, const std::string& symbol) const {
    TreePtr tree = parseSource(language, content);
    if (!tree) return std::nullopt;

    // 广度优先：外层定义优先于同名的嵌套定义
    std::deque<TSNode> queue{ts_tree_root_node(tree.get())};
    while (!queue.empty()) {
        TSNode node = queue.front();
        queue.pop_front();
        if ((isType(node, "function_definition") || isType(node, "class_definition")) &&
            nodeText(field(node, "name"), content) == symbol) {
            std::vector<std::string> lines = FileIO::splitLinesKeepEnds(content);
            return joinLines(lines, startLine(outerDefinition(node)), endLine(node));
        }
        uint32_t count = ts_node_named_child_count(node);
        for (uint32_t i = 0; i < count; ++i) {
            queue.push_back(ts_node_named_child(node, i));
        }
    }
    return std::nullopt;
}
