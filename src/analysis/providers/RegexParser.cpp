#include "analysis/providers/RegexParser.h"
#include "utils/FileIO.h"
#include <algorithm>
#include <cctype>
#include <map>
#include <regex>
#include <set>
#include <unordered_set>

namespace {

bool isIdentStart(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || c == '$';
}

bool isIdentChar(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '$';
}

constexpr size_t kMaxPatternLine = 2000;

const std::unordered_set<std::string>& keywords() {
    static const std::unordered_set<std::string> words = {
        "abstract", "assert", "async", "await", "boolean", "break", "byte", "case", "catch", "char",
        "class", "const", "continue", "debugger", "default", "delete", "do", "double", "else", "enum",
        "export", "extends", "false", "final", "finally", "float", "for", "function", "goto", "if",
        "implements", "import", "in", "instanceof", "int", "interface", "let", "long", "native", "new",
        "null", "package", "private", "protected", "public", "return", "short", "static", "strictfp",
        "super", "switch", "synchronized", "this", "throw", "throws", "transient", "true", "try",
        "typeof", "undefined", "var", "void", "volatile", "while", "with", "yield"
    };
    return words;
}

/**
 * 字符串与注释内容替换为空格（保留引号与换行），长度与原文一致，
 * 后续的模式匹配、括号计数都在该视图上进行。
 */
std::string maskStringsAndComments(const std::string& src) {
    enum class State { Code, LineComment, BlockComment, String };
    std::string out = src;
    State state = State::Code;
    char quote = 0;
    for (size_t i = 0; i < src.size(); ++i) {
        char c = src[i];
        char next = i + 1 < src.size() ? src[i + 1] : '\0';
        switch (state) {
            case State::Code:
                if (c == '/' && next == '/') {
                    state = State::LineComment;
                    out[i] = out[i + 1] = ' ';
                    ++i;
                } else if (c == '/' && next == '*') {
                    state = State::BlockComment;
                    out[i] = out[i + 1] = ' ';
                    ++i;
                } else if (c == '"' || c == '\'' || c == '`') {
                    state = State::String;
                    quote = c;
                }
                break;
            case State::LineComment:
                if (c == '\n') state = State::Code;
                else out[i] = ' ';
                break;
            case State::BlockComment:
                if (c == '*' && next == '/') {
                    out[i] = out[i + 1] = ' ';
                    ++i;
                    state = State::Code;
                } else if (c != '\n') {
                    out[i] = ' ';
                }
                break;
            case State::String:
                if (c == '\\') {
                    out[i] = ' ';
                    if (i + 1 < src.size() && next != '\n') out[i + 1] = ' ';
                    ++i;
                } else if (c == quote) {
                    state = State::Code;
                } else if (c == '\n') {
                    // 未闭合的普通字符串在行尾结束；模板字符串可跨行
                    if (quote != '`') state = State::Code;
                } else {
                    out[i] = ' ';
                }
                break;
        }
    }
    return out;
}

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    for (const auto& l : FileIO::splitLinesKeepEnds(content)) {
        std::string s = l;
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
        lines.push_back(s);
    }
    return lines;
}

/** 一次解析所需的各种视图 */
struct SourceView {
    std::string masked;
    std::vector<std::string> rawLines;
    std::vector<std::string> maskedLines;
    std::vector<size_t> offsets;      // 每行起始偏移
    std::vector<int> depthAtLine;     // 每行起始处的花括号深度

    explicit SourceView(const std::string& content)
        : masked(maskStringsAndComments(content)),
          rawLines(splitLines(content)),
          maskedLines(splitLines(masked)),
          offsets(FileIO::lineOffsets(content)) {
        depthAtLine.assign(maskedLines.size() + 1, 0);
        int depth = 0;
        size_t line = 0;
        for (char c : masked) {
            if (c == '{') ++depth;
            else if (c == '}') depth = std::max(0, depth - 1);
            else if (c == '\n') {
                ++line;
                if (line < depthAtLine.size()) depthAtLine[line] = depth;
            }
        }
    }

    int lineCount() const { return static_cast<int>(rawLines.size()); }

    int lineOf(size_t offset) const {
        auto it = std::upper_bound(offsets.begin(), offsets.end(), offset);
        return static_cast<int>(it - offsets.begin());
    }

    /** 从第 line 行开始找到的第一个 '{' 所开启块的结束行；遇到 ';' 先于 '{' 则视为无块 */
    int blockEnd(int line) const {
        if (line < 1 || line > lineCount()) return line;
        int depth = 0;
        bool opened = false;
        for (size_t i = offsets[line - 1]; i < masked.size(); ++i) {
            char c = masked[i];
            if (c == '{') {
                ++depth;
                opened = true;
            } else if (c == '}') {
                if (--depth == 0 && opened) return lineOf(i);
            } else if (c == ';' && !opened) {
                return line;
            }
        }
        return opened ? lineCount() : line;
    }
};

std::vector<std::string> splitTopLevel(const std::string& text, char sep) {
    std::vector<std::string> parts;
    int depth = 0;
    std::string current;
    for (char c : text) {
        if (c == '(' || c == '[' || c == '{' || c == '<') ++depth;
        else if (c == ')' || c == ']' || c == '}' || c == '>') --depth;
        if (c == sep && depth == 0) {
            parts.push_back(FileIO::trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!FileIO::trim(current).empty()) parts.push_back(FileIO::trim(current));
    return parts;
}

std::string lastIdentifier(const std::string& text) {
    std::string result;
    for (size_t i = 0; i < text.size();) {
        if (isIdentStart(text[i]) && (i == 0 || !isIdentChar(text[i - 1]))) {
            size_t j = i;
            while (j < text.size() && isIdentChar(text[j])) ++j;
            result = text.substr(i, j - i);
            i = j;
        } else {
            ++i;
        }
    }
    return result;
}

/** "a: string = 1" -> "a"；"final String b" -> "b"；"...rest" -> "*rest" */
std::vector<std::string> parseParams(const std::string& paramText) {
    std::vector<std::string> params;
    for (std::string p : splitTopLevel(paramText, ',')) {
        size_t eq = p.find('=');
        if (eq != std::string::npos) p = p.substr(0, eq);
        bool rest = false;
        p = FileIO::trim(p);
        if (p.rfind("...", 0) == 0) {
            rest = true;
            p = p.substr(3);
        }
        size_t colon = p.find(':');
        std::string name = colon != std::string::npos ? FileIO::trim(p.substr(0, colon)) : lastIdentifier(p);
        if (!name.empty() && name.back() == '?') name.pop_back();
        if (name.empty()) continue;
        params.push_back(rest ? "*" + name : name);
    }
    return params;
}

std::vector<std::string> decoratorsAbove(const SourceView& view, int line) {
    std::vector<std::string> decorators;
    for (int ln = line - 1; ln >= 1; --ln) {
        std::string t = FileIO::trim(view.rawLines[ln - 1]);
        if (t.empty() || t[0] != '@') break;
        decorators.insert(decorators.begin(), t.substr(1));
    }
    return decorators;
}

std::string docAbove(const SourceView& view, int line) {
    int ln = line - 1;
    while (ln >= 1 && FileIO::trim(view.rawLines[ln - 1]).rfind("@", 0) == 0) --ln;
    if (ln < 1) return "";
    std::string last = FileIO::trim(view.rawLines[ln - 1]);
    if (last.size() < 2 || last.compare(last.size() - 2, 2, "*/") != 0) return "";

    std::vector<std::string> parts;
    for (; ln >= 1; --ln) {
        std::string t = FileIO::trim(view.rawLines[ln - 1]);
        bool opening = t.rfind("/*", 0) == 0;
        if (opening) t = t.substr(t.rfind("/**", 0) == 0 ? 3 : 2);
        if (t.size() >= 2 && t.compare(t.size() - 2, 2, "*/") == 0) t = t.substr(0, t.size() - 2);
        t = FileIO::trim(t);
        if (!t.empty() && t[0] == '*') t = FileIO::trim(t.substr(1));
        if (!t.empty()) parts.insert(parts.begin(), t);
        if (opening) break;
    }
    std::string doc;
    for (const auto& p : parts) {
        if (!doc.empty()) doc += " ";
        doc += p;
    }
    return FileIO::truncateUtf8(doc, 200);
}

bool endsWithWord(const std::string& text, const std::string& word) {
    std::string t = FileIO::rtrim(text);
    if (t.size() < word.size() || t.compare(t.size() - word.size(), word.size(), word) != 0) return false;
    return t.size() == word.size() || !isIdentChar(t[t.size() - word.size() - 1]);
}

void parseImportClause(const std::string& clause, const std::string& source, int line, FileSymbolTable& table) {
    auto add = [&](const std::string& name, const std::string& alias) {
        ImportDecl imp;
        imp.name = name;
        imp.alias = alias;
        imp.source = source;
        imp.line = line;
        imp.kind = "from";
        table.imports.push_back(std::move(imp));
    };
    auto addAliased = [&](const std::string& item) {
        static const std::regex asRe(R"(^\s*(\*|[A-Za-z_$][\w$]*)\s+as\s+([A-Za-z_$][\w$]*)\s*$)");
        std::smatch m;
        if (std::regex_match(item, m, asRe)) {
            add(m[1].str(), m[2].str());
        } else if (!FileIO::trim(item).empty()) {
            add(FileIO::trim(item), "");
        }
    };

    size_t open = clause.find('{');
    size_t close = clause.find('}');
    std::string head = open != std::string::npos ? clause.substr(0, open) : clause;
    for (const auto& part : splitTopLevel(head, ',')) addAliased(part);
    if (open != std::string::npos && close != std::string::npos && close > open) {
        for (const auto& part : splitTopLevel(clause.substr(open + 1, close - open - 1), ',')) {
            addAliased(part);
        }
    }
}

void collectImport(const std::string& raw, int line, FileSymbolTable& table) {
    static const std::regex esFrom(R"raw(^\s*import\s+(?:type\s+)?(.+?)\s+from\s+['"]([^'"]+)['"])raw");
    static const std::regex esBare(R"raw(^\s*import\s+['"]([^'"]+)['"])raw");
    static const std::regex requireRe(R"raw(\b(?:const|let|var)\s+(\{[^}]*\}|[A-Za-z_$][\w$]*)\s*=\s*require\(\s*['"]([^'"]+)['"]\s*\))raw");
    static const std::regex javaImport(R"raw(^\s*import\s+(?:static\s+)?([\w$]+(?:\.[\w$]+)*)(\.\*)?\s*;)raw");

    std::smatch m;
    if (std::regex_search(raw, m, esFrom)) {
        parseImportClause(m[1].str(), m[2].str(), line, table);
    } else if (std::regex_search(raw, m, esBare)) {
        table.imports.push_back({m[1].str(), "", m[1].str(), line, "import"});
    } else if (std::regex_search(raw, m, requireRe)) {
        std::string target = m[1].str();
        std::string source = m[2].str();
        if (!target.empty() && target[0] == '{') {
            for (const auto& part : splitTopLevel(target.substr(1, target.size() - 2), ',')) {
                size_t colon = part.find(':');
                std::string name = FileIO::trim(colon != std::string::npos ? part.substr(0, colon) : part);
                std::string alias = colon != std::string::npos ? FileIO::trim(part.substr(colon + 1)) : "";
                if (!name.empty()) table.imports.push_back({name, alias, source, line, "require"});
            }
        } else {
            table.imports.push_back({target, "", source, line, "require"});
        }
    } else if (std::regex_search(raw, m, javaImport)) {
        std::string path = m[1].str();
        if (m[2].matched) {
            table.imports.push_back({"*", "", path, line, "import"});
        } else {
            size_t dot = path.rfind('.');
            std::string name = dot == std::string::npos ? path : path.substr(dot + 1);
            std::string source = dot == std::string::npos ? "" : path.substr(0, dot);
            table.imports.push_back({name, "", source, line, "import"});
        }
    }
}

std::vector<std::string> collectHeritage(const std::string& rest) {
    // "extends A implements B, C {" -> [A, B, C]
    std::vector<std::string> bases;
    std::string text = rest.substr(0, rest.find('{'));
    static const std::regex word(R"([A-Za-z_$][\w$.]*(?:<[^>]*>)?)");
    bool collecting = false;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), word); it != std::sregex_iterator(); ++it) {
        std::string w = it->str();
        if (w == "extends" || w == "implements") {
            collecting = true;
            continue;
        }
        if (collecting) bases.push_back(w);
    }
    return bases;
}

FileSymbolTable extractTable(const SourceView& view) {
    static const std::regex classRe(R"(\b(?:class|interface|enum)\s+([A-Za-z_$][\w$]*))");
    static const std::regex functionRe(R"(\bfunction\b\s*\*?\s*([A-Za-z_$][\w$]*)\s*(?:<[^>(]*>)?\s*\(([^)]*))");
    static const std::regex arrowParenRe(R"(^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*(?::[^=]+)?=\s*(async\s+)?\(([^)]*)\)\s*(?::\s*[^=]+)?=>)");
    static const std::regex arrowBareRe(R"(^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*=\s*(async\s+)?([A-Za-z_$][\w$]*)\s*=>)");
    static const std::regex methodRe(R"(^(\s*(?:[\w$<>\[\],.?@]+\s+)*)([A-Za-z_$][\w$]*)\s*\(([^)]*)\)\s*(?::\s*[^{;=]+)?(?:throws\s+[\w$.,\s]+)?\{)");
    static const std::regex variableRe(R"(^\s*(?:export\s+)?(?:const|let|var)\s+([A-Za-z_$][\w$]*)\s*(?::\s*([^=]+?))?\s*=\s*(.+?)\s*;?\s*$)");
    static const std::regex asyncBeforeRe(R"(\basync\s*$)");
    static const std::regex asyncWordRe(R"(\basync\b)");

    FileSymbolTable table;
    table.confidence = "heuristic";

    struct OpenClass {
        size_t index;
        int depth;
        int end;
    };
    std::vector<OpenClass> classes;

    for (int ln = 1; ln <= view.lineCount(); ++ln) {
        const std::string& masked = view.maskedLines[ln - 1];
        const std::string& raw = view.rawLines[ln - 1];
        int depth = view.depthAtLine[ln - 1];
        std::smatch m;
        // 压缩代码等超长行不做模式匹配
        if (masked.size() > kMaxPatternLine) continue;

        collectImport(raw, ln, table);

        if (std::regex_search(masked, m, classRe)) {
            ClassDecl cls;
            cls.name = m[1].str();
            cls.start = ln;
            cls.end = view.blockEnd(ln);
            cls.bases = collectHeritage(m.suffix().str());
            cls.doc = docAbove(view, ln);
            classes.push_back({table.classes.size(), depth, cls.end});
            table.classes.push_back(std::move(cls));
            continue;
        }

        FunctionDecl fn;
        bool matched = false;
        if (std::regex_search(masked, m, functionRe)) {
            fn.name = m[1].str();
            fn.params = parseParams(m[2].str());
            fn.isAsync = std::regex_search(masked.substr(0, static_cast<size_t>(m.position(0))), asyncBeforeRe);
            fn.end = view.blockEnd(ln);
            matched = true;
        } else if (std::regex_search(masked, m, arrowParenRe)) {
            fn.name = m[1].str();
            fn.params = parseParams(m[3].str());
            fn.isAsync = m[2].matched;
            matched = true;
        } else if (std::regex_search(masked, m, arrowBareRe)) {
            fn.name = m[1].str();
            fn.params = {m[3].str()};
            fn.isAsync = m[2].matched;
            matched = true;
        } else if (depth > 0 && std::regex_search(masked, m, methodRe)) {
            std::string prefix = m[1].str();
            std::string name = m[2].str();
            if (!keywords().count(name) && !endsWithWord(prefix, "new") && !endsWithWord(prefix, "return") &&
                !endsWithWord(prefix, "throw") && !endsWithWord(prefix, "await")) {
                fn.name = name;
                fn.params = parseParams(m[3].str());
                fn.isAsync = std::regex_search(prefix, asyncWordRe);
                fn.end = view.blockEnd(ln);
                matched = true;
            }
        }

        if (matched) {
            fn.start = ln;
            if (fn.end == 0) {
                size_t arrow = masked.find("=>");
                fn.end = (arrow != std::string::npos && masked.find('{', arrow) != std::string::npos)
                    ? view.blockEnd(ln) : ln;
            }
            fn.doc = docAbove(view, ln);
            fn.decorators = decoratorsAbove(view, ln);
            for (auto it = classes.rbegin(); it != classes.rend(); ++it) {
                if (ln <= it->end && depth == it->depth + 1) {
                    table.classes[it->index].methods.push_back(fn.name);
                    break;
                }
            }
            table.functions.push_back(std::move(fn));
            continue;
        }

        if (depth == 0 && std::regex_search(masked, m, variableRe)) {
            std::string name = m[1].str();
            std::string value = FileIO::truncateUtf8(
                FileIO::trim(raw.substr(static_cast<size_t>(m.position(3)), static_cast<size_t>(m.length(3)))), 80);
            if (value.rfind("require(", 0) == 0) continue;
            table.variables.push_back({name, ln, value});
            table.assignments.push_back({name, ln, value});
            if (m[2].matched) {
                table.annotations.push_back({name, FileIO::trim(m[2].str()), ln});
            }
        }
    }
    return table;
}

/** 声明行上的被声明名字：行号 -> 名字集合 */
std::map<int, std::set<std::string>> declarationLines(const FileSymbolTable& table) {
    std::map<int, std::set<std::string>> decls;
    for (const auto& f : table.functions) decls[f.start].insert(f.name);
    for (const auto& c : table.classes) decls[c.start].insert(c.name);
    return decls;
}

size_t skipSpaceForward(const std::string& s, size_t i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return i;
}

/** i 之前最近的非空白字符位置，没有则返回 npos */
size_t prevNonSpace(const std::string& s, size_t i) {
    while (i > 0) {
        --i;
        if (!std::isspace(static_cast<unsigned char>(s[i]))) return i;
    }
    return std::string::npos;
}

size_t matchingParen(const std::string& masked, size_t open) {
    int depth = 0;
    for (size_t i = open; i < masked.size(); ++i) {
        if (masked[i] == '(') ++depth;
        else if (masked[i] == ')' && --depth == 0) return i + 1;
    }
    return masked.size();
}

} // namespace

// 非 ASCII 字节按 Unicode 标识符字符接受；$ 在 JS / Java 中合法
bool RegexParser::isValidIdentifier(const std::string& name) const {
    if (name.empty() || keywords().count(name)) return false;
    if (!isIdentStart(name[0]) && static_cast<unsigned char>(name[0]) < 0x80) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return isIdentChar(c) || static_cast<unsigned char>(c) >= 0x80;
    });
}

bool RegexParser::supportsExtension(const std::string& ext) const {
    return ext == ".js" || ext == ".jsx" || ext == ".ts" || ext == ".tsx" || ext == ".java" ||
           ext == ".mjs" || ext == ".cjs";
}

FileSymbolTable RegexParser::extractSymbols(const std::string& content, const std::string& relPath) const {
    (void)relPath;
    SourceView view(content);
    return extractTable(view);
}

std::vector<SymbolOccurrence> RegexParser::scanOccurrences(const std::string& content, const std::string& relPath) const {
    (void)relPath;
    SourceView view(content);
    auto decls = declarationLines(extractTable(view));
    const std::string& s = view.masked;

    std::vector<SymbolOccurrence> occurrences;
    int line = 1;
    for (size_t i = 0; i < s.size();) {
        char c = s[i];
        if (c == '\n') {
            ++line;
            ++i;
            continue;
        }
        if (!isIdentStart(c) || (i > 0 && isIdentChar(s[i - 1]))) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < s.size() && isIdentChar(s[j])) ++j;
        std::string word = s.substr(i, j - i);

        if (!keywords().count(word)) {
            size_t prev = prevNonSpace(s, i);
            bool member = prev != std::string::npos && s[prev] == '.' &&
                          !(prev >= 2 && s[prev - 1] == '.' && s[prev - 2] == '.');
            size_t next = skipSpaceForward(s, j);
            bool called = next < s.size() && s[next] == '(';
            bool assigned = next < s.size() && s[next] == '=' &&
                            (next + 1 >= s.size() || (s[next + 1] != '=' && s[next + 1] != '>'));

            OccurrenceKind kind = OccurrenceKind::Ref;
            auto it = decls.find(line);
            if (!member && it != decls.end() && it->second.count(word)) {
                kind = OccurrenceKind::Definition;
            } else if (member) {
                kind = called ? OccurrenceKind::Call : OccurrenceKind::Attr;
            } else if (called) {
                kind = OccurrenceKind::Call;
            } else if (assigned) {
                kind = OccurrenceKind::Store;
            }
            occurrences.push_back({"", line, kind, word});
        }
        i = j;
    }
    return occurrences;
}

std::vector<TokenSpan> RegexParser::renameTokens(const std::string& content, const std::string& name) const {
    // 单词边界匹配原始文本：字符串与注释中的同名文本同样会命中
    std::vector<TokenSpan> spans;
    if (name.empty()) return spans;
    std::vector<std::string> lines = splitLines(content);
    for (size_t ln = 0; ln < lines.size(); ++ln) {
        const std::string& text = lines[ln];
        size_t pos = 0;
        while ((pos = text.find(name, pos)) != std::string::npos) {
            size_t end = pos + name.size();
            bool leftOk = pos == 0 || !isIdentChar(text[pos - 1]);
            bool rightOk = end >= text.size() || !isIdentChar(text[end]);
            if (leftOk && rightOk) {
                spans.push_back({static_cast<int>(ln) + 1, static_cast<int>(pos), static_cast<int>(end)});
            }
            pos = end;
        }
    }
    return spans;
}

std::vector<CallSite> RegexParser::callSites(const std::string& content, const std::string& functionName) const {
    std::vector<CallSite> sites;
    if (functionName.empty()) return sites;
    SourceView view(content);
    auto decls = declarationLines(extractTable(view));
    const std::string& s = view.masked;

    size_t pos = 0;
    while ((pos = s.find(functionName, pos)) != std::string::npos) {
        size_t end = pos + functionName.size();
        bool bounded = (pos == 0 || !isIdentChar(s[pos - 1])) && (end >= s.size() || !isIdentChar(s[end]));
        size_t open = skipSpaceForward(s, end);
        int line = view.lineOf(pos);
        auto it = decls.find(line);
        bool isDeclaration = it != decls.end() && it->second.count(functionName);
        if (bounded && open < s.size() && s[open] == '(' && !isDeclaration) {
            CallSite site;
            site.line = view.lineOf(open);
            site.colStart = static_cast<int>(open - view.offsets[site.line - 1]);
            site.argsBegin = open;
            site.argsEnd = matchingParen(s, open);
            site.lowConfidence = true;
            site.reason = "heuristic parser; call site not rewritten";
            sites.push_back(std::move(site));
        }
        pos = end;
    }
    return sites;
}

std::vector<Chunk> RegexParser::extractChunks(const std::string& content, const std::string& relPath) const {
    static const std::regex blockRe(R"((?:function|class|const|def)\s+(\w+))");
    std::vector<Chunk> chunks;
    SourceView view(content);
    std::vector<std::string> lines = FileIO::splitLinesKeepEnds(content);
    const std::string& s = view.masked;

    for (auto it = std::sregex_iterator(s.begin(), s.end(), blockRe); it != std::sregex_iterator(); ++it) {
        size_t offset = static_cast<size_t>(it->position(0));
        if (offset > 0 && isIdentChar(s[offset - 1])) continue;
        Chunk chunk;
        chunk.file = relPath;
        chunk.symbol = (*it)[1].str();
        chunk.kind = "block";
        chunk.startLine = view.lineOf(offset);
        chunk.endLine = std::min(chunk.startLine + 20, static_cast<int>(lines.size()));
        std::string src;
        for (int ln = chunk.startLine; ln <= chunk.endLine; ++ln) src += lines[ln - 1];
        chunk.source = FileIO::truncateUtf8(src, 400);
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::optional<std::string> RegexParser::definitionBlock(const std::string& content, const std::string& symbol) const {
    SourceView view(content);
    FileSymbolTable table = extractTable(view);
    int start = 0;
    int end = 0;
    for (const auto& c : table.classes) {
        if (c.name == symbol) {
            start = c.start;
            end = c.end;
            break;
        }
    }
    if (start == 0) {
        for (const auto& f : table.functions) {
            if (f.name == symbol) {
                start = f.start - static_cast<int>(f.decorators.size());
                end = f.end;
                break;
            }
        }
    }
    if (start == 0) return std::nullopt;

    std::vector<std::string> lines = FileIO::splitLinesKeepEnds(content);
    std::string block;
    for (int ln = std::max(start, 1); ln <= end && ln <= static_cast<int>(lines.size()); ++ln) {
        block += lines[ln - 1];
    }
    return block;
}
