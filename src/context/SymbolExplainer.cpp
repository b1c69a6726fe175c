#include "context/SymbolExplainer.h"
#include "analysis/GraphQuery.h"
#include "context/ChunkLoader.h"
#include "refactor/EditApplier.h"
#include "utils/FileIO.h"
#include <regex>

namespace {
const size_t kMaxDefinitions = 3;
const size_t kMaxCallSites = 8;

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

std::string leadingIndent(const std::string& line) {
    return line.substr(0, line.find_first_not_of(" \t"));
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

std::string SymbolExplainer::docOf(const std::string& relPath, const std::string& symbol) const {
    auto it = graph.fileTable.find(relPath);
    if (it == graph.fileTable.end()) return "";
    for (const auto& fn : it->second.functions) {
        if (fn.name == symbol) return fn.doc;
    }
    for (const auto& cls : it->second.classes) {
        if (cls.name == symbol) return cls.doc;
    }
    return "";
}

std::string SymbolExplainer::explain(const std::string& symbol) const {
    GraphQuery query(graph);
    std::vector<SymbolOccurrence> defs = query.definitions(symbol);
    std::vector<GraphQuery::UsageEntry> entries = query.usagesWithContext(tree.root(), symbol);

    std::vector<GraphQuery::UsageEntry> callSites;
    for (const auto& entry : entries) {
        OccurrenceKind kind = entry.occurrence.kind;
        if (kind != OccurrenceKind::Call && kind != OccurrenceKind::Ref) continue;
        if (callSites.size() >= kMaxCallSites) break;
        callSites.push_back(entry);
    }

    if (defs.empty() && entries.empty()) {
        return "Symbol '" + symbol + "' not found in repository.";
    }

    std::string out;
    if (!defs.empty()) {
        out += defs.size() > 1 ? "DEFINITIONS:" : "DEFINITION:";
        for (size_t i = 0; i < defs.size() && i < kMaxDefinitions; ++i) {
            out += "\n  " + defs[i].file + ":" + std::to_string(defs[i].line);
        }

        std::string doc = FileIO::truncateUtf8(docOf(defs[0].file, symbol), 300);
        if (!doc.empty()) out += "\n\nDOCSTRING:\n  " + doc;

        ChunkLoader loader(tree, parsers);
        if (auto source = loader.loadSymbolChunk(defs[0].file, symbol)) {
            out += "\n\nSOURCE PREVIEW:\n" + FileIO::truncateUtf8(*source, 600);
        }
    }

    if (!callSites.empty()) {
        if (!out.empty()) out += "\n\n";
        out += "CALLED / USED IN (" + std::to_string(callSites.size()) + " shown):";
        for (const auto& entry : callSites) {
            out += "\n  " + entry.occurrence.file + ":" + std::to_string(entry.occurrence.line) + "  " +
                   FileIO::truncateUtf8(entry.context, 80);
        }
    }
    if (out.empty()) {
        out = "Symbol '" + symbol + "' appears only as attribute or assignment target (" +
              std::to_string(entries.size()) + " occurrences).";
    }
    return out;
}

std::string SymbolExplainer::summarizeBlock(const std::string& content, int start, int end) {
    std::vector<std::string> all = FileIO::splitLinesKeepEnds(content);
    if (start < 1) start = 1;
    if (end > static_cast<int>(all.size())) end = static_cast<int>(all.size());
    if (start > end) return "";

    std::vector<std::string> lines(all.begin() + (start - 1), all.begin() + end);
    bool blank = true;
    for (const auto& l : lines) {
        if (!FileIO::trim(l).empty()) {
            blank = false;
            break;
        }
    }
    if (blank) return "";

    std::string first = FileIO::trim(lines.front());
    std::string count = std::to_string(lines.size()) + " lines";

    static const std::regex defRe(R"(^(?:async\s+)?(?:def|function)\s+(\w+)\s*\(([^)]*)\))");
    static const std::regex classRe(R"(^class\s+(\w+))");
    std::smatch m;
    if (std::regex_search(first, m, defRe)) {
        return "Function '" + m[1].str() + "' taking (" + m[2].str() + ") - " + count;
    }
    if (std::regex_search(first, m, classRe)) {
        return "Class '" + m[1].str() + "' - " + count;
    }
    if (startsWith(first, "for ") || startsWith(first, "while ") || startsWith(first, "for(") ||
        startsWith(first, "while(")) {
        return "Loop block - " + count;
    }
    if (startsWith(first, "if ") || startsWith(first, "if(")) {
        return "Conditional block - " + count;
    }
    return "Code block - " + count + " starting with: " + FileIO::truncateUtf8(first, 60);
}

std::string SymbolExplainer::insertSummaryComment(const std::string& content, int startLine, const std::string& summary,
                                                  const std::string& commentPrefix) {
    std::vector<std::string> lines = FileIO::splitLinesKeepEnds(content);
    if (startLine < 1 || startLine > static_cast<int>(lines.size())) return content;

    std::string indent = leadingIndent(lines[startLine - 1]);
    lines.insert(lines.begin() + (startLine - 1), indent + commentPrefix + " " + summary + "\n");

    std::string out;
    out.reserve(content.size() + summary.size() + indent.size() + 4);
    for (const auto& l : lines) out += l;
    return out;
}

std::string SymbolExplainer::commentPrefixFor(const std::string& relPath) {
    return endsWith(relPath, ".py") || endsWith(relPath, ".pyi") ? "#" : "//";
}

std::optional<Edit> SymbolExplainer::summaryCommentEdit(const std::string& relPath, const std::string& symbol) const {
    auto table = graph.fileTable.find(relPath);
    if (table == graph.fileTable.end()) return std::nullopt;

    int start = 0, end = 0;
    for (const auto& fn : table->second.functions) {
        if (fn.name == symbol) {
            start = fn.start;
            end = fn.end;
            break;
        }
    }
    for (const auto& cls : table->second.classes) {
        if (start == 0 && cls.name == symbol) {
            start = cls.start;
            end = cls.end;
        }
    }
    for (const auto& var : table->second.variables) {
        if (start == 0 && var.name == symbol) start = end = var.line;
    }
    if (start == 0) return std::nullopt;

    auto content = FileIO::readFile(tree.absolute(relPath));
    if (!content) return std::nullopt;
    std::string summary = summarizeBlock(*content, start, end);
    if (summary.empty()) return std::nullopt;

    // 装饰器属于定义，注释放在它们上面
    int insertLine = start;
    while (insertLine > 1 && startsWith(FileIO::trim(FileIO::lineAt(*content, insertLine - 1)), "@")) --insertLine;

    Edit e;
    e.file = relPath;
    e.line = insertLine;
    e.colStart = 0;
    e.colEnd = 0;
    e.newText = leadingIndent(FileIO::lineAt(*content, start)) + commentPrefixFor(relPath) + " " + summary + "\n";
    e.context = EditApplier::contextLine(*content, insertLine);
    return e;
}
