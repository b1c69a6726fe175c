#include "analysis/GraphQuery.h"
#include "utils/FileIO.h"
#include <algorithm>
#include <cctype>
#include <map>

namespace {
std::string toLowerStr(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <typename T, typename NameOf>
std::string joinNames(const std::vector<T>& items, size_t limit, NameOf nameOf) {
    std::string out;
    for (size_t i = 0; i < items.size() && i < limit; ++i) {
        if (!out.empty()) out += ", ";
        out += nameOf(items[i]);
    }
    return out;
}
} // namespace

std::vector<SymbolOccurrence> GraphQuery::query(const std::string& name) const {
    auto it = graph.crossRefs.find(name);
    if (it == graph.crossRefs.end()) return {};
    return it->second;
}

std::vector<SymbolOccurrence> GraphQuery::definitions(const std::string& name) const {
    std::vector<SymbolOccurrence> out;
    for (const auto& occ : query(name)) {
        if (occ.kind == OccurrenceKind::Definition) out.push_back(occ);
    }
    return out;
}

std::vector<SymbolOccurrence> GraphQuery::usages(const std::string& name) const {
    std::vector<SymbolOccurrence> out;
    for (const auto& occ : query(name)) {
        if (occ.kind != OccurrenceKind::Definition) out.push_back(occ);
    }
    return out;
}

std::vector<std::string> GraphQuery::prefixSearch(const std::string& prefix) const {
    std::string p = toLowerStr(prefix);
    std::vector<std::string> names;
    for (const auto& [name, _] : graph.crossRefs) {
        if (toLowerStr(name).rfind(p, 0) == 0) names.push_back(name);
    }
    return names;
}

std::optional<FileSymbolTable> GraphQuery::symbolsInFile(const std::string& relPath) const {
    auto it = graph.fileTable.find(relPath);
    if (it == graph.fileTable.end()) return std::nullopt;
    return it->second;
}

std::string GraphQuery::fileSummary(const std::string& relPath) const {
    auto table = symbolsInFile(relPath);
    if (!table) return "(empty)";

    std::vector<std::string> parts;
    std::string classes = joinNames(table->classes, 4, [](const ClassDecl& c) { return c.name; });
    std::string functions = joinNames(table->functions, 8, [](const FunctionDecl& f) { return f.name; });
    std::string vars = joinNames(table->variables, 6, [](const VariableDecl& v) { return v.name; });
    if (!classes.empty()) parts.push_back("classes: " + classes);
    if (!functions.empty()) parts.push_back("functions: " + functions);
    if (!vars.empty()) parts.push_back("vars: " + vars);
    if (parts.empty()) return "(empty)";

    std::string summary;
    for (const auto& part : parts) {
        if (!summary.empty()) summary += " | ";
        summary += part;
    }
    return summary;
}

std::vector<GraphQuery::UsageEntry> GraphQuery::usagesWithContext(const fs::path& root, const std::string& name) const {
    std::vector<UsageEntry> entries;
    std::map<std::string, std::optional<std::string>> cache;
    for (const auto& occ : query(name)) {
        auto it = cache.find(occ.file);
        if (it == cache.end()) {
            it = cache.emplace(occ.file, FileIO::readFile(root / fs::u8path(occ.file))).first;
        }
        std::string context = it->second ? FileIO::trim(FileIO::lineAt(*it->second, occ.line)) : "";
        entries.push_back({occ, context});
    }
    return entries;
}
