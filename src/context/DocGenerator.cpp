#include "context/DocGenerator.h"
#include "utils/FileIO.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <system_error>

namespace {
const size_t kMaxImportLines = 20;
const size_t kMaxDependencyLinks = 15;
const size_t kMaxImportedByLinks = 10;
const size_t kMaxMethodsListed = 10;
const size_t kMaxConstants = 20;
const size_t kMaxGraphSources = 20;
const size_t kMaxGraphEdgesPerSource = 5;
const size_t kMaxDocBytes = 200;
const size_t kMaxSummaryBytes = 80;

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isPythonFile(const std::string& relPath) {
    return endsWith(relPath, ".py") || endsWith(relPath, ".pyi");
}

// 至少一个字母且没有小写字母：MAX_SIZE、API_V2
bool isConstantName(const std::string& name) {
    bool hasAlpha = false;
    for (unsigned char c : name) {
        if (std::islower(c)) return false;
        if (std::isalpha(c)) hasAlpha = true;
    }
    return hasAlpha;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

// mermaid 节点名只保留字母数字
std::string nodeId(const std::string& relPath) {
    std::string id = relPath;
    for (char& c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c))) c = '_';
    }
    return id;
}

std::string describeImport(const ImportDecl& imp) {
    std::string text;
    if (imp.kind == "from") {
        text = "from " + imp.source + " import " + imp.name;
    } else if (imp.kind == "import") {
        text = "import " + imp.name;
    } else {
        return imp.kind + "(" + imp.source + ")";
    }
    if (!imp.alias.empty()) text += " as " + imp.alias;
    return text;
}

std::string moduleLink(const std::string& relPath, const std::string& dir) {
    return "[`" + relPath + "`](" + dir + DocGenerator::moduleDocName(relPath) + ")";
}
} // namespace

std::string DocGenerator::moduleDocName(const std::string& relPath) {
    std::string name = relPath;
    std::replace(name.begin(), name.end(), '/', '_');
    std::replace(name.begin(), name.end(), '\\', '_');
    if (endsWith(name, ".py")) name.resize(name.size() - 3);
    return name + ".md";
}

std::string DocGenerator::resolveModule(const std::string& module, const std::string& fromFile) const {
    size_t dots = module.find_first_not_of('.');
    if (dots == std::string::npos) return "";

    fs::path base;
    if (dots > 0) {
        // 相对导入：一个点是当前包，每多一个点上移一级
        base = fs::u8path(fromFile).parent_path();
        for (size_t i = 1; i < dots; ++i) base = base.parent_path();
    }
    std::string rest = module.substr(dots);
    std::replace(rest.begin(), rest.end(), '.', '/');
    fs::path stem = base / fs::u8path(rest);

    for (const std::string& candidate : {stem.generic_u8string() + ".py",
                                         (stem / "__init__.py").generic_u8string()}) {
        if (graph.fileTable.count(candidate)) return candidate;
    }
    return "";
}

DocGenerator::Dependencies DocGenerator::dependencies() const {
    Dependencies deps;
    for (const auto& entry : graph.fileTable) {
        const std::string& file = entry.first;
        if (!isPythonFile(file)) continue;

        std::vector<std::string> targets;
        for (const auto& imp : entry.second.imports) {
            std::string module;
            if (imp.kind == "from") module = imp.source;
            else if (imp.kind == "import") module = imp.name;
            std::string target = resolveModule(module, file);
            if (target.empty() || target == file) continue;
            if (std::find(targets.begin(), targets.end(), target) == targets.end()) targets.push_back(target);
        }
        if (targets.empty()) continue;

        for (const auto& target : targets) deps.importedBy[target].push_back(file);
        deps.imports[file] = std::move(targets);
    }
    return deps;
}

std::string DocGenerator::moduleDoc(const std::string& relPath, const Dependencies& deps) const {
    static const FileSymbolTable kEmpty;
    auto it = graph.fileTable.find(relPath);
    const FileSymbolTable& table = it == graph.fileTable.end() ? kEmpty : it->second;
    bool python = isPythonFile(relPath);

    size_t lineCount = 0;
    if (auto content = FileIO::readFile(tree.absolute(relPath))) {
        lineCount = FileIO::splitLinesKeepEnds(*content).size();
    }

    std::string md = "# `" + relPath + "`\n";
    md += "\n## Stats\n\n| Metric | Count |\n|--------|-------|\n";
    md += "| Lines | " + std::to_string(lineCount) + " |\n";
    md += "| Functions | " + std::to_string(table.functions.size()) + " |\n";
    md += "| Classes | " + std::to_string(table.classes.size()) + " |\n";
    md += "| Variables | " + std::to_string(table.variables.size()) + " |\n";
    md += "| Imports | " + std::to_string(table.imports.size()) + " |\n";

    if (!table.imports.empty()) {
        md += "\n## Imports\n\n";
        for (size_t i = 0; i < table.imports.size() && i < kMaxImportLines; ++i) {
            md += "- `" + describeImport(table.imports[i]) + "`\n";
        }
    }

    auto forward = deps.imports.find(relPath);
    if (forward != deps.imports.end()) {
        md += "\n## Dependencies (imports)\n\n";
        for (size_t i = 0; i < forward->second.size() && i < kMaxDependencyLinks; ++i) {
            md += "- " + moduleLink(forward->second[i], "") + "\n";
        }
    }

    auto reverse = deps.importedBy.find(relPath);
    if (reverse != deps.importedBy.end()) {
        md += "\n## Imported by\n\n";
        for (size_t i = 0; i < reverse->second.size() && i < kMaxImportedByLinks; ++i) {
            md += "- " + moduleLink(reverse->second[i], "") + "\n";
        }
    }

    if (!table.classes.empty()) {
        md += "\n## Classes\n";
        for (const auto& cls : table.classes) {
            md += "\n### `class " + cls.name;
            if (!cls.bases.empty()) md += "(" + join(cls.bases, ", ") + ")";
            md += "`\n\n- **Lines:** " + std::to_string(cls.start) + "-" + std::to_string(cls.end) + "\n";
            if (!cls.methods.empty()) {
                std::vector<std::string> shown(cls.methods.begin(),
                                               cls.methods.begin() + std::min(cls.methods.size(), kMaxMethodsListed));
                md += "- **Methods:** " + join(shown, ", ") + "\n";
            }
            if (!cls.doc.empty()) md += "\n" + FileIO::truncateUtf8(cls.doc, kMaxDocBytes) + "\n";
        }
    }

    if (!table.functions.empty()) {
        md += "\n## Functions\n";
        for (const auto& fn : table.functions) {
            md += "\n### `" + std::string(python ? "def " : "function ") + fn.name + "(" + join(fn.params, ", ") + ")`";
            for (const auto& deco : fn.decorators) md += " `@" + deco + "`";
            md += "\n\n- **Lines:** " + std::to_string(fn.start) + "-" + std::to_string(fn.end) + "\n";
            if (fn.isAsync) md += "- **Async:** yes\n";
            if (!fn.doc.empty()) md += "\n" + FileIO::truncateUtf8(fn.doc, kMaxDocBytes) + "\n";
        }
    }

    std::vector<const VariableDecl*> constants;
    for (const auto& var : table.variables) {
        if (isConstantName(var.name)) constants.push_back(&var);
    }
    if (!constants.empty()) {
        md += "\n## Constants\n\n";
        for (size_t i = 0; i < constants.size() && i < kMaxConstants; ++i) {
            md += "- `" + constants[i]->name + "` = `" + constants[i]->value + "` (line " +
                  std::to_string(constants[i]->line) + ")\n";
        }
    }
    return md;
}

std::string DocGenerator::readme(const Dependencies& deps) const {
    std::string md = "# Repository Documentation\n\n> " + std::to_string(graph.fileTable.size()) +
                     " indexed files\n\n## Module Index\n\n| Module | Summary |\n|--------|---------|\n";
    for (const auto& entry : graph.fileTable) {
        std::vector<std::string> names;
        for (size_t i = 0; i < entry.second.classes.size() && i < 3; ++i) names.push_back(entry.second.classes[i].name);
        for (size_t i = 0; i < entry.second.functions.size() && i < 5; ++i) names.push_back(entry.second.functions[i].name);
        std::string summary = names.empty() ? "(no declarations)" : FileIO::truncateUtf8(join(names, ", "), kMaxSummaryBytes);
        md += "| " + moduleLink(entry.first, "modules/") + " | " + summary + " |\n";
    }

    if (!deps.imports.empty()) {
        md += "\n## Dependency Graph\n\n```mermaid\ngraph TD\n";
        size_t sources = 0;
        for (const auto& edge : deps.imports) {
            if (sources++ >= kMaxGraphSources) break;
            for (size_t i = 0; i < edge.second.size() && i < kMaxGraphEdgesPerSource; ++i) {
                md += "  " + nodeId(edge.first) + " --> " + nodeId(edge.second[i]) + "\n";
            }
        }
        md += "```\n";
    }
    return md;
}

std::string DocGenerator::symbolReference() const {
    struct Row {
        std::string name;
        size_t definitions;
        size_t references;
        size_t files;
    };
    std::vector<Row> rows;
    for (const auto& entry : graph.crossRefs) {
        if (entry.first.size() <= 2) continue;
        std::set<std::string> files;
        size_t definitions = 0;
        for (const auto& occ : entry.second) {
            files.insert(occ.file);
            if (occ.kind == OccurrenceKind::Definition) ++definitions;
        }
        if (files.size() < 2) continue;
        rows.push_back({entry.first, definitions, entry.second.size() - definitions, files.size()});
    }

    std::string md = "# Symbol Cross-Reference\n\n> " + std::to_string(rows.size()) +
                     " symbols used across multiple files\n\n"
                     "| Symbol | Definitions | References | Files |\n"
                     "|--------|-------------|------------|-------|\n";
    for (size_t i = 0; i < rows.size() && i < kMaxSymbolRows; ++i) {
        md += "| `" + rows[i].name + "` | " + std::to_string(rows[i].definitions) + " | " +
              std::to_string(rows[i].references) + " | " + std::to_string(rows[i].files) + " |\n";
    }
    return md;
}

std::string DocGenerator::callGraph() const {
    std::vector<std::pair<std::string, size_t>> counts;
    for (const auto& entry : graph.crossRefs) {
        size_t calls = std::count_if(entry.second.begin(), entry.second.end(),
                                     [](const SymbolOccurrence& o) { return o.kind == OccurrenceKind::Call; });
        if (calls > 0) counts.emplace_back(entry.first, calls);
    }
    // 同次数按名字排序（map 顺序）
    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::string md = "# Call Relationships\n";
    if (counts.empty()) return md + "\nNo calls recorded.\n";
    md += "\n## Most Called Symbols\n\n| Symbol | Call Count |\n|--------|------------|\n";
    for (size_t i = 0; i < counts.size() && i < kMaxCallRows; ++i) {
        md += "| `" + counts[i].first + "` | " + std::to_string(counts[i].second) + " |\n";
    }
    return md;
}

DocGenerator::Result DocGenerator::generate(const fs::path& outputDir) const {
    Logger& logger = Logger::getInstance();
    Result result;
    result.outputDir = outputDir;

    std::error_code ec;
    fs::create_directories(outputDir / "modules", ec);
    if (ec) {
        result.errors.push_back("Cannot create " + (outputDir / "modules").u8string() + ": " + ec.message());
        logger.error(result.errors.back());
        return result;
    }

    auto emit = [&](const fs::path& path, const std::string& text) {
        std::string error;
        if (FileIO::writeFile(path, text, &error)) {
            ++result.written;
            logger.debug("Generated " + path.u8string());
        } else {
            result.errors.push_back(path.u8string() + ": " + error);
            logger.warn("docs: " + result.errors.back());
        }
    };

    Dependencies deps = dependencies();
    for (const auto& entry : graph.fileTable) {
        emit(outputDir / "modules" / moduleDocName(entry.first), moduleDoc(entry.first, deps));
    }
    emit(outputDir / "README.md", readme(deps));
    emit(outputDir / "symbols.md", symbolReference());
    emit(outputDir / "call_graph.md", callGraph());

    if (result.errors.empty()) {
        logger.success("Docs generated: " + std::to_string(result.written) + " files -> " + outputDir.u8string());
    }
    return result;
}
