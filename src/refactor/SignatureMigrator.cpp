#include "refactor/SignatureMigrator.h"
#include "refactor/EditApplier.h"
#include "utils/FileIO.h"
#include "utils/Logger.h"
#include <algorithm>
#include <set>

namespace {

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

/** 旧签名中可按位置传入的参数：去掉方法的 self/cls，截止到第一个 * 项 */
std::vector<std::string> positionalParams(const std::vector<std::string>& params, bool isMethod) {
    std::vector<std::string> out;
    for (size_t i = 0; i < params.size(); ++i) {
        const std::string& p = params[i];
        if (i == 0 && isMethod && (p == "self" || p == "cls")) continue;
        if (!p.empty() && p[0] == '*') break;
        out.push_back(p);
    }
    return out;
}

bool isMethodOf(const FileSymbolTable& table, const FunctionDecl& fn) {
    for (const auto& cls : table.classes) {
        if (fn.start < cls.start || fn.start > cls.end) continue;
        if (std::find(cls.methods.begin(), cls.methods.end(), fn.name) != cls.methods.end()) return true;
    }
    return false;
}

/**
 * 一个文件内所有目标调用点的改写。
 * 调用点按参数列表区间组成嵌套树，每个最外层可改写调用生成一条 edit，
 * 内层调用在渲染外层实参时递归改写。
 */
class CallRewriter {
public:
    CallRewriter(const std::string& content, std::vector<CallSite> sites,
                 const std::vector<std::string>& oldPositional, const std::vector<ParamSpec>& newParams)
        : content(content), sites(std::move(sites)), oldPositional(oldPositional), newParams(newParams) {
        std::sort(this->sites.begin(), this->sites.end(), [](const CallSite& a, const CallSite& b) {
            if (a.argsBegin != b.argsBegin) return a.argsBegin < b.argsBegin;
            return a.argsEnd > b.argsEnd;
        });
        buildTree();
        for (auto& site : this->sites) {
            if (!site.lowConfidence && site.positional.size() > oldPositional.size()) {
                site.lowConfidence = true;
                site.reason = "more positional arguments than parameters";
            }
        }
    }

    const std::vector<CallSite>& allSites() const { return sites; }

    /** 可生成 edit 的根：无父节点的调用，低可信度根的子节点依次上提 */
    std::vector<size_t> roots() const {
        std::vector<size_t> out;
        for (size_t i = 0; i < sites.size(); ++i) {
            if (parent[i] == kNone) collectRoots(i, out);
        }
        return out;
    }

    std::string original(size_t i) const {
        return content.substr(sites[i].argsBegin, sites[i].argsEnd - sites[i].argsBegin);
    }

    std::string render(size_t i) const {
        const CallSite& site = sites[i];
        if (site.lowConfidence) return rewriteRange(site.argsBegin, site.argsEnd, i);

        std::vector<std::string> argTexts;
        for (const auto& arg : site.positional) argTexts.push_back(rewriteRange(arg.begin, arg.end, i));
        std::vector<std::pair<std::string, std::string>> keywordArgs;
        for (const auto& kw : site.keywords) keywordArgs.emplace_back(kw.keyword, rewriteRange(kw.begin, kw.end, i));
        return SignatureMigrator::renderArguments(oldPositional, newParams, argTexts, keywordArgs);
    }

private:
    static constexpr size_t kNone = static_cast<size_t>(-1);

    void buildTree() {
        parent.assign(sites.size(), kNone);
        children.assign(sites.size(), {});
        std::vector<size_t> stack;
        for (size_t i = 0; i < sites.size(); ++i) {
            while (!stack.empty() && sites[stack.back()].argsEnd <= sites[i].argsBegin) stack.pop_back();
            if (!stack.empty() && sites[i].argsEnd <= sites[stack.back()].argsEnd) {
                parent[i] = stack.back();
                children[stack.back()].push_back(i);
            }
            stack.push_back(i);
        }
    }

    void collectRoots(size_t i, std::vector<size_t>& out) const {
        if (!sites[i].lowConfidence) {
            out.push_back(i);
            return;
        }
        for (size_t child : children[i]) collectRoots(child, out);
    }

    /** [begin, end) 的原文，其中 owner 的直接子调用替换为改写结果 */
    std::string rewriteRange(size_t begin, size_t end, size_t owner) const {
        std::string out;
        size_t cursor = begin;
        for (size_t child : children[owner]) {
            const CallSite& c = sites[child];
            if (c.argsBegin < begin || c.argsEnd > end) continue;
            out += content.substr(cursor, c.argsBegin - cursor);
            out += render(child);
            cursor = c.argsEnd;
        }
        out += content.substr(cursor, end - cursor);
        return out;
    }

    const std::string& content;
    std::vector<CallSite> sites;
    const std::vector<std::string>& oldPositional;
    const std::vector<ParamSpec>& newParams;
    std::vector<size_t> parent;
    std::vector<std::vector<size_t>> children;
};

} // namespace

std::vector<ParamSpec> SignatureMigrator::parseParamSpecs(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    char quote = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (quote) {
            current += c;
            if (c == '\\' && i + 1 < text.size()) {
                current += text[++i];
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            if (depth > 0) --depth;
        } else if (c == ',' && depth == 0) {
            parts.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    parts.push_back(current);

    std::vector<ParamSpec> specs;
    for (const auto& part : parts) {
        std::string item = FileIO::trim(part);
        if (item.empty()) continue;
        ParamSpec spec;
        size_t eq = item.find('=');
        std::string name = eq == std::string::npos ? item : item.substr(0, eq);
        name = FileIO::trim(name);
        name.erase(0, name.find_first_not_of('*'));
        spec.name = name;
        if (eq != std::string::npos) spec.defaultExpr = FileIO::trim(item.substr(eq + 1));
        if (!spec.name.empty()) specs.push_back(std::move(spec));
    }
    return specs;
}

std::string SignatureMigrator::renderArguments(const std::vector<std::string>& oldPositional,
                                               const std::vector<ParamSpec>& newParams,
                                               const std::vector<std::string>& argTexts,
                                               const std::vector<std::pair<std::string, std::string>>& keywordArgs) {
    std::set<std::string> passedByKeyword;
    for (const auto& kw : keywordArgs) passedByKeyword.insert(kw.first);

    // 第一个已按关键字传入的新参数之后，位置参数不再可用
    size_t cut = newParams.size();
    for (size_t i = 0; i < newParams.size(); ++i) {
        if (passedByKeyword.count(newParams[i].name)) {
            cut = i;
            break;
        }
    }

    auto carried = [&](const std::string& name) -> std::optional<std::string> {
        auto it = std::find(oldPositional.begin(), oldPositional.end(), name);
        if (it == oldPositional.end()) return std::nullopt;
        size_t j = static_cast<size_t>(it - oldPositional.begin());
        if (j >= argTexts.size()) return std::nullopt;
        return argTexts[j];
    };

    std::vector<std::string> out;
    for (size_t i = 0; i < newParams.size(); ++i) {
        const ParamSpec& spec = newParams[i];
        auto value = carried(spec.name);
        if (i < cut) {
            if (value) out.push_back(*value);
            else if (spec.defaultExpr) out.push_back(*spec.defaultExpr);
            else out.push_back("None");
            continue;
        }
        if (passedByKeyword.count(spec.name)) continue;
        if (value) out.push_back(spec.name + "=" + *value);
        else if (!spec.defaultExpr) out.push_back(spec.name + "=None");
    }
    for (const auto& kw : keywordArgs) out.push_back(kw.second);

    return "(" + joinList(out) + ")";
}

std::optional<SignatureMigrator::Definition> SignatureMigrator::findDefinition(const std::string& functionName) const {
    for (const auto& relPath : tree.listFiles()) {
        const IParser* parser = parsers.parserFor(relPath);
        if (!parser) continue;
        auto content = FileIO::readFile(tree.absolute(relPath));
        if (!content || content->find(functionName) == std::string::npos) continue;

        FileSymbolTable table = parser->extractSymbols(*content, relPath);
        for (const auto& fn : table.functions) {
            if (fn.name != functionName) continue;
            Definition def;
            def.file = relPath;
            def.line = fn.start;
            def.params = positionalParams(fn.params, isMethodOf(table, fn));
            return def;
        }
    }
    return std::nullopt;
}

MigrationResult SignatureMigrator::migrate(const std::string& functionName, const std::vector<ParamSpec>& newParams,
                                           bool dryRun) const {
    MigrationResult result;
    result.functionName = functionName;

    auto definition = findDefinition(functionName);
    if (!definition) {
        result.errors.push_back("Could not find definition of '" + functionName + "'");
        Logger::getInstance().warn(result.errors.back());
        return result;
    }
    result.oldParams = definition->params;

    std::vector<std::string> newNames;
    for (const auto& spec : newParams) newNames.push_back(spec.name);
    Logger::getInstance().info("migrate_signature: " + functionName + "(" + joinList(result.oldParams) +
                               ") -> (" + joinList(newNames) + ") [defined in " + definition->file + ":" +
                               std::to_string(definition->line) + "]");

    std::set<std::string> touchedFiles;
    for (const auto& relPath : tree.listFiles()) {
        const IParser* parser = parsers.parserFor(relPath);
        if (!parser) continue;
        auto content = FileIO::readFile(tree.absolute(relPath));
        if (!content) {
            Logger::getInstance().debug("migrate: skip unreadable " + relPath);
            continue;
        }
        if (content->find(functionName) == std::string::npos) continue;

        std::vector<CallSite> sites = parser->callSites(*content, functionName);
        if (sites.empty()) continue;

        CallRewriter rewriter(*content, std::move(sites), result.oldParams, newParams);
        for (const auto& site : rewriter.allSites()) {
            if (!site.lowConfidence) continue;
            result.flagged.push_back({relPath, site.line, site.reason, EditApplier::contextLine(*content, site.line)});
        }

        std::vector<Edit> fileEdits;
        for (size_t root : rewriter.roots()) {
            const CallSite& site = rewriter.allSites()[root];
            Edit e;
            e.file = relPath;
            e.line = site.line;
            e.colStart = site.colStart;
            e.oldText = rewriter.original(root);
            e.newText = rewriter.render(root);
            if (e.newText == e.oldText) continue;
            e.colEnd = e.colStart + static_cast<int>(e.oldText.size());
            e.context = EditApplier::contextLine(*content, site.line);
            fileEdits.push_back(std::move(e));
        }
        if (fileEdits.empty()) continue;

        touchedFiles.insert(relPath);
        result.edits.insert(result.edits.end(), fileEdits.begin(), fileEdits.end());
    }

    if (!dryRun) result.errors = EditApplier::applyBatch(tree, result.edits);
    result.applied = !dryRun && result.errors.empty();

    Logger::getInstance().info("migrate_signature: " + functionName + " | " + std::to_string(result.edits.size()) +
                               " call sites updated in " + std::to_string(touchedFiles.size()) + " files, " +
                               std::to_string(result.flagged.size()) + " flagged" +
                               (dryRun ? " [DRY RUN]" : " [APPLIED]"));
    return result;
}
