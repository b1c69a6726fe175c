#include "CodeIntelTools.h"
#include "ToolRegistry.h"
#include "analysis/GraphQuery.h"
#include "context/ChunkLoader.h"
#include "core/Workspace.h"
#include "refactor/PatchApplier.h"
#include "refactor/RenameEngine.h"
#include "refactor/SignatureMigrator.h"

namespace {

nlohmann::json stringProperty(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

bool requireString(const nlohmann::json& args, const std::string& key, std::string& out) {
    if (!args.contains(key) || !args[key].is_string()) return false;
    out = args[key].get<std::string>();
    return true;
}

/** 只允许根目录内的相对路径 */
bool isSafeRelativePath(const std::string& relPath) {
    if (relPath.empty()) return false;
    fs::path p = fs::u8path(relPath);
    if (p.is_absolute() || p.has_root_name()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

std::string describeEdits(const std::vector<Edit>& edits) {
    std::string text;
    for (const auto& e : edits) {
        text += e.file + ":" + std::to_string(e.line) + "  " + e.oldText + " -> " + e.newText + "\n";
    }
    return text;
}

} // namespace

// ---------------------------------------------------------------- find_symbol

std::string FindSymbolTool::getDescription() const {
    return "Look up a symbol in the repository cross-reference graph. "
           "Returns definitions and usages (call, ref, attr, store) with file, line and source context. "
           "Set prefix=true to list symbol names starting with the given text instead.";
}

nlohmann::json FindSymbolTool::getSchema() const {
    nlohmann::json schema;
    schema["type"] = "object";
    schema["required"] = nlohmann::json::array({"name"});

    nlohmann::json properties;
    properties["name"] = stringProperty("Exact symbol name (case-sensitive), or a prefix when prefix=true");
    properties["kind"] = {
        {"type", "string"},
        {"enum", nlohmann::json::array({"all", "definitions", "usages"})},
        {"description", "Which occurrences to return (default: all)"}
    };
    properties["prefix"] = {{"type", "boolean"}, {"description", "Case-insensitive prefix search over symbol names"}};
    schema["properties"] = properties;
    return schema;
}

nlohmann::json FindSymbolTool::execute(const nlohmann::json& args) {
    std::string name;
    if (!requireString(args, "name", name)) return errorResult("Missing required parameter: name");

    auto graph = workspace->graph();
    GraphQuery query(*graph);

    if (args.value("prefix", false)) {
        std::vector<std::string> names = query.prefixSearch(name);
        std::string text;
        for (const auto& n : names) text += n + "\n";
        if (text.empty()) text = "No symbols start with '" + name + "'";
        return textResult(text, {{"names", names}});
    }

    std::string kind = args.value("kind", std::string("all"));
    if (kind != "all" && kind != "definitions" && kind != "usages") {
        return errorResult("Invalid kind: " + kind);
    }

    nlohmann::json occurrences = nlohmann::json::array();
    std::string text;
    for (const auto& entry : query.usagesWithContext(workspace->root(), name)) {
        bool isDef = entry.occurrence.kind == OccurrenceKind::Definition;
        if ((kind == "definitions" && !isDef) || (kind == "usages" && isDef)) continue;
        nlohmann::json item = entry.occurrence;
        item["context"] = entry.context;
        occurrences.push_back(item);
        text += entry.occurrence.file + ":" + std::to_string(entry.occurrence.line) + " [" +
                occurrenceKindName(entry.occurrence.kind) + "] " + entry.context + "\n";
    }
    if (occurrences.empty()) text = "Symbol '" + name + "' not found";
    return textResult(text, {{"name", name}, {"occurrences", occurrences}});
}

// ---------------------------------------------------------------- file_summary

std::string FileSummaryTool::getDescription() const {
    return "Summarize the classes, functions and variables declared in one source file. "
           "Returns a one-line summary plus the full declaration table.";
}

nlohmann::json FileSummaryTool::getSchema() const {
    nlohmann::json schema;
    schema["type"] = "object";
    schema["required"] = nlohmann::json::array({"path"});
    schema["properties"] = {{"path", stringProperty("File path relative to the repository root")}};
    return schema;
}

nlohmann::json FileSummaryTool::execute(const nlohmann::json& args) {
    std::string path;
    if (!requireString(args, "path", path)) return errorResult("Missing required parameter: path");

    auto graph = workspace->graph();
    GraphQuery query(*graph);
    auto table = query.symbolsInFile(path);
    nlohmann::json data;
    data["path"] = path;
    data["summary"] = query.fileSummary(path);
    if (table) data["table"] = *table;
    return textResult(path + ": " + data["summary"].get<std::string>(), data);
}

// ---------------------------------------------------------------- rename_symbol

std::string RenameSymbolTool::getDescription() const {
    return "Rename a symbol across the whole repository. Python files are renamed token-accurately; "
           "other languages use word-boundary matching. Dry run unless apply=true.";
}

nlohmann::json RenameSymbolTool::getSchema() const {
    nlohmann::json schema;
    schema["type"] = "object";
    schema["required"] = nlohmann::json::array({"old_name", "new_name"});
    nlohmann::json properties;
    properties["old_name"] = stringProperty("Current symbol name");
    properties["new_name"] = stringProperty("New symbol name");
    properties["apply"] = {{"type", "boolean"}, {"description", "Write the changes (default: false, preview only)"}};
    schema["properties"] = properties;
    return schema;
}

nlohmann::json RenameSymbolTool::execute(const nlohmann::json& args) {
    std::string oldName, newName;
    if (!requireString(args, "old_name", oldName) || !requireString(args, "new_name", newName)) {
        return errorResult("Missing required parameters: old_name and new_name");
    }
    bool apply = args.value("apply", false);

    RenameEngine engine(workspace->sourceTree(), workspace->parsers());
    RenameResult result = engine.rename(oldName, newName, !apply);
    if (apply && !result.edits.empty()) workspace->rebuild(true);

    std::string text = std::to_string(result.edits.size()) + " edits" + (result.applied ? " applied" : " (dry run)") +
                       "\n" + describeEdits(result.edits);
    for (const auto& err : result.errors) text += "ERROR: " + err + "\n";
    return textResult(text, result);
}

// ---------------------------------------------------------------- migrate_signature

std::string MigrateSignatureTool::getDescription() const {
    return "Update every call site of a function after its parameter list changed. "
           "params is the new parameter list, e.g. \"name, loud=False\". "
           "Calls with *args/**kwargs or generator arguments are flagged, not rewritten. Dry run unless apply=true.";
}

nlohmann::json MigrateSignatureTool::getSchema() const {
    nlohmann::json schema;
    schema["type"] = "object";
    schema["required"] = nlohmann::json::array({"function", "params"});
    nlohmann::json properties;
    properties["function"] = stringProperty("Function name");
    properties["params"] = {
        {"description", "New parameters: a comma-separated string or an array of \"name\" / \"name=default\""},
        {"oneOf", nlohmann::json::array({
            {{"type", "string"}},
            {{"type", "array"}, {"items", {{"type", "string"}}}}
        })}
    };
    properties["apply"] = {{"type", "boolean"}, {"description", "Write the changes (default: false, preview only)"}};
    schema["properties"] = properties;
    return schema;
}

nlohmann::json MigrateSignatureTool::execute(const nlohmann::json& args) {
    std::string function;
    if (!requireString(args, "function", function)) return errorResult("Missing required parameter: function");
    if (!args.contains("params")) return errorResult("Missing required parameter: params");

    std::vector<ParamSpec> specs;
    const auto& params = args["params"];
    if (params.is_string()) {
        specs = SignatureMigrator::parseParamSpecs(params.get<std::string>());
    } else if (params.is_array()) {
        for (const auto& p : params) {
            if (!p.is_string()) return errorResult("params array must contain strings");
            auto parsed = SignatureMigrator::parseParamSpecs(p.get<std::string>());
            specs.insert(specs.end(), parsed.begin(), parsed.end());
        }
    } else {
        return errorResult("params must be a string or an array of strings");
    }
    bool apply = args.value("apply", false);

    SignatureMigrator migrator(workspace->sourceTree(), workspace->parsers());
    MigrationResult result = migrator.migrate(function, specs, !apply);
    if (apply && !result.edits.empty()) workspace->rebuild(true);

    std::string text = std::to_string(result.edits.size()) + " call sites" +
                       (result.applied ? " updated" : " to update (dry run)") + "\n" + describeEdits(result.edits);
    for (const auto& f : result.flagged) {
        text += "FLAGGED " + f.file + ":" + std::to_string(f.line) + " (" + f.reason + ") " + f.context + "\n";
    }
    for (const auto& err : result.errors) text += "ERROR: " + err + "\n";
    return textResult(text, result);
}

// ---------------------------------------------------------------- relevant_context

std::string RelevantContextTool::getDescription() const {
    return "Return the code chunks (functions, classes, constants) most relevant to a free-text query, "
           "ranked by identifier overlap and limited to a character budget.";
}

nlohmann::json RelevantContextTool::getSchema() const {
    nlohmann::json schema;
    schema["type"] = "object";
    schema["required"] = nlohmann::json::array({"query"});
    nlohmann::json properties;
    properties["query"] = stringProperty("Free-text query, e.g. \"where is the retry backoff computed\"");
    properties["budget"] = {{"type", "integer"}, {"minimum", 1}, {"description", "Character budget"}};
    schema["properties"] = properties;
    return schema;
}

nlohmann::json RelevantContextTool::execute(const nlohmann::json& args) {
    std::string query;
    if (!requireString(args, "query", query)) return errorResult("Missing required parameter: query");
    size_t budget = workspace->config().contextBudget;
    if (args.contains("budget")) {
        if (!args["budget"].is_number_integer() || args["budget"].get<long long>() < 1) {
            return errorResult("budget must be a positive integer");
        }
        budget = static_cast<size_t>(args["budget"].get<long long>());
    }

    auto graph = workspace->graph();
    ChunkLoader loader(workspace->sourceTree(), workspace->parsers(), workspace->config().chunkFileLimit);
    std::vector<Chunk> chunks = loader.relevantChunks(query, graph.get(), budget);
    std::string text = ChunkLoader::formatChunks(chunks);
    if (text.empty()) text = "No relevant code found for: " + query;
    return textResult(text, {{"chunks", chunks}});
}

// ---------------------------------------------------------------- apply_patch

std::string ApplyPatchTool::getDescription() const {
    return "Apply an exact search/replace edit to one file. The search text must appear verbatim "
           "(whitespace included); only the first occurrence is replaced. "
           "Alternatively pass 'patch' containing <<<<<<< SEARCH / ======= / >>>>>>> REPLACE blocks. "
           "No fuzzy matching: regenerate the patch if it does not match.";
}

nlohmann::json ApplyPatchTool::getSchema() const {
    nlohmann::json schema;
    schema["type"] = "object";
    schema["required"] = nlohmann::json::array({"path"});
    nlohmann::json properties;
    properties["path"] = stringProperty("File path relative to the repository root");
    properties["search"] = stringProperty("Exact text to find");
    properties["replace"] = stringProperty("Replacement text");
    properties["patch"] = stringProperty("One or more SEARCH/REPLACE blocks, applied in order");
    schema["properties"] = properties;
    return schema;
}

nlohmann::json ApplyPatchTool::execute(const nlohmann::json& args) {
    std::string path;
    if (!requireString(args, "path", path)) return errorResult("Missing required parameter: path");
    if (!isSafeRelativePath(path)) return errorResult("Path must be relative to the repository root: " + path);

    std::vector<PatchApplier::Block> blocks;
    std::string patchText;
    if (requireString(args, "patch", patchText)) {
        blocks = PatchApplier::parseSearchReplaceBlocks(patchText);
        if (blocks.empty()) return errorResult("No SEARCH/REPLACE blocks found in patch");
    } else {
        std::string search, replace;
        if (!requireString(args, "search", search) || !requireString(args, "replace", replace)) {
            return errorResult("Provide either patch, or search and replace");
        }
        blocks.emplace_back(search, replace);
    }

    if (auto error = PatchApplier::applyPatchToFile(workspace->root(), path, blocks)) return errorResult(*error);
    workspace->rebuild(true);

    return textResult("Applied " + std::to_string(blocks.size()) + " block(s) to " + path,
                      {{"path", path}, {"blocks", blocks.size()}});
}

void registerCodeIntelTools(ToolRegistry& registry, Workspace* workspace) {
    registry.registerTool(std::make_unique<FindSymbolTool>(workspace));
    registry.registerTool(std::make_unique<FileSummaryTool>(workspace));
    registry.registerTool(std::make_unique<RenameSymbolTool>(workspace));
    registry.registerTool(std::make_unique<MigrateSignatureTool>(workspace));
    registry.registerTool(std::make_unique<RelevantContextTool>(workspace));
    registry.registerTool(std::make_unique<ApplyPatchTool>(workspace));
}
