#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <unistd.h>

#include "analysis/GraphQuery.h"
#include "context/ChunkLoader.h"
#include "context/DocGenerator.h"
#include "context/SymbolExplainer.h"
#include "core/ConfigManager.h"
#include "core/Workspace.h"
#include "refactor/EditApplier.h"
#include "refactor/MutationRequest.h"
#include "refactor/RenameEngine.h"
#include "refactor/SignatureMigrator.h"
#include "tools/CodeIntelTools.h"
#include "tools/ToolRegistry.h"
#include "utils/FileIO.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string RED = "\033[38;5;196m";
const std::string GREEN = "\033[38;5;46m";
const std::string YELLOW = "\033[38;5;226m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";

namespace {

const auto kApprovalTimeout = std::chrono::minutes(5);

struct CliOptions {
    std::string root = ".";
    std::string configPath;
    std::string outDir;
    bool apply = false;
    bool yes = false;
    bool full = false;
    long long budget = -1;
    std::vector<std::string> positional;
};

void printUsage() {
    std::cout << "Usage: codemap [--root DIR] [--config FILE] <command> [args]\n\n"
              << "Commands:\n"
              << "  build [--full]                          Build or refresh the symbol graph\n"
              << "  defs <name>                             Definitions of a symbol\n"
              << "  usages <name>                           All occurrences of a symbol with context\n"
              << "  search <prefix>                         Symbol names starting with prefix\n"
              << "  summary <file>                          Classes / functions / variables in a file\n"
              << "  explain <name>                          Definition, docstring, source and callers\n"
              << "  summarize <file> <start> <end>          One-line description of a line range\n"
              << "  rename <old> <new> [--apply] [--yes]    Rename a symbol across the repository\n"
              << "  signature <func> \"<p1, p2=default>\" [--apply] [--yes]\n"
              << "                                          Migrate call sites to a new parameter list\n"
              << "  context <query> [--budget N]            Relevant code chunks for a query\n"
              << "  load <files> [symbols] [--budget N]     Context from comma-separated files and symbols\n"
              << "  annotate <file> <symbol> [--apply] [--yes]\n"
              << "                                          Insert a summary comment above a declaration\n"
              << "  docs [--out DIR]                        Write Markdown docs (default: <root>/docs)\n"
              << "  patch <file> <patchfile>                Apply SEARCH/REPLACE blocks to a file\n"
              << "  tools                                   List tool schemas\n"
              << "  tool <name> <json>                      Execute a tool with JSON arguments\n\n"
              << "rename, signature and annotate are dry runs unless --apply is given.\n"
              << "Set CODEMAP_DEBUG=1 for debug logging." << std::endl;
}

/** 返回 false 表示参数错误，message 中给出原因 */
bool parseArgs(int argc, char* argv[], CliOptions& opts, std::string& message) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const std::string& flag) -> const char* {
            if (i + 1 >= argc) {
                message = flag + " requires a value";
                return nullptr;
            }
            return argv[++i];
        };
        if (arg == "--root") {
            const char* v = needValue(arg);
            if (!v) return false;
            opts.root = v;
        } else if (arg == "--config") {
            const char* v = needValue(arg);
            if (!v) return false;
            opts.configPath = v;
        } else if (arg == "--out") {
            const char* v = needValue(arg);
            if (!v) return false;
            opts.outDir = v;
        } else if (arg == "--budget") {
            const char* v = needValue(arg);
            if (!v) return false;
            try {
                opts.budget = std::stoll(v);
            } catch (const std::exception&) {
                message = "--budget expects a number, got '" + std::string(v) + "'";
                return false;
            }
            if (opts.budget < 1) {
                message = "--budget must be positive";
                return false;
            }
        } else if (arg == "--apply") {
            opts.apply = true;
        } else if (arg == "--yes" || arg == "-y") {
            opts.yes = true;
        } else if (arg == "--full") {
            opts.full = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.positional = {"help"};
            return true;
        } else {
            opts.positional.push_back(arg);
        }
    }
    return true;
}

bool parseLine(const std::string& text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

void printEdits(const std::vector<Edit>& edits) {
    for (const auto& e : edits) {
        std::cout << CYAN << e.file << ":" << e.line << ":" << (e.colStart + 1) << RESET << "  "
                  << RED << e.oldText << RESET << " -> " << GREEN << e.newText << RESET << "\n"
                  << GRAY << "    " << e.context << RESET << "\n";
    }
}

/** 展示待写入的修改并在 stdin 上等待确认 */
bool confirmMutation(const std::string& description, const std::vector<Edit>& edits) {
    MutationRequest request(description, edits);
    std::cout << YELLOW << BOLD << description << RESET << std::endl;
    std::cout << "Apply these changes? [y/N] " << std::flush;

    MutationRequest::Decision decision = awaitLineAnswer(request, STDIN_FILENO, kApprovalTimeout);

    if (decision == MutationRequest::Decision::Approved) return true;
    if (decision == MutationRequest::Decision::TimedOut) {
        std::cout << "\n" << YELLOW << "No answer, nothing written." << RESET << std::endl;
    } else {
        std::cout << YELLOW << "Cancelled (" << request.rejectReason() << "), nothing written." << RESET << std::endl;
    }
    return false;
}

int reportErrors(const std::vector<std::string>& errors) {
    for (const auto& err : errors) std::cerr << RED << "✖ " << err << RESET << std::endl;
    return errors.empty() ? 0 : 1;
}

int cmdBuild(Workspace& ws, const CliOptions& opts) {
    auto graph = ws.rebuild(!opts.full);
    const auto& stats = ws.lastBuildStats();
    std::cout << "Indexed " << stats.files << " files (" << stats.reindexed << " re-indexed, " << stats.reused
              << " reused, " << stats.skipped << " skipped), " << graph->crossRefs.size() << " symbols" << std::endl;
    return 0;
}

int cmdDefs(Workspace& ws, const std::string& name) {
    auto graph = ws.graph();
    auto defs = GraphQuery(*graph).definitions(name);
    if (defs.empty()) {
        std::cout << "No definition found for '" << name << "'" << std::endl;
        return 1;
    }
    for (const auto& d : defs) std::cout << d.file << ":" << d.line << std::endl;
    return 0;
}

int cmdUsages(Workspace& ws, const std::string& name) {
    auto graph = ws.graph();
    auto entries = GraphQuery(*graph).usagesWithContext(ws.root(), name);
    if (entries.empty()) {
        std::cout << "Symbol '" << name << "' not found" << std::endl;
        return 1;
    }
    for (const auto& entry : entries) {
        std::cout << CYAN << entry.occurrence.file << ":" << entry.occurrence.line << RESET << " "
                  << GRAY << "[" << occurrenceKindName(entry.occurrence.kind) << "]" << RESET << " "
                  << entry.context << std::endl;
    }
    return 0;
}

int cmdSearch(Workspace& ws, const std::string& prefix) {
    auto graph = ws.graph();
    for (const auto& name : GraphQuery(*graph).prefixSearch(prefix)) std::cout << name << std::endl;
    return 0;
}

int cmdSummary(Workspace& ws, const std::string& file) {
    auto graph = ws.graph();
    std::cout << file << ": " << GraphQuery(*graph).fileSummary(file) << std::endl;
    return 0;
}

int cmdExplain(Workspace& ws, const std::string& name) {
    auto graph = ws.graph();
    SymbolExplainer explainer(ws.sourceTree(), ws.parsers(), *graph);
    std::string frame(60, '=');
    std::cout << "\n" << frame << "\n  " << BOLD << name << RESET << "\n" << frame << "\n"
              << explainer.explain(name) << "\n" << std::endl;
    return 0;
}

int cmdSummarize(Workspace& ws, const std::string& file, const std::string& startText, const std::string& endText) {
    int start = 0, end = 0;
    if (!parseLine(startText, start) || !parseLine(endText, end)) {
        std::cerr << RED << "✖ start and end must be line numbers" << RESET << std::endl;
        return 2;
    }
    auto content = FileIO::readFile(ws.sourceTree().absolute(file));
    if (!content) {
        std::cerr << RED << "✖ Cannot read " << file << RESET << std::endl;
        return 1;
    }
    std::string summary = SymbolExplainer::summarizeBlock(*content, start, end);
    std::cout << (summary.empty() ? "(empty block)" : summary) << std::endl;
    return 0;
}

int cmdRename(Workspace& ws, const CliOptions& opts, const std::string& oldName, const std::string& newName) {
    RenameEngine engine(ws.sourceTree(), ws.parsers());
    RenameResult preview = engine.rename(oldName, newName, true);
    printEdits(preview.edits);
    if (!preview.errors.empty()) return reportErrors(preview.errors);

    std::cout << BOLD << preview.edits.size() << " edits" << RESET << std::endl;
    if (!opts.apply || preview.edits.empty()) {
        if (!opts.apply) std::cout << GRAY << "(dry run, pass --apply to write)" << RESET << std::endl;
        return 0;
    }
    if (!opts.yes && !confirmMutation("Rename " + oldName + " -> " + newName, preview.edits)) return 1;

    // 写入的正是用户确认过的 edits；确认期间被改动的文件会因 oldText 不符而报错
    std::vector<std::string> errors = EditApplier::applyBatch(ws.sourceTree(), preview.edits);
    ws.rebuild(true);
    if (errors.empty()) std::cout << GREEN << "✔ Renamed " << preview.edits.size() << " sites" << RESET << std::endl;
    return reportErrors(errors);
}

int cmdSignature(Workspace& ws, const CliOptions& opts, const std::string& function, const std::string& params) {
    std::vector<ParamSpec> specs = SignatureMigrator::parseParamSpecs(params);
    SignatureMigrator migrator(ws.sourceTree(), ws.parsers());
    MigrationResult preview = migrator.migrate(function, specs, true);
    printEdits(preview.edits);
    for (const auto& f : preview.flagged) {
        std::cout << YELLOW << "⚠ " << f.file << ":" << f.line << " " << f.reason << RESET << "\n"
                  << GRAY << "    " << f.context << RESET << "\n";
    }
    if (!preview.errors.empty()) return reportErrors(preview.errors);

    std::cout << BOLD << preview.edits.size() << " call sites, " << preview.flagged.size() << " flagged" << RESET
              << std::endl;
    if (!opts.apply || preview.edits.empty()) {
        if (!opts.apply) std::cout << GRAY << "(dry run, pass --apply to write)" << RESET << std::endl;
        return 0;
    }
    if (!opts.yes && !confirmMutation("Migrate call sites of " + function + "(" + params + ")", preview.edits)) {
        return 1;
    }

    std::vector<std::string> errors = EditApplier::applyBatch(ws.sourceTree(), preview.edits);
    ws.rebuild(true);
    if (errors.empty()) std::cout << GREEN << "✔ Updated " << preview.edits.size() << " call sites" << RESET << std::endl;
    return reportErrors(errors);
}

int cmdContext(Workspace& ws, const CliOptions& opts, const std::string& query) {
    auto graph = ws.graph();
    size_t budget = opts.budget > 0 ? static_cast<size_t>(opts.budget) : ws.config().contextBudget;
    ChunkLoader loader(ws.sourceTree(), ws.parsers(), ws.config().chunkFileLimit);
    std::string text = loader.loadContextForQuery(query, graph.get(), budget);
    if (text.empty()) {
        std::cout << "No relevant code found for: " << query << std::endl;
        return 1;
    }
    std::cout << text << std::endl;
    return 0;
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t comma = text.find(',', pos);
        if (comma == std::string::npos) comma = text.size();
        std::string item = FileIO::trim(text.substr(pos, comma - pos));
        if (!item.empty()) items.push_back(item);
        pos = comma + 1;
    }
    return items;
}

int cmdLoad(Workspace& ws, const CliOptions& opts, const std::vector<std::string>& args) {
    if (args.empty() || args.size() > 2) {
        std::cerr << RED << "✖ 'load' expects <files> [symbols]" << RESET << std::endl;
        return 2;
    }
    size_t budget = opts.budget > 0 ? static_cast<size_t>(opts.budget) : ws.config().contextBudget;
    ChunkLoader loader(ws.sourceTree(), ws.parsers(), ws.config().chunkFileLimit);
    std::string text = loader.loadMultiFileContext(splitList(args[0]),
                                                   args.size() == 2 ? splitList(args[1]) : std::vector<std::string>{},
                                                   budget);
    if (text.empty()) {
        std::cout << "No readable files in: " << args[0] << std::endl;
        return 1;
    }
    std::cout << text << std::endl;
    return 0;
}

int cmdAnnotate(Workspace& ws, const CliOptions& opts, const std::string& file, const std::string& symbol) {
    auto graph = ws.graph();
    SymbolExplainer explainer(ws.sourceTree(), ws.parsers(), *graph);
    std::optional<Edit> edit = explainer.summaryCommentEdit(file, symbol);
    if (!edit) {
        std::cerr << RED << "✖ No declaration of '" << symbol << "' in " << file << RESET << std::endl;
        return 1;
    }
    std::vector<Edit> edits{*edit};
    printEdits(edits);
    if (!opts.apply) {
        std::cout << GRAY << "(dry run, pass --apply to write)" << RESET << std::endl;
        return 0;
    }
    if (!opts.yes && !confirmMutation("Annotate " + symbol + " in " + file, edits)) return 1;

    std::vector<std::string> errors = EditApplier::applyBatch(ws.sourceTree(), edits);
    ws.rebuild(true);
    if (errors.empty()) std::cout << GREEN << "✔ Annotated " << file << ":" << edit->line << RESET << std::endl;
    return reportErrors(errors);
}

int cmdDocs(Workspace& ws, const CliOptions& opts) {
    auto graph = ws.rebuild(true);
    fs::path outDir = opts.outDir.empty() ? ws.sourceTree().root() / "docs" : fs::u8path(opts.outDir);
    DocGenerator::Result result = DocGenerator(ws.sourceTree(), *graph).generate(outDir);
    if (result.errors.empty()) {
        std::cout << GREEN << "✔ Wrote " << result.written << " files to " << outDir.u8string() << RESET << std::endl;
    }
    return reportErrors(result.errors);
}

int printToolResult(const nlohmann::json& result) {
    if (result.contains("error")) {
        std::cerr << RED << "✖ " << result["error"].get<std::string>() << RESET << std::endl;
        return 1;
    }
    std::cout << result.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return 0;
}

int cmdPatch(ToolRegistry& registry, const std::string& file, const std::string& patchFile) {
    auto patch = FileIO::readFile(fs::u8path(patchFile));
    if (!patch) {
        std::cerr << RED << "✖ Cannot read patch file " << patchFile << RESET << std::endl;
        return 1;
    }
    nlohmann::json result = registry.executeTool("apply_patch", {{"path", file}, {"patch", *patch}});
    if (result.contains("error")) return printToolResult(result);
    std::cout << GREEN << "✔ " << result["content"][0]["text"].get<std::string>() << RESET << std::endl;
    return 0;
}

int cmdTool(ToolRegistry& registry, const std::string& name, const std::string& argsText) {
    nlohmann::json args;
    try {
        args = nlohmann::json::parse(argsText);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << RED << "✖ Invalid JSON arguments: " << e.what() << RESET << std::endl;
        return 2;
    }
    return printToolResult(registry.executeTool(name, args));
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    std::string message;
    if (!parseArgs(argc, argv, opts, message)) {
        std::cerr << RED << "✖ " << message << RESET << std::endl;
        printUsage();
        return 2;
    }
    if (opts.positional.empty() || opts.positional[0] == "help") {
        printUsage();
        return opts.positional.empty() ? 2 : 0;
    }

    std::error_code ec;
    fs::path root = fs::absolute(fs::u8path(opts.root), ec);
    if (ec || !fs::is_directory(root, ec)) {
        std::cerr << RED << "✖ Not a directory: " << opts.root << RESET << std::endl;
        return 1;
    }

    Config config;
    try {
        config = opts.configPath.empty() ? Config::loadOrDefault(root.u8string()) : Config::load(opts.configPath);
    } catch (const std::exception& e) {
        std::cerr << RED << "✖ Failed to load config: " << e.what() << RESET << std::endl;
        return 1;
    }

    Logger& logger = Logger::getInstance();
    if (config.debug) logger.setDebugEnabled(true);
    logger.setLogFile(config.logFile);

    Workspace ws(root.u8string(), config);
    ToolRegistry registry;
    registerCodeIntelTools(registry, &ws);

    const std::string& command = opts.positional[0];
    const std::vector<std::string> args(opts.positional.begin() + 1, opts.positional.end());
    auto expect = [&](size_t n) {
        if (args.size() == n) return true;
        std::cerr << RED << "✖ '" << command << "' expects " << n << " argument(s)" << RESET << std::endl;
        printUsage();
        return false;
    };

    if (command == "build") return cmdBuild(ws, opts);
    if (command == "defs") return expect(1) ? cmdDefs(ws, args[0]) : 2;
    if (command == "usages") return expect(1) ? cmdUsages(ws, args[0]) : 2;
    if (command == "search") return expect(1) ? cmdSearch(ws, args[0]) : 2;
    if (command == "summary") return expect(1) ? cmdSummary(ws, args[0]) : 2;
    if (command == "explain") return expect(1) ? cmdExplain(ws, args[0]) : 2;
    if (command == "summarize") return expect(3) ? cmdSummarize(ws, args[0], args[1], args[2]) : 2;
    if (command == "rename") return expect(2) ? cmdRename(ws, opts, args[0], args[1]) : 2;
    if (command == "signature") return expect(2) ? cmdSignature(ws, opts, args[0], args[1]) : 2;
    if (command == "context") return expect(1) ? cmdContext(ws, opts, args[0]) : 2;
    if (command == "load") return cmdLoad(ws, opts, args);
    if (command == "annotate") return expect(2) ? cmdAnnotate(ws, opts, args[0], args[1]) : 2;
    if (command == "docs") return expect(0) ? cmdDocs(ws, opts) : 2;
    if (command == "patch") return expect(2) ? cmdPatch(registry, args[0], args[1]) : 2;
    if (command == "tool") return expect(2) ? cmdTool(registry, args[0], args[1]) : 2;
    if (command == "tools") {
        nlohmann::json list = registry.listToolSchemas();
        std::cout << list.dump(2) << std::endl;
        return 0;
    }

    std::cerr << RED << "✖ Unknown command: " << command << RESET << std::endl;
    printUsage();
    return 2;
}
