#include "context/ChunkLoader.h"
#include "utils/FileIO.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <set>

namespace {
std::string toLowerStr(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void addUnique(std::vector<std::string>& files, const std::string& file) {
    if (std::find(files.begin(), files.end(), file) == files.end()) files.push_back(file);
}

const size_t kMaxOutlineEntries = 20;

bool isMethod(const FileSymbolTable& table, const FunctionDecl& fn) {
    return std::any_of(table.classes.begin(), table.classes.end(), [&](const ClassDecl& cls) {
        return fn.start > cls.start && fn.start <= cls.end &&
               std::find(cls.methods.begin(), cls.methods.end(), fn.name) != cls.methods.end();
    });
}

/** 顶层函数与类的签名，按行号排序 */
std::string outlineOf(const FileSymbolTable& table, bool python) {
    std::vector<std::pair<int, std::string>> entries;
    for (const auto& fn : table.functions) {
        if (isMethod(table, fn)) continue;
        std::string params;
        for (const auto& p : fn.params) params += (params.empty() ? "" : ", ") + p;
        entries.emplace_back(fn.start, python ? "def " + fn.name + "(" + params + "): ..."
                                              : "function " + fn.name + "(" + params + ")");
    }
    for (const auto& cls : table.classes) {
        entries.emplace_back(cls.start, python ? "class " + cls.name + ": ..." : "class " + cls.name);
    }
    std::stable_sort(entries.begin(), entries.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::string out;
    for (size_t i = 0; i < entries.size() && i < kMaxOutlineEntries; ++i) out += entries[i].second + "\n";
    return out;
}
} // namespace

std::vector<std::string> ChunkLoader::tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isalpha(c) || c >= 0x80) {
            ++i;
            continue;
        }
        size_t start = i;
        while (i < text.size()) {
            unsigned char d = static_cast<unsigned char>(text[i]);
            if (d >= 0x80 || !(std::isalnum(d) || d == '_')) break;
            ++i;
        }
        if (i - start > 1) tokens.push_back(toLowerStr(text.substr(start, i - start)));
    }
    return tokens;
}

double ChunkLoader::scoreChunk(const Chunk& chunk, const std::vector<std::string>& queryTokens) {
    std::string text = chunk.symbol + " " + chunk.doc + " " + FileIO::truncateUtf8(chunk.source, 400);
    std::vector<std::string> chunkList = tokenize(text);
    std::set<std::string> chunkTokens(chunkList.begin(), chunkList.end());
    std::set<std::string> querySet(queryTokens.begin(), queryTokens.end());
    if (chunkTokens.empty() || querySet.empty()) return 0.0;

    size_t overlap = 0;
    for (const auto& t : querySet) {
        if (chunkTokens.count(t)) ++overlap;
    }

    std::string symbol = toLowerStr(chunk.symbol);
    size_t dot = symbol.rfind('.');
    std::string tail = dot == std::string::npos ? symbol : symbol.substr(dot + 1);
    double bonus = (querySet.count(symbol) || querySet.count(tail)) ? kExactBonus : 0.0;

    return static_cast<double>(overlap) / static_cast<double>(querySet.size()) + bonus;
}

std::vector<Chunk> ChunkLoader::selectWithinBudget(std::vector<Chunk> chunks, size_t budget) {
    chunks.erase(std::remove_if(chunks.begin(), chunks.end(), [](const Chunk& c) { return c.score <= 0.0; }),
                 chunks.end());
    std::stable_sort(chunks.begin(), chunks.end(), [](const Chunk& a, const Chunk& b) { return a.score > b.score; });

    std::vector<Chunk> selected;
    size_t total = 0;
    for (auto& chunk : chunks) {
        size_t size = chunk.source.size();
        if (!selected.empty() && total + size > budget) break;
        total += size;
        selected.push_back(std::move(chunk));
    }
    return selected;
}

std::vector<std::string> ChunkLoader::candidateFiles(const std::vector<std::string>& queryTokens,
                                                     const CrossRefGraph* graph) const {
    std::vector<std::string> files;
    if (graph) {
        for (const auto& tok : queryTokens) {
            auto exact = graph->crossRefs.find(tok);
            if (exact != graph->crossRefs.end()) {
                for (size_t i = 0; i < exact->second.size() && i < 5; ++i) addUnique(files, exact->second[i].file);
            }
            for (const auto& [name, occurrences] : graph->crossRefs) {
                if (toLowerStr(name).rfind(tok, 0) != 0) continue;
                for (size_t i = 0; i < occurrences.size() && i < 2; ++i) addUnique(files, occurrences[i].file);
            }
        }
    }
    if (files.empty()) files = tree.listFiles();
    if (files.size() > fileLimit) files.resize(fileLimit);
    return files;
}

std::vector<Chunk> ChunkLoader::relevantChunks(const std::string& query, const CrossRefGraph* graph,
                                               size_t budget) const {
    std::vector<std::string> queryTokens = tokenize(query);
    if (queryTokens.empty()) return {};

    std::vector<Chunk> all;
    for (const auto& relPath : candidateFiles(queryTokens, graph)) {
        const IParser* parser = parsers.parserFor(relPath);
        if (!parser) continue;
        auto content = FileIO::readFile(tree.absolute(relPath));
        if (!content) {
            Logger::getInstance().debug("chunk loader: skip unreadable " + relPath);
            continue;
        }
        std::vector<Chunk> chunks = parser->extractChunks(*content, relPath);
        all.insert(all.end(), std::make_move_iterator(chunks.begin()), std::make_move_iterator(chunks.end()));
    }

    for (auto& chunk : all) chunk.score = scoreChunk(chunk, queryTokens);
    std::vector<Chunk> selected = selectWithinBudget(std::move(all), budget);
    Logger::getInstance().debug("chunk loader: '" + query + "' -> " + std::to_string(selected.size()) + " chunks");
    return selected;
}

std::string ChunkLoader::loadContextForQuery(const std::string& query, const CrossRefGraph* graph,
                                             size_t budget) const {
    return formatChunks(relevantChunks(query, graph, budget));
}

std::string ChunkLoader::formatChunks(const std::vector<Chunk>& chunks) {
    if (chunks.empty()) return "";

    std::string out = "[RELEVANT CODE CHUNKS]";
    for (const auto& chunk : chunks) {
        out += "\n\n# " + chunk.file + "::" + chunk.symbol + " (L" + std::to_string(chunk.startLine) + "-" +
               std::to_string(chunk.endLine) + ")";
        out += "\n" + FileIO::truncateUtf8(chunk.source, 500);
    }
    out += "\n[/RELEVANT CODE CHUNKS]";
    return out;
}

std::optional<std::string> ChunkLoader::loadSymbolChunk(const std::string& relPath, const std::string& symbol) const {
    auto content = FileIO::readFile(tree.absolute(relPath));
    if (!content || symbol.empty()) return std::nullopt;

    if (const IParser* parser = parsers.parserFor(relPath)) {
        if (auto block = parser->definitionBlock(*content, symbol)) return block;
    }

    // 定义块找不到时取首次出现行的前 3 行到后 20 行
    std::vector<std::string> lines = FileIO::splitLinesKeepEnds(*content);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].find(symbol) == std::string::npos) continue;
        size_t begin = i >= 3 ? i - 3 : 0;
        size_t end = std::min(lines.size(), i + 20);
        std::string window;
        for (size_t k = begin; k < end; ++k) window += lines[k];
        return window;
    }
    return std::nullopt;
}

std::string ChunkLoader::loadMultiFileContext(const std::vector<std::string>& files,
                                              const std::vector<std::string>& symbols, size_t budget) const {
    std::string out;
    size_t used = 0;
    for (const auto& relPath : files) {
        auto content = FileIO::readFile(tree.absolute(relPath));
        if (!content) {
            Logger::getInstance().debug("multi-file context: skip unreadable " + relPath);
            continue;
        }

        std::string section = "### " + relPath + "\n";
        if (!symbols.empty()) {
            for (const auto& symbol : symbols) {
                auto chunk = loadSymbolChunk(relPath, symbol);
                if (!chunk) continue;
                section += "```\n# " + symbol + "\n" + FileIO::rtrim(FileIO::truncateUtf8(*chunk, 600)) + "\n```\n";
            }
        } else if (const IParser* parser = parsers.parserFor(relPath)) {
            std::string outline = outlineOf(parser->extractSymbols(*content, relPath), parser->supportsExtension(".py"));
            if (!outline.empty()) section += "```\n" + outline + "```\n";
        } else {
            section += FileIO::truncateUtf8(*content, 300) + "\n";
        }

        out += section;
        used += section.size();
        if (used >= budget) {
            out += "[budget exceeded]\n";
            break;
        }
    }
    return out;
}
