#include "analysis/SymbolGraph.h"
#include "core/ConfigManager.h"
#include "utils/FileIO.h"
#include "utils/Logger.h"
#include <chrono>
#include <sstream>
#include <nlohmann/json.hpp>

GraphBuilder::GraphBuilder(const SourceTree& tree, const ParserRegistry& parsers, size_t minSymbolLength)
    : tree(tree), parsers(parsers), minSymbolLength(minSymbolLength) {}

fs::path GraphBuilder::graphPath() const {
    return tree.root() / Config::kDataDir / kGraphFile;
}

CrossRefGraph GraphBuilder::build(bool incremental) {
    auto& logger = Logger::getInstance();
    auto t0 = std::chrono::steady_clock::now();
    stats = BuildStats{};

    std::optional<CrossRefGraph> previous;
    if (incremental) previous = load();

    CrossRefGraph graph;
    for (const auto& relPath : tree.listFiles()) {
        const IParser* parser = parsers.parserFor(relPath);
        if (!parser) continue;

        auto content = FileIO::readFile(tree.absolute(relPath));
        if (!content) {
            logger.debug("Skipping unreadable file: " + relPath);
            stats.skipped++;
            continue;
        }
        stats.files++;

        std::string hash = FileIO::contentHash(*content);
        bool reused = false;
        if (previous) {
            // 增量：哈希未变且有缓存的声明表则直接复用
            auto itHash = previous->fileHash.find(relPath);
            auto itTable = previous->fileTable.find(relPath);
            if (itHash != previous->fileHash.end() && itTable != previous->fileTable.end() &&
                itHash->second == hash) {
                graph.fileTable[relPath] = std::move(itTable->second);
                reused = true;
                stats.reused++;
            }
        }
        if (!reused) {
            graph.fileTable[relPath] = parser->extractSymbols(*content, relPath);
            stats.reindexed++;
        }
        graph.fileHash[relPath] = hash;

        // 出现列表不缓存，每次都重新扫描
        for (auto& occ : parser->scanOccurrences(*content, relPath)) {
            if (occ.name.size() < minSymbolLength) continue;
            occ.file = relPath;
            graph.crossRefs[occ.name].push_back(std::move(occ));
        }
    }
    stats.symbols = graph.crossRefs.size();

    std::string error;
    if (!save(graph, &error)) {
        logger.warn("Cross-reference graph not persisted: " + error);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0);
    std::ostringstream msg;
    msg << "Cross-reference graph ready: " << graph.fileTable.size() << " files, "
        << stats.symbols << " symbols (" << stats.reindexed << " re-indexed, "
        << stats.reused << " reused, " << elapsed.count() << " ms)";
    logger.success(msg.str());
    return graph;
}

std::optional<CrossRefGraph> GraphBuilder::load() const {
    fs::path path = graphPath();
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;

    auto content = FileIO::readFile(path);
    if (!content) {
        Logger::getInstance().debug("Cannot read " + path.u8string());
        return std::nullopt;
    }
    try {
        nlohmann::json j = nlohmann::json::parse(*content);
        if (j.value("schema_version", -1) != kGraphSchemaVersion) {
            Logger::getInstance().debug("Graph schema mismatch, rebuilding from scratch");
            return std::nullopt;
        }
        return graphFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        Logger::getInstance().warn("Discarding corrupt graph " + path.u8string() + ": " + e.what());
        return std::nullopt;
    }
}

bool GraphBuilder::save(const CrossRefGraph& graph, std::string* error) const {
    fs::path path = graphPath();
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        if (error) *error = "cannot create " + path.parent_path().u8string() + ": " + ec.message();
        return false;
    }

    std::string text;
    try {
        text = graphToJson(graph).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    } catch (const nlohmann::json::exception& e) {
        if (error) *error = e.what();
        return false;
    }
    std::string writeError;
    if (!FileIO::writeFile(path, text + "\n", &writeError)) {
        if (error) *error = path.u8string() + ": " + writeError;
        return false;
    }
    return true;
}
