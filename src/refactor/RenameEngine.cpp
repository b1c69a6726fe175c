#include "refactor/RenameEngine.h"
#include "refactor/EditApplier.h"
#include "utils/FileIO.h"
#include "utils/Logger.h"
#include <set>

RenameResult RenameEngine::rename(const std::string& oldName, const std::string& newName, bool dryRun) const {
    RenameResult result;
    result.oldName = oldName;
    result.newName = newName;

    if (!parsers.acceptsIdentifier(oldName) || !parsers.acceptsIdentifier(newName)) {
        result.errors.push_back("Invalid identifier: '" + (parsers.acceptsIdentifier(oldName) ? newName : oldName) + "'");
        return result;
    }
    if (oldName == newName) {
        Logger::getInstance().info("rename: '" + oldName + "' unchanged, nothing to do");
        return result;
    }

    std::set<std::string> touchedFiles;
    for (const auto& relPath : tree.listFiles()) {
        const IParser* parser = parsers.parserFor(relPath);
        if (!parser) continue;

        auto content = FileIO::readFile(tree.absolute(relPath));
        if (!content) {
            Logger::getInstance().debug("rename: skip unreadable " + relPath);
            continue;
        }
        if (content->find(oldName) == std::string::npos) continue;

        std::vector<TokenSpan> spans = parser->renameTokens(*content, oldName);
        if (spans.empty()) continue;
        if (!parser->isValidIdentifier(newName)) {
            result.errors.push_back(relPath + ": '" + newName + "' is not a valid identifier in this language");
            continue;
        }

        std::vector<Edit> fileEdits;
        fileEdits.reserve(spans.size());
        for (const auto& span : spans) {
            Edit e;
            e.file = relPath;
            e.line = span.line;
            e.colStart = span.colStart;
            e.colEnd = span.colEnd;
            e.oldText = oldName;
            e.newText = newName;
            e.context = EditApplier::contextLine(*content, span.line);
            fileEdits.push_back(std::move(e));
        }

        touchedFiles.insert(relPath);
        result.edits.insert(result.edits.end(), fileEdits.begin(), fileEdits.end());
    }

    if (!result.errors.empty()) {
        Logger::getInstance().warn("rename_symbol: " + oldName + " -> " + newName + " rejected, nothing written");
        return result;
    }
    if (!dryRun) result.errors = EditApplier::applyBatch(tree, result.edits);
    result.applied = !dryRun && result.errors.empty();

    Logger::getInstance().info("rename_symbol: " + oldName + " -> " + newName + " | " +
                               std::to_string(result.edits.size()) + " edits across " +
                               std::to_string(touchedFiles.size()) + " files" +
                               (dryRun ? " [DRY RUN]" : " [APPLIED]"));
    return result;
}
