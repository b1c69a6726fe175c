#include "refactor/EditApplier.h"
#include "utils/FileIO.h"
#include "utils/Logger.h"
#include <algorithm>
#include <map>

namespace EditApplier {

bool applyToContent(std::string& content, std::vector<Edit> edits, std::string* error) {
    std::vector<size_t> offsets = FileIO::lineOffsets(content);

    struct Located {
        size_t begin;
        size_t end;
        const Edit* edit;
    };
    std::vector<Located> located;
    located.reserve(edits.size());
    for (const auto& e : edits) {
        if (e.line < 1 || static_cast<size_t>(e.line) > offsets.size() || e.colStart < 0 || e.colEnd < e.colStart) {
            if (error) *error = "edit location out of range at line " + std::to_string(e.line);
            return false;
        }
        size_t begin = offsets[e.line - 1] + static_cast<size_t>(e.colStart);
        size_t length = static_cast<size_t>(e.colEnd - e.colStart);
        if (length != e.oldText.size() || begin + length > content.size() ||
            content.compare(begin, length, e.oldText) != 0) {
            if (error) *error = "source changed at line " + std::to_string(e.line) + ", expected '" + e.oldText + "'";
            return false;
        }
        located.push_back({begin, begin + length, &e});
    }

    std::sort(located.begin(), located.end(), [](const Located& a, const Located& b) {
        return a.begin > b.begin;
    });
    for (size_t i = 1; i < located.size(); ++i) {
        if (located[i].end > located[i - 1].begin) {
            if (error) *error = "overlapping edits at line " + std::to_string(located[i].edit->line);
            return false;
        }
    }

    std::string result = content;
    for (const auto& l : located) {
        result.replace(l.begin, l.end - l.begin, l.edit->newText);
    }
    content = std::move(result);
    return true;
}

bool applyToFile(const SourceTree& tree, const std::string& relPath, const std::vector<Edit>& edits, std::string* error) {
    auto content = FileIO::readFile(tree.absolute(relPath));
    if (!content) {
        if (error) *error = "cannot read file";
        return false;
    }
    std::string updated = *content;
    if (!applyToContent(updated, edits, error)) return false;
    if (updated == *content) return true;
    return FileIO::writeFile(tree.absolute(relPath), updated, error);
}

std::vector<std::string> applyBatch(const SourceTree& tree, const std::vector<Edit>& edits) {
    std::map<std::string, std::vector<Edit>> byFile;
    for (const auto& e : edits) byFile[e.file].push_back(e);

    std::vector<std::string> errors;
    for (const auto& [file, fileEdits] : byFile) {
        std::string error;
        if (!applyToFile(tree, file, fileEdits, &error)) {
            errors.push_back(file + ": " + error);
            Logger::getInstance().error("Failed to update " + file + ": " + error);
            continue;
        }
        Logger::getInstance().debug("Updated " + file + " (" + std::to_string(fileEdits.size()) + " edits)");
    }
    return errors;
}

std::string contextLine(const std::string& content, int line) {
    return FileIO::truncateUtf8(FileIO::rtrim(FileIO::lineAt(content, line)), 120);
}

} // namespace EditApplier
