#include "refactor/PatchApplier.h"
#include "utils/FileIO.h"
#include "utils/Logger.h"

namespace {

const std::string kSearchMarker = "<<<<<<<";
const std::string kDivider = "=======";
const std::string kReplaceMarker = ">>>>>>>";

/** pos 起跳过空格与制表符 */
size_t skipBlanks(const std::string& s, size_t pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) ++pos;
    return pos;
}

/** pos 处若为 "\n" 或 "\r\n" 返回其后位置，否则 npos */
size_t consumeNewline(const std::string& s, size_t pos) {
    if (pos < s.size() && s[pos] == '\r') ++pos;
    if (pos < s.size() && s[pos] == '\n') return pos + 1;
    return std::string::npos;
}

/** 从 from 开始找独占一行的 marker，返回行首位置 */
size_t findMarkerLine(const std::string& s, const std::string& marker, size_t from) {
    size_t pos = from;
    while ((pos = s.find(marker, pos)) != std::string::npos) {
        if (pos == 0 || s[pos - 1] == '\n') return pos;
        pos += marker.size();
    }
    return std::string::npos;
}

/** 去掉块内容末尾紧挨分隔行的换行 */
std::string stripTrailingNewline(std::string s) {
    if (!s.empty() && s.back() == '\n') s.pop_back();
    if (!s.empty() && s.back() == '\r') s.pop_back();
    return s;
}

/** pos 所在行的行尾（'\r'、'\n' 或文本末尾） */
size_t endOfLine(const std::string& s, size_t pos) {
    while (pos < s.size() && s[pos] != '\n' && s[pos] != '\r') ++pos;
    return pos;
}

std::string stripNewlines(const std::string& s) {
    size_t begin = s.find_first_not_of("\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of("\r\n");
    return s.substr(begin, end - begin + 1);
}

/**
 * <<<<<<< / ======= / >>>>>>> 围栏块。
 * labelled 为 true 时要求 SEARCH / REPLACE 标签；否则标记行后的文字任意，且标记须在行首。
 */
std::vector<PatchApplier::Block> parseFenced(const std::string& text, bool labelled) {
    std::vector<PatchApplier::Block> blocks;
    size_t pos = 0;
    while (true) {
        pos = labelled ? text.find(kSearchMarker, pos) : findMarkerLine(text, kSearchMarker, pos);
        if (pos == std::string::npos) break;

        size_t cursor = pos + kSearchMarker.size();
        if (labelled) {
            cursor = skipBlanks(text, cursor);
            if (text.compare(cursor, 6, "SEARCH") != 0) {
                pos += kSearchMarker.size();
                continue;
            }
            cursor = skipBlanks(text, cursor + 6);
        } else {
            cursor = endOfLine(text, cursor);
        }
        size_t searchBegin = consumeNewline(text, cursor);
        if (searchBegin == std::string::npos) {
            pos = cursor;
            continue;
        }

        size_t divider = findMarkerLine(text, kDivider, searchBegin);
        if (divider == std::string::npos) break;
        size_t replaceBegin = consumeNewline(text, divider + kDivider.size());
        if (replaceBegin == std::string::npos) {
            pos = divider;
            continue;
        }

        size_t end = findMarkerLine(text, kReplaceMarker, replaceBegin);
        if (end == std::string::npos) break;
        size_t tail = end + kReplaceMarker.size();
        if (labelled) {
            tail = skipBlanks(text, tail);
            if (text.compare(tail, 7, "REPLACE") != 0) {
                pos = tail;
                continue;
            }
            tail += 7;
        } else {
            tail = endOfLine(text, tail);
        }

        std::string search = divider > searchBegin ? text.substr(searchBegin, divider - searchBegin) : "";
        std::string replace = end > replaceBegin ? text.substr(replaceBegin, end - replaceBegin) : "";
        blocks.emplace_back(stripTrailingNewline(std::move(search)), stripTrailingNewline(std::move(replace)));
        pos = tail;
    }
    return blocks;
}

/** SEARCH: / REPLACE: 标签写法 */
std::vector<PatchApplier::Block> parseLabelled(const std::string& text) {
    const std::string searchLabel = "SEARCH:";
    const std::string replaceLabel = "REPLACE:";

    std::vector<PatchApplier::Block> blocks;
    size_t pos = 0;
    while ((pos = findMarkerLine(text, searchLabel, pos)) != std::string::npos) {
        size_t searchBegin = consumeNewline(text, skipBlanks(text, pos + searchLabel.size()));
        if (searchBegin == std::string::npos) {
            pos += searchLabel.size();
            continue;
        }
        size_t replaceLine = findMarkerLine(text, replaceLabel, searchBegin);
        if (replaceLine == std::string::npos) break;
        size_t replaceBegin = consumeNewline(text, skipBlanks(text, replaceLine + replaceLabel.size()));
        if (replaceBegin == std::string::npos) {
            pos = replaceLine + replaceLabel.size();
            continue;
        }
        size_t next = findMarkerLine(text, searchLabel, replaceBegin);
        size_t replaceEnd = next == std::string::npos ? text.size() : next;

        blocks.emplace_back(stripNewlines(text.substr(searchBegin, replaceLine - searchBegin)),
                            stripNewlines(text.substr(replaceBegin, replaceEnd - replaceBegin)));
        pos = replaceEnd;
    }
    return blocks;
}

} // namespace

namespace PatchApplier {

std::optional<std::string> applyPatch(const std::string& original, const std::string& search,
                                      const std::string& replace) {
    if (search.empty()) return replace + original;
    size_t pos = original.find(search);
    if (pos == std::string::npos) return std::nullopt;
    std::string patched = original;
    patched.replace(pos, search.size(), replace);
    return patched;
}

std::vector<Block> parseSearchReplaceBlocks(const std::string& text) {
    std::vector<Block> blocks = parseFenced(text, true);
    if (blocks.empty()) blocks = parseFenced(text, false);
    if (blocks.empty()) blocks = parseLabelled(text);
    return blocks;
}

std::optional<std::string> applyPatchToFile(const fs::path& root, const std::string& relPath,
                                            const std::string& search, const std::string& replace) {
    return applyPatchToFile(root, relPath, std::vector<Block>{{search, replace}});
}

std::optional<std::string> applyPatchToFile(const fs::path& root, const std::string& relPath,
                                            const std::vector<Block>& blocks) {
    fs::path target = root / fs::u8path(relPath);
    auto original = FileIO::readFile(target);
    if (!original) return "Cannot read file: " + relPath;

    std::string patched = *original;
    for (size_t i = 0; i < blocks.size(); ++i) {
        auto next = applyPatch(patched, blocks[i].first, blocks[i].second);
        if (!next) {
            Logger::getInstance().warn("apply_patch: search text not found in " + relPath);
            std::string which = blocks.size() > 1 ? " of block " + std::to_string(i + 1) : "";
            return "Search text" + which + " not found in " + relPath + " (exact match required)";
        }
        patched = std::move(*next);
    }

    std::string error;
    if (!FileIO::writeFile(target, patched, &error)) return "Cannot write " + relPath + ": " + error;
    Logger::getInstance().success("Patched " + relPath + " (" + std::to_string(blocks.size()) + " blocks)");
    return std::nullopt;
}

} // namespace PatchApplier
