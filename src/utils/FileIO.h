#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace FileIO {
    /** 以二进制方式读取整个文件，失败时返回 std::nullopt */
    std::optional<std::string> readFile(const fs::path& path);

    /** 写入整个文件（覆盖）。失败时返回 false，并在 error 中给出原因 */
    bool writeFile(const fs::path& path, const std::string& content, std::string* error = nullptr);

    /** 按行切分，保留每行末尾的换行符（最后一行可能没有） */
    std::vector<std::string> splitLinesKeepEnds(const std::string& content);

    /** 每行起始字节偏移，下标 0 对应第 1 行 */
    std::vector<size_t> lineOffsets(const std::string& content);

    /** 去掉行尾换行后返回第 line 行（1-based），越界返回空串 */
    std::string lineAt(const std::string& content, int line);

    /** 截断到至多 maxBytes 字节，不切断 UTF-8 多字节字符 */
    std::string truncateUtf8(const std::string& s, size_t maxBytes);

    std::string rtrim(const std::string& s);
    std::string trim(const std::string& s);

    std::uint64_t fnv1a64(const std::string& data);
    /** 内容哈希：fnv1a64 的 16 位十六进制形式 */
    std::string contentHash(const std::string& data);
}
