#include "utils/FileIO.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

namespace FileIO {

std::optional<std::string> readFile(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) return std::nullopt;
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) return std::nullopt;
    return content;
}

bool writeFile(const fs::path& path, const std::string& content, std::string* error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        if (error) *error = "cannot open for writing: " + std::string(std::strerror(errno));
        return false;
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        if (error) *error = "write failed";
        return false;
    }
    return true;
}

std::vector<std::string> splitLinesKeepEnds(const std::string& content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

std::vector<size_t> lineOffsets(const std::string& content) {
    std::vector<size_t> offsets{0};
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') {
            offsets.push_back(i + 1);
        }
    }
    return offsets;
}

std::string lineAt(const std::string& content, int line) {
    if (line < 1) return "";
    size_t start = 0;
    for (int i = 1; i < line; ++i) {
        size_t nl = content.find('\n', start);
        if (nl == std::string::npos) return "";
        start = nl + 1;
    }
    if (start >= content.size()) return "";
    size_t end = content.find('\n', start);
    std::string result = content.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!result.empty() && result.back() == '\r') result.pop_back();
    return result;
}

std::string truncateUtf8(const std::string& s, size_t maxBytes) {
    if (s.size() <= maxBytes) return s;
    size_t n = maxBytes;
    while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) {
        --n;
    }
    return s.substr(0, n);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? "" : s.substr(0, end + 1);
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::uint64_t fnv1a64(const std::string& data) {
    const std::uint64_t offset = 1469598103934665603ull;
    const std::uint64_t prime = 1099511628211ull;
    std::uint64_t hash = offset;
    for (unsigned char c : data) {
        hash ^= static_cast<std::uint64_t>(c);
        hash *= prime;
    }
    return hash;
}

std::string contentHash(const std::string& data) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(fnv1a64(data)));
    return std::string(buf);
}

} // namespace FileIO
