#include "core/SourceTree.h"
#include "utils/Logger.h"
#include <algorithm>

SourceTree::SourceTree(const std::string& rootPath, const Config& config)
    : rootPath(fs::u8path(rootPath)),
      extensions(config.codeExtensions),
      rules(config.ignoreDirs, config.ignorePatterns) {}

std::vector<std::string> SourceTree::listFiles() const {
    std::vector<std::string> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(rootPath, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        Logger::getInstance().warn("Cannot enumerate " + rootPath.u8string() + ": " + ec.message());
        return files;
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            Logger::getInstance().debug("Directory walk error: " + ec.message());
            ec.clear();
            continue;
        }
        fs::path rel = fs::relative(it->path(), rootPath, ec);
        if (ec) {
            ec.clear();
            continue;
        }
        if (it->is_directory(ec)) {
            // 被忽略的目录整棵跳过
            if (rules.shouldIgnore(rel)) it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec)) continue;
        std::string relStr = rel.generic_u8string();
        if (!isCodeFile(relStr) || rules.shouldIgnore(rel)) continue;
        files.push_back(relStr);
    }

    std::sort(files.begin(), files.end());
    return files;
}

bool SourceTree::isCodeFile(const std::string& relPath) const {
    std::string ext = fs::u8path(relPath).extension().u8string();
    return std::find(extensions.begin(), extensions.end(), ext) != extensions.end();
}

bool SourceTree::isIgnored(const std::string& relPath) const {
    return rules.shouldIgnore(fs::u8path(relPath));
}

fs::path SourceTree::absolute(const std::string& relPath) const {
    return rootPath / fs::u8path(relPath);
}
