#include "utils/ScanIgnore.h"
#include "utils/Logger.h"
#include <algorithm>
#include <regex>
#include <unordered_set>

struct ScanIgnoreRules::Impl {
    std::unordered_set<std::string> dirNames;
    std::vector<std::regex> patterns;
};

ScanIgnoreRules::ScanIgnoreRules(std::vector<std::string> ignoreDirs, std::vector<std::string> patterns)
    : impl_(std::make_unique<Impl>()) {
    impl_->dirNames.insert(ignoreDirs.begin(), ignoreDirs.end());
    for (const auto& s : patterns) {
        try {
            impl_->patterns.emplace_back(s, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            Logger::getInstance().warn("Ignoring invalid ignore pattern '" + s + "': " + e.what());
        }
    }
}

ScanIgnoreRules::~ScanIgnoreRules() = default;
ScanIgnoreRules::ScanIgnoreRules(ScanIgnoreRules&&) noexcept = default;
ScanIgnoreRules& ScanIgnoreRules::operator=(ScanIgnoreRules&&) noexcept = default;

bool ScanIgnoreRules::shouldIgnore(const fs::path& relPath) const {
    // 隐藏路径段（. / .. 除外）与 ignoreDirs 中的目录名
    for (const auto& comp : relPath) {
        const std::string seg = comp.u8string();
        if (seg.empty()) continue;
        if (seg[0] == '.' && seg != "." && seg != "..") return true;
        if (impl_->dirNames.count(seg)) return true;
    }

    const std::string generic = relPath.generic_u8string();
    return std::any_of(impl_->patterns.begin(), impl_->patterns.end(),
                       [&](const std::regex& re) { return std::regex_search(generic, re); });
}
