#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace PatchApplier {
    /**
     * @brief 精确替换：search 必须逐字节出现在 original 中，只替换第一次出现
     * @return 替换后的文本；search 不存在时返回 std::nullopt（NoMatch），不做任何近似匹配
     *
     * search 为空时把 replace 插入到开头。
     */
    std::optional<std::string> applyPatch(const std::string& original, const std::string& search,
                                          const std::string& replace);

    using Block = std::pair<std::string, std::string>;

    /**
     * @brief 提取 (search, replace) 块
     *
     * 依次尝试三种写法，返回第一种有结果的：
     * 1. <<<<<<< SEARCH / ======= / >>>>>>> REPLACE
     * 2. 标记行后带任意文字的 <<<<<<< ... / ======= / >>>>>>> ...
     * 3. SEARCH: / REPLACE: 标签行，替换内容延续到下一个 SEARCH: 或文本结尾
     */
    std::vector<Block> parseSearchReplaceBlocks(const std::string& text);

    /**
     * 读取 root/relPath，应用精确替换并写回。
     * @return 成功返回 std::nullopt，否则返回错误描述
     */
    std::optional<std::string> applyPatchToFile(const fs::path& root, const std::string& relPath,
                                                const std::string& search, const std::string& replace);

    /** 多个块按顺序应用，全部匹配才写回；第 N 块不匹配时文件不变 */
    std::optional<std::string> applyPatchToFile(const fs::path& root, const std::string& relPath,
                                                const std::vector<Block>& blocks);
}
