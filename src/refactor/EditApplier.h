#pragma once
#include <string>
#include <vector>
#include "core/SourceTree.h"
#include "refactor/Edit.h"

namespace EditApplier {
    /**
     * @brief 把同一文件的 edits 应用到 content
     *
     * 每条 edit 的 oldText 必须与记录位置的原文一致，edit 之间不得重叠；
     * 任一条不满足则整体失败，content 不变。按 (line, colStart) 从后往前应用，
     * 前面的偏移在应用过程中保持有效。
     */
    bool applyToContent(std::string& content, std::vector<Edit> edits, std::string* error = nullptr);

    /** 读取、校验、应用并写回单个文件 */
    bool applyToFile(const SourceTree& tree, const std::string& relPath,
                     const std::vector<Edit>& edits, std::string* error = nullptr);

    /**
     * 按文件分组逐个写入，文件按路径排序。某个文件失败记录为 "<file>: <原因>"，
     * 不影响其余文件，已写入的文件不回滚。返回错误列表。
     * RenameEngine / SignatureMigrator 的写入以及 CLI 确认后的写入都走这里。
     */
    std::vector<std::string> applyBatch(const SourceTree& tree, const std::vector<Edit>& edits);

    /** 右侧去空白并截断到 120 字节的行文本 */
    std::string contextLine(const std::string& content, int line);
}
