#pragma once
#include "ITool.h"
#include <memory>

class Workspace;
class ToolRegistry;

/**
 * @brief 查询符号定义 / 使用处，或按前缀搜索符号名
 */
class FindSymbolTool : public ITool {
public:
    explicit FindSymbolTool(Workspace* workspace) : workspace(workspace) {}

    std::string getName() const override { return "find_symbol"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    Workspace* workspace;
};

/**
 * @brief 单个文件的符号摘要与声明表
 */
class FileSummaryTool : public ITool {
public:
    explicit FileSummaryTool(Workspace* workspace) : workspace(workspace) {}

    std::string getName() const override { return "file_summary"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    Workspace* workspace;
};

/**
 * @brief 仓库级重命名，默认只预览
 */
class RenameSymbolTool : public ITool {
public:
    explicit RenameSymbolTool(Workspace* workspace) : workspace(workspace) {}

    std::string getName() const override { return "rename_symbol"; }
    bool writesFiles() const override { return true; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    Workspace* workspace;
};

/**
 * @brief 签名变更后的调用点迁移，默认只预览
 */
class MigrateSignatureTool : public ITool {
public:
    explicit MigrateSignatureTool(Workspace* workspace) : workspace(workspace) {}

    std::string getName() const override { return "migrate_signature"; }
    bool writesFiles() const override { return true; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    Workspace* workspace;
};

/**
 * @brief 按查询相关度返回预算内的代码块
 */
class RelevantContextTool : public ITool {
public:
    explicit RelevantContextTool(Workspace* workspace) : workspace(workspace) {}

    std::string getName() const override { return "relevant_context"; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    Workspace* workspace;
};

/**
 * @brief 精确 SEARCH/REPLACE 补丁
 *
 * 接受 search + replace，或包含若干 SEARCH/REPLACE 块的 patch 文本。
 * 没有精确匹配时返回错误，由调用方重新生成补丁。
 */
class ApplyPatchTool : public ITool {
public:
    explicit ApplyPatchTool(Workspace* workspace) : workspace(workspace) {}

    std::string getName() const override { return "apply_patch"; }
    bool writesFiles() const override { return true; }
    std::string getDescription() const override;
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args) override;

private:
    Workspace* workspace;
};

/** 注册全部代码智能工具 */
void registerCodeIntelTools(ToolRegistry& registry, Workspace* workspace);
