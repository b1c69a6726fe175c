#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief 按名称持有全部工具，负责参数预检与异常隔离
 *
 * 工具按名称排序保存，listToolSchemas() 的顺序因此稳定。
 */
class ToolRegistry {
public:
    /** 同名工具被替换（记录警告）；空指针或空名称被拒绝 */
    void registerTool(std::unique_ptr<ITool> tool);

    ITool* getTool(const std::string& name);

    /**
     * 每个工具一项:
     * {"type": "function", "writes_files": bool,
     *  "function": {"name", "description", "parameters"}}
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * @brief 执行工具
     *
     * 未知工具 -> {"error": "Tool not found: <name>"}
     * 参数不是对象或缺少 required 字段 -> {"error": ...}，工具不会被调用
     * 工具抛出异常 -> {"error": "Tool execution failed: <what>"}
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    /** 按 schema 检查参数；通过返回 nullopt */
    static std::optional<std::string> checkArguments(const nlohmann::json& schema, const nlohmann::json& args);

private:
    std::map<std::string, std::unique_ptr<ITool>> tools;
};
