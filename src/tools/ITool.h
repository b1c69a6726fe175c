#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief codemap 工具接口
 *
 * 一个工具 = 一次引擎操作的 JSON 包装，参数与返回都是 JSON。
 *
 * 成功: {"content": [{"type": "text", "text": "..."}], "data": {...}}
 * 失败: {"error": "..."}
 */
class ITool {
public:
    virtual ~ITool() = default;

    /** 唯一名称，snake_case */
    virtual std::string getName() const = 0;
    virtual std::string getDescription() const = 0;

    /** 参数的 JSON Schema；"required" 中的字段由 ToolRegistry 在执行前检查 */
    virtual nlohmann::json getSchema() const = 0;

    virtual nlohmann::json execute(const nlohmann::json& args) = 0;

    /** 会修改工作区文件的工具返回 true（rename/migrate 只在 apply 时真正写入） */
    virtual bool writesFiles() const { return false; }

protected:
    static nlohmann::json textResult(const std::string& text, nlohmann::json data = nullptr) {
        nlohmann::json result;
        result["content"] = nlohmann::json::array({{{"type", "text"}, {"text", text}}});
        if (!data.is_null()) result["data"] = std::move(data);
        return result;
    }

    static nlohmann::json errorResult(const std::string& message) {
        return {{"error", message}};
    }
};
