#include "ToolRegistry.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    if (name.empty()) {
        Logger::getInstance().error("Refusing to register a tool without a name");
        return;
    }
    if (tools.count(name)) {
        Logger::getInstance().warn("Tool '" + name + "' registered twice, replacing previous instance");
    }
    tools[name] = std::move(tool);
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = tools.find(name);
    return it == tools.end() ? nullptr : it->second.get();
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;
    schemas.reserve(tools.size());
    for (const auto& [name, tool] : tools) {
        schemas.push_back({
            {"type", "function"},
            {"writes_files", tool->writesFiles()},
            {"function", {
                {"name", name},
                {"description", tool->getDescription()},
                {"parameters", tool->getSchema()}
            }}
        });
    }
    return schemas;
}

std::optional<std::string> ToolRegistry::checkArguments(const nlohmann::json& schema, const nlohmann::json& args) {
    if (!args.is_object()) {
        return std::string("Arguments must be a JSON object");
    }
    auto it = schema.find("required");
    if (it == schema.end() || !it->is_array()) return std::nullopt;

    for (const auto& field : *it) {
        if (!field.is_string()) continue;
        const std::string key = field.get<std::string>();
        if (!args.contains(key) || args[key].is_null()) {
            return "Missing required parameter: " + key;
        }
    }
    return std::nullopt;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) {
    Logger& logger = Logger::getInstance();

    ITool* tool = getTool(name);
    if (!tool) {
        return {{"error", "Tool not found: " + name}};
    }

    try {
        if (auto problem = checkArguments(tool->getSchema(), args)) {
            logger.debug("Tool " + name + " rejected arguments: " + *problem);
            return {{"error", *problem}};
        }

        logger.debug("Executing tool " + name + " " +
                     args.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        nlohmann::json result = tool->execute(args);
        if (tool->writesFiles() && !result.contains("error")) {
            logger.debug("Tool " + name + " finished (may have modified files)");
        }
        return result;
    } catch (const std::exception& e) {
        logger.error("Tool " + name + " failed: " + e.what());
        return {{"error", std::string("Tool execution failed: ") + e.what()}};
    }
}
