#include "ToolRegistry.h"
#include "ArgumentValidator.h"
#include "core/Errors.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    if (tools.count(name)) {
        Logger::getInstance().warn("Tool registered twice, replacing: " + name);
    }

    tools[name] = std::move(tool);
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;

    for (const auto& [name, tool] : tools) {
        nlohmann::json schema;
        schema["name"] = name;
        schema["description"] = tool->getDescription();
        schema["inputSchema"] = tool->getSchema();
        schemas.push_back(schema);
    }

    return schemas;
}

nlohmann::json ToolRegistry::makeError(const std::string& kind, const std::string& message) {
    nlohmann::json error = makeTextResult("Error: " + message);
    error["error"] = message;
    error["error_type"] = kind;
    error["isError"] = true;
    return error;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) {
    ITool* tool = getTool(name);
    if (!tool) {
        return makeError("unknown_tool", "Unknown tool: " + name);
    }

    const nlohmann::json& effectiveArgs = args.is_null() ? nlohmann::json::object() : args;
    auto validation = ArgumentValidator::validate(tool->getSchema(), effectiveArgs);
    if (!validation.valid) {
        return makeError("invalid_arguments", "Invalid arguments for " + name + ": " + validation.error);
    }

    try {
        return tool->execute(effectiveArgs);
    } catch (const WardenError& e) {
        Logger::getInstance().debug(name + " failed (" + e.kind() + "): " + e.what());
        return makeError(e.kind(), e.what());
    } catch (const nlohmann::json::exception& e) {
        return makeError("invalid_arguments", "Invalid arguments for " + name + ": " + e.what());
    } catch (const std::exception& e) {
        Logger::getInstance().error(name + " failed: " + e.what());
        return makeError("internal_error", std::string("Tool execution failed: ") + e.what());
    }
}

std::future<nlohmann::json> ToolRegistry::executeToolAsync(const std::string& name, nlohmann::json args) {
    return std::async(std::launch::async, [this, name, args = std::move(args)]() {
        return executeTool(name, args);
    });
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
