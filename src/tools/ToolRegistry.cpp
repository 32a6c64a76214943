#include "ToolRegistry.h"
#include <stdexcept>
#include "tools/SchemaValidator.h"
#include "protocol/JsonRpc.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) {
        throw std::runtime_error("Cannot register a null tool");
    }
    if (frozen) {
        throw std::runtime_error("Tool registry is frozen; cannot register " + tool->getName());
    }

    std::string name = tool->getName();
    if (name.empty()) {
        throw std::runtime_error("Tool name must not be empty");
    }
    if (tools.count(name)) {
        throw std::runtime_error("Duplicate tool registration: " + name);
    }

    tools[name] = std::move(tool);
}

void ToolRegistry::registerTool(const std::string& name, const std::string& description,
                                const nlohmann::json& schema, FunctionTool::Handler handler) {
    registerTool(std::make_unique<FunctionTool>(name, description, schema, std::move(handler)));
}

nlohmann::json ToolRegistry::listTools() const {
    nlohmann::json list = nlohmann::json::array();

    // std::map iterates in name order.
    for (const auto& [name, tool] : tools) {
        list.push_back({
            {"name", name},
            {"description", tool->getDescription()},
            {"inputSchema", tool->getSchema()}
        });
    }

    return list;
}

nlohmann::json ToolRegistry::invoke(const std::string& name, const nlohmann::json& args) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        throw RpcError(RpcErrorCode::MethodNotFound, "Tool not found: " + name, {{"tool", name}});
    }
    ITool* tool = it->second.get();

    auto validation = SchemaValidator::validate(tool->getSchema(), args);
    if (!validation.valid) {
        throw RpcError(RpcErrorCode::InvalidParams,
                       "Invalid params for " + name + ": " + validation.path + " " + validation.error,
                       {{"tool", name}, {"path", validation.path}, {"reason", validation.error}});
    }

    try {
        return tool->execute(args);
    } catch (const RpcError& e) {
        Logger::getInstance().warn("Tool " + name + " failed: " + e.what());
        throw RpcError(RpcErrorCode::InternalError,
                       std::string("Tool execution failed: ") + e.what(),
                       {{"tool", name}, {"cause", e.what()}, {"cause_code", e.code()}});
    } catch (const std::exception& e) {
        Logger::getInstance().warn("Tool " + name + " failed: " + e.what());
        throw RpcError(RpcErrorCode::InternalError,
                       std::string("Tool execution failed: ") + e.what(),
                       {{"tool", name}, {"cause", e.what()}});
    } catch (...) {
        Logger::getInstance().warn("Tool " + name + " failed with a non-standard exception");
        throw RpcError(RpcErrorCode::InternalError, "Tool execution failed",
                       {{"tool", name}, {"cause", "unknown exception"}});
    }
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
