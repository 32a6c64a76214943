#pragma once
#include <string>
#include <memory>
#include <map>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Tool registry
 *
 * Built once at startup and passed by reference to the server loop and the
 * router. Names are unique; the set is frozen once startup completes.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /**
     * @brief Register a tool
     * @throws std::runtime_error on a duplicate name or after freeze()
     */
    void registerTool(std::unique_ptr<ITool> tool);

    void registerTool(const std::string& name, const std::string& description,
                      const nlohmann::json& schema, FunctionTool::Handler handler);

    // No registration is accepted afterwards.
    void freeze() { frozen = true; }
    bool isFrozen() const { return frozen; }

    /**
     * @brief All descriptors sorted by name
     *
     * [{"name": ..., "description": ..., "inputSchema": {...}}, ...]
     */
    nlohmann::json listTools() const;

    /**
     * @brief Validate and dispatch a call
     *
     * @throws RpcError MethodNotFound for an unknown tool, InvalidParams on a
     *         schema violation (the handler is not run), InternalError wrapping
     *         any failure raised by the handler.
     */
    nlohmann::json invoke(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::map<std::string, std::unique_ptr<ITool>> tools;
    bool frozen = false;
};
