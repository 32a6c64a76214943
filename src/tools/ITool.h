#pragma once
#include <string>
#include <functional>
#include <utility>
#include <nlohmann/json.hpp>

/**
 * @brief Tool interface.
 *
 * A tool is a function of validated arguments to a result value. It never
 * frames protocol messages and never writes to the host's stdout; declared
 * failures are thrown as std::exception.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short human-readable description
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief Input schema (JSON Schema subset, see SchemaValidator)
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Execute the tool
     * @param args Arguments already validated against getSchema()
     * @return Result value
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};

// Adapter for tools whose whole implementation is a single callable.
class FunctionTool : public ITool {
public:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    FunctionTool(std::string name, std::string description, nlohmann::json schema, Handler handler)
        : name(std::move(name)), description(std::move(description)),
          schema(std::move(schema)), handler(std::move(handler)) {}

    std::string getName() const override { return name; }
    std::string getDescription() const override { return description; }
    nlohmann::json getSchema() const override { return schema; }
    nlohmann::json execute(const nlohmann::json& args) override { return handler(args); }

private:
    std::string name;
    std::string description;
    nlohmann::json schema;
    Handler handler;
};
