#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Validates tool arguments against the JSON Schema subset tools declare.
 *
 * Supported keywords: type (string or array of names), properties, required,
 * additionalProperties (boolean), enum, minimum, maximum, minLength, items,
 * minItems, maxItems. Unknown keywords are ignored.
 */
class SchemaValidator {
public:
    struct ValidationResult {
        bool valid;
        std::string path;   // "/pages/2", "" for the root
        std::string error;
    };

    static ValidationResult validate(const nlohmann::json& schema, const nlohmann::json& value);

private:
    static ValidationResult check(const nlohmann::json& schema, const nlohmann::json& value, const std::string& path);
    static bool matchesType(const std::string& type, const nlohmann::json& value);
    static std::string typeOf(const nlohmann::json& value);
};
