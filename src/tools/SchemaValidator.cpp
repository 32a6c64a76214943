#include "tools/SchemaValidator.h"
#include <cmath>

SchemaValidator::ValidationResult SchemaValidator::validate(const nlohmann::json& schema, const nlohmann::json& value) {
    if (!schema.is_object()) {
        return {true, "", ""};
    }
    return check(schema, value, "");
}

bool SchemaValidator::matchesType(const std::string& type, const nlohmann::json& value) {
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "null") return value.is_null();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        if (value.is_number_float()) {
            double d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    return true;
}

std::string SchemaValidator::typeOf(const nlohmann::json& value) {
    if (value.is_number_integer()) return "integer";
    if (value.is_number()) return "number";
    return value.type_name();
}

SchemaValidator::ValidationResult SchemaValidator::check(const nlohmann::json& schema,
                                                         const nlohmann::json& value,
                                                         const std::string& path) {
    const std::string where = path.empty() ? "/" : path;

    if (schema.contains("type")) {
        const auto& type = schema["type"];
        bool ok = false;
        std::string expected;
        if (type.is_string()) {
            expected = type.get<std::string>();
            ok = matchesType(expected, value);
        } else if (type.is_array()) {
            for (const auto& t : type) {
                if (!t.is_string()) continue;
                if (!expected.empty()) expected += "|";
                expected += t.get<std::string>();
                if (matchesType(t.get<std::string>(), value)) ok = true;
            }
        } else {
            ok = true;
        }
        if (!ok) {
            return {false, where, "expected " + expected + ", got " + typeOf(value)};
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& candidate : schema["enum"]) {
            if (candidate == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return {false, where, "value not in enum " + schema["enum"].dump()};
        }
    }

    if (value.is_number()) {
        double d = value.get<double>();
        if (schema.contains("minimum") && schema["minimum"].is_number() && d < schema["minimum"].get<double>()) {
            return {false, where, "must be >= " + schema["minimum"].dump()};
        }
        if (schema.contains("maximum") && schema["maximum"].is_number() && d > schema["maximum"].get<double>()) {
            return {false, where, "must be <= " + schema["maximum"].dump()};
        }
    }

    if (value.is_string() && schema.contains("minLength") && schema["minLength"].is_number_integer()) {
        if (static_cast<long long>(value.get<std::string>().size()) < schema["minLength"].get<long long>()) {
            return {false, where, "shorter than minLength " + schema["minLength"].dump()};
        }
    }

    if (value.is_object()) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& key : schema["required"]) {
                if (key.is_string() && !value.contains(key.get<std::string>())) {
                    return {false, path + "/" + key.get<std::string>(), "missing required property"};
                }
            }
        }

        const nlohmann::json* props = nullptr;
        if (schema.contains("properties") && schema["properties"].is_object()) {
            props = &schema["properties"];
        }
        bool closed = schema.contains("additionalProperties") &&
                      schema["additionalProperties"].is_boolean() &&
                      !schema["additionalProperties"].get<bool>();

        for (auto it = value.begin(); it != value.end(); ++it) {
            std::string childPath = path + "/" + it.key();
            if (props && props->contains(it.key())) {
                auto res = check((*props)[it.key()], it.value(), childPath);
                if (!res.valid) return res;
            } else if (closed) {
                return {false, childPath, "unexpected property"};
            }
        }
    }

    if (value.is_array()) {
        if (schema.contains("minItems") && schema["minItems"].is_number_integer() &&
            static_cast<long long>(value.size()) < schema["minItems"].get<long long>()) {
            return {false, where, "fewer than " + schema["minItems"].dump() + " items"};
        }
        if (schema.contains("maxItems") && schema["maxItems"].is_number_integer() &&
            static_cast<long long>(value.size()) > schema["maxItems"].get<long long>()) {
            return {false, where, "more than " + schema["maxItems"].dump() + " items"};
        }
        if (schema.contains("items") && schema["items"].is_object()) {
            for (size_t i = 0; i < value.size(); ++i) {
                auto res = check(schema["items"], value[i], path + "/" + std::to_string(i));
                if (!res.valid) return res;
            }
        }
    }

    return {true, "", ""};
}
