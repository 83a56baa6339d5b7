#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 工具参数校验
 *
 * 按工具 schema 检查: 参数必须是对象, required 字段必须存在,
 * 已声明字段的类型 (string/integer/number/boolean/array/object) 必须匹配,
 * 数组的 items 类型逐项检查。违反时 execute 不会被调用。
 */
class ArgumentValidator {
public:
    struct ValidationResult {
        bool valid;
        std::string error;
    };

    static ValidationResult validate(const nlohmann::json& schema, const nlohmann::json& args) {
        if (!args.is_object()) {
            return {false, "arguments must be a JSON object"};
        }

        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto& req : schema["required"]) {
                const std::string name = req.get<std::string>();
                if (!args.contains(name) || args[name].is_null()) {
                    return {false, "missing required parameter: " + name};
                }
            }
        }

        if (!schema.contains("properties") || !schema["properties"].is_object()) {
            return {true, ""};
        }

        for (const auto& [name, prop] : schema["properties"].items()) {
            if (!args.contains(name) || args[name].is_null()) continue;
            const auto& value = args[name];
            std::string expected = prop.value("type", "");
            if (!matchesType(value, expected)) {
                return {false, "parameter '" + name + "' must be of type " + expected};
            }
            if (expected == "array" && prop.contains("items")) {
                auto itemResult = validateItems(name, prop["items"], value);
                if (!itemResult.valid) return itemResult;
            }
        }
        return {true, ""};
    }

private:
    static bool matchesType(const nlohmann::json& value, const std::string& type) {
        if (type.empty()) return true;
        if (type == "string") return value.is_string();
        if (type == "integer") return value.is_number_integer() ||
                                      (value.is_number_float() && value.get<double>() == static_cast<double>(static_cast<long long>(value.get<double>())));
        if (type == "number") return value.is_number();
        if (type == "boolean") return value.is_boolean();
        if (type == "array") return value.is_array();
        if (type == "object") return value.is_object();
        return true;
    }

    static ValidationResult validateItems(const std::string& name, const nlohmann::json& items, const nlohmann::json& array) {
        const std::string itemType = items.value("type", "");
        for (size_t i = 0; i < array.size(); ++i) {
            const auto& item = array[i];
            std::string where = name + "[" + std::to_string(i) + "]";
            if (!matchesType(item, itemType)) {
                return {false, where + " must be of type " + itemType};
            }
            if (itemType == "object") {
                auto nested = validate(items, item);
                if (!nested.valid) return {false, where + ": " + nested.error};
            }
        }
        return {true, ""};
    }
};
