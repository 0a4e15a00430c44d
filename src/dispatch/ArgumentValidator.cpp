#include "dispatch/ArgumentValidator.h"
#include <cmath>

bool ArgumentValidator::matchesType(const nlohmann::ordered_json& value, const std::string& type) {
    if (type.empty() || type == "any") return true;
    if (type == "string") return value.is_string();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        // 3.0 is an acceptable integer, 3.5 is not
        return value.is_number_float() && std::isfinite(value.get<double>()) &&
               std::trunc(value.get<double>()) == value.get<double>();
    }
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "array") return value.is_array();
    if (type == "object") return value.is_object();
    if (type == "null") return value.is_null();
    return true;
}

std::optional<std::string> ArgumentValidator::validate(const ToolDescriptor& tool, const ArgumentMap& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        return "arguments for '" + tool.name + "' must be an object, got " + arguments.type_name();
    }

    for (const auto& param : tool.parameters) {
        bool present = arguments.is_object() && arguments.contains(param.name);
        if (!present) {
            if (param.required) {
                return "missing required parameter '" + param.name + "' for tool '" + tool.name + "'";
            }
            continue;
        }
        const auto& value = arguments[param.name];
        if (!matchesType(value, param.type)) {
            return "parameter '" + param.name + "' of tool '" + tool.name + "' expects " + param.type +
                   ", got " + value.type_name();
        }
    }
    return std::nullopt;
}
