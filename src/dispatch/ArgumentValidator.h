#pragma once
#include <optional>
#include <string>
#include "core/DispatchTypes.h"
#include "registry/ToolDescriptor.h"

/**
 * @brief 分发前的唯一参数校验点
 *
 * - 缺少 required 参数 -> 错误
 * - 已声明参数的 JSON 类型不符 -> 错误
 * - 未声明的额外参数忽略, 原样转发
 */
class ArgumentValidator {
public:
    // Returns an error message, or std::nullopt when the arguments are acceptable
    static std::optional<std::string> validate(const ToolDescriptor& tool, const ArgumentMap& arguments);

    static bool matchesType(const nlohmann::ordered_json& value, const std::string& type);
};
