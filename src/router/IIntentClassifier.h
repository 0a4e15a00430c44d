#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief 意图分类器 (外部协作者)
 *
 * 输入 OpenAI 风格的 messages 数组, 返回模型的原始文本回复。
 * 路由器只负责组织 prompt 和解析回复。
 */
class IIntentClassifier {
public:
    virtual ~IIntentClassifier() = default;
    virtual std::string classify(const nlohmann::json& messages) = 0;
};
