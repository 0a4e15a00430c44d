#pragma once
#include <stdexcept>
#include "router/IIntentClassifier.h"
#include "core/LLMClient.h"

// Classifier backed by an OpenAI-compatible chat completion endpoint (temperature 0)
class LLMIntentClassifier : public IIntentClassifier {
public:
    explicit LLMIntentClassifier(LLMClient& client) : llm(client) {}

    std::string classify(const nlohmann::json& messages) override {
        std::string reply = llm.complete(messages, 0.0);
        // complete() reports transport and API failures as an empty reply
        if (reply.empty()) {
            throw std::runtime_error("language model returned no reply");
        }
        return reply;
    }

private:
    LLMClient& llm;
};
