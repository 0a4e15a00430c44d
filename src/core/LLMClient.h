#pragma once
#include <string>
#include <nlohmann/json.hpp>

class LLMClient {
public:
    LLMClient(const std::string& apiKey,
              const std::string& baseUrl = "https://api.openai.com/v1",
              const std::string& model = "gpt-4o-mini");
    virtual ~LLMClient() = default;

    virtual std::string chat(const std::string& prompt, const std::string& systemRole = "");

    // Returns the assistant text of the first choice, empty on failure
    virtual std::string complete(const nlohmann::json& messages, double temperature = 0.0);

    virtual nlohmann::json chatCompletion(const nlohmann::json& body);

private:
    std::string apiKey;
    std::string baseUrl;
    std::string modelName;
    bool isSsl;
    std::string host;
    int port;
    std::string pathPrefix;

    void parseBaseUrl(const std::string& url);
};
