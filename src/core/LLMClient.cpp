#include "core/LLMClient.h"
#include "utils/Logger.h"
#include <httplib.h>
#include <regex>
#include <thread>
#include <chrono>

LLMClient::LLMClient(const std::string& apiKey, const std::string& baseUrl, const std::string& model)
    : apiKey(apiKey), baseUrl(baseUrl), modelName(model) {
    parseBaseUrl(baseUrl);
}

void LLMClient::parseBaseUrl(const std::string& url) {
    std::regex urlRegex(R"((http|https)://([^/:]+)(?::(\d+))?(.*))");
    std::smatch match;
    if (std::regex_match(url, match, urlRegex)) {
        isSsl = (match[1] == "https");
        host = match[2];
        if (match[3].matched) {
            port = std::stoi(match[3]);
        } else {
            port = isSsl ? 443 : 80;
        }
        pathPrefix = match[4];
    } else {
        // Bare host name, assume https
        isSsl = true;
        host = url;
        port = 443;
        pathPrefix = "";
    }
}

std::string LLMClient::chat(const std::string& prompt, const std::string& systemRole) {
    nlohmann::json messages = nlohmann::json::array();
    std::string role = systemRole.empty() ? "You are a helpful assistant." : systemRole;
    messages.push_back({{"role", "system"}, {"content", role}});
    messages.push_back({{"role", "user"}, {"content", prompt}});
    return complete(messages, 0.7);
}

std::string LLMClient::complete(const nlohmann::json& messages, double temperature) {
    nlohmann::json body = {
        {"model", modelName},
        {"messages", messages},
        {"temperature", temperature}
    };

    nlohmann::json res = chatCompletion(body);
    if (res.is_object() && res.contains("choices") && !res["choices"].empty()) {
        const auto& msg = res["choices"][0]["message"];
        if (msg.contains("content") && msg["content"].is_string()) {
            return msg["content"].get<std::string>();
        }
    }
    return "";
}

nlohmann::json LLMClient::chatCompletion(const nlohmann::json& body) {
    httplib::Headers headers = {
        {"Authorization", "Bearer " + apiKey}
    };

    std::string endpoint = pathPrefix + "/chat/completions";
    std::string bodyStr = body.dump();

    httplib::Result res;
    int retryCount = 0;
    const int maxRetries = 3;

    while (retryCount < maxRetries) {
        try {
            if (isSsl) {
                httplib::SSLClient cli(host, port);
                cli.set_follow_location(true);
                cli.set_connection_timeout(10);
                cli.set_read_timeout(60);
                res = cli.Post(endpoint, headers, bodyStr, "application/json");
            } else {
                httplib::Client cli(host, port);
                cli.set_follow_location(true);
                cli.set_connection_timeout(10);
                cli.set_read_timeout(60);
                res = cli.Post(endpoint, headers, bodyStr, "application/json");
            }

            if (res && res->status == 200) break;

            retryCount++;
            if (retryCount < maxRetries) {
                Logger::getInstance().warn("LLM request failed (Status: " +
                    (res ? std::to_string(res->status) : httplib::to_string(res.error())) +
                    "). Retrying (" + std::to_string(retryCount) + "/" + std::to_string(maxRetries) + ")...");
                std::this_thread::sleep_for(std::chrono::seconds(2 * retryCount));
            }
        } catch (const std::exception& e) {
            retryCount++;
            Logger::getInstance().warn(std::string("LLM request threw: ") + e.what());
            if (retryCount >= maxRetries) return nlohmann::json::object();
            std::this_thread::sleep_for(std::chrono::seconds(2 * retryCount));
        }
    }

    if (res && res->status == 200) {
        try {
            return nlohmann::json::parse(res->body);
        } catch (const nlohmann::json::parse_error& e) {
            Logger::getInstance().error(std::string("LLM response is not JSON: ") + e.what());
            return nlohmann::json::object();
        }
    }

    Logger::getInstance().error("LLM API error after " + std::to_string(maxRetries) + " attempts: " +
        (res ? std::to_string(res->status) : std::string("Connection failed")));
    if (res && !res->body.empty()) Logger::getInstance().debug("  Body: " + res->body);
    return nlohmann::json::object();
}
