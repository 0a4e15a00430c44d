#include "router/IntentRouter.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>

namespace {
    std::string trim(const std::string& s) {
        size_t first = s.find_first_not_of(" \n\r\t`\"'");
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(" \n\r\t`\"'.");
        return s.substr(first, last - first + 1);
    }

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    bool isNoTool(const std::string& name) {
        std::string n = lower(name);
        return n.empty() || n == "none" || n == "other" || n == "null" || n == "chat";
    }

    ArgumentMap argumentsOf(const nlohmann::ordered_json& item) {
        for (const char* key : {"arguments", "args", "parameters"}) {
            if (!item.contains(key)) continue;
            const auto& value = item[key];
            // Some models put the arguments object into a string
            if (value.is_string()) {
                auto parsed = nlohmann::ordered_json::parse(value.get<std::string>(), nullptr, false);
                if (!parsed.is_discarded()) return parsed;
                return value;
            }
            return value.is_null() ? ArgumentMap::object() : value;
        }
        return ArgumentMap::object();
    }

    std::optional<PlannedCall> callOf(const nlohmann::ordered_json& item) {
        if (!item.is_object()) return std::nullopt;
        for (const char* key : {"tool", "name", "action"}) {
            if (item.contains(key) && item[key].is_string()) {
                std::string tool = item[key].get<std::string>();
                if (isNoTool(tool)) return std::nullopt;
                return PlannedCall{tool, argumentsOf(item)};
            }
        }
        return std::nullopt;
    }
}

nlohmann::json RouteResult::toJson() const {
    nlohmann::json j;
    j["status"] = ok ? "ok" : "error";
    nlohmann::json plan = nlohmann::json::array();
    for (const auto& c : calls) {
        plan.push_back({{"tool", c.toolName}, {"arguments", nlohmann::json::parse(c.arguments.dump())}});
    }
    j["calls"] = plan;
    if (!ok) {
        j["error"] = {{"kind", errorKindName(errorKind)}, {"message", message}};
        if (cause != ErrorKind::None) j["error"]["cause"] = errorKindName(cause);
    }
    return j;
}

IntentRouter::IntentRouter(IIntentClassifier& classifier) : classifier(classifier) {}

std::string IntentRouter::buildCatalogPrompt(const RegistrySnapshot& snapshot) {
    std::string prompt =
        "You route user requests to tools. Available tools (name, description, parameters):\n";
    for (const auto& [name, tool] : snapshot.tools) {
        prompt += "- " + tool.toJson().dump() + "\n";
    }
    prompt +=
        "\nReply with JSON only, in this form:\n"
        "{\"calls\": [{\"tool\": \"<tool name>\", \"arguments\": {<parameter>: <value>}}]}\n"
        "List several calls in the order they must run when the request needs more than one.\n"
        "Use only tool names from the list above and supply every required parameter.\n"
        "If no tool applies (greetings, general questions), reply {\"calls\": []}.";
    return prompt;
}

std::vector<PlannedCall> IntentRouter::parsePlan(const std::string& reply) {
    std::vector<PlannedCall> plan;
    std::string text = trim(reply);
    if (isNoTool(text)) return plan;

    size_t open = text.find('{');
    size_t close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        // A bare tool name such as "get_tasks"
        if (text.find_first_of(" \n\t") == std::string::npos) {
            plan.push_back({text, ArgumentMap::object()});
        }
        return plan;
    }

    auto parsed = nlohmann::ordered_json::parse(text.substr(open, close - open + 1), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        Logger::getInstance().debug("Unparseable classifier reply: " + text);
        return plan;
    }

    if (parsed.contains("calls") && parsed["calls"].is_array()) {
        for (const auto& item : parsed["calls"]) {
            if (auto call = callOf(item)) plan.push_back(std::move(*call));
        }
        return plan;
    }

    if (auto call = callOf(parsed)) plan.push_back(std::move(*call));
    return plan;
}

RouteResult IntentRouter::route(const std::string& userText, const RegistrySnapshot& snapshot) {
    RouteResult result;

    nlohmann::json messages = nlohmann::json::array();
    messages.push_back({{"role", "system"}, {"content", buildCatalogPrompt(snapshot)}});
    messages.push_back({{"role", "user"}, {"content", userText}});

    for (int attempt = 0; attempt <= kMaxCorrections; ++attempt) {
        std::string reply;
        try {
            reply = classifier.classify(messages);
        } catch (const std::exception& e) {
            result.ok = false;
            result.errorKind = ErrorKind::RoutingFailure;
            result.message = std::string("classifier failed: ") + e.what();
            return result;
        }
        result.classifierCalls++;

        std::vector<PlannedCall> plan = parsePlan(reply);
        std::vector<std::string> unknown;
        for (const auto& call : plan) {
            if (!snapshot.tools.count(call.toolName)) unknown.push_back(call.toolName);
        }

        if (unknown.empty()) {
            result.calls = std::move(plan);
            return result;
        }

        std::string names;
        for (const auto& u : unknown) names += (names.empty() ? "'" : ", '") + u + "'";
        Logger::getInstance().warn("Classifier chose nonexistent tool " + names +
                                   " (attempt " + std::to_string(attempt + 1) + ")");
        result.message = "classifier chose nonexistent tool " + names;

        std::string valid;
        for (const auto& [name, tool] : snapshot.tools) valid += (valid.empty() ? "" : ", ") + name;
        messages.push_back({{"role", "assistant"}, {"content", reply}});
        messages.push_back({{"role", "user"}, {"content",
            "Invalid tool: " + names + " does not exist. Choose only from: " +
            (valid.empty() ? std::string("(no tools)") : valid) +
            ". Reply with the corrected JSON, or {\"calls\": []} if none applies."}});
    }

    result.ok = false;
    result.errorKind = ErrorKind::RoutingFailure;
    result.cause = ErrorKind::HallucinatedTool;
    result.message += " after " + std::to_string(kMaxCorrections) + " correction";
    return result;
}
