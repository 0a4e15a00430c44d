#include "server/McpServer.h"
#include "utils/Logger.h"

namespace {
    constexpr int kParseError = -32700;
    constexpr int kInvalidRequest = -32600;
    constexpr int kMethodNotFound = -32601;
    constexpr int kInvalidParams = -32602;

    nlohmann::ordered_json ordered(const nlohmann::json& value) {
        return nlohmann::ordered_json::parse(value.dump());
    }

    nlohmann::ordered_json textContent(const std::string& text) {
        nlohmann::ordered_json part;
        part["type"] = "text";
        part["text"] = text;
        nlohmann::ordered_json result;
        result["content"] = nlohmann::ordered_json::array({part});
        return result;
    }
}

McpServer::McpServer(ToolHost& host, std::string name, std::string version)
    : host(host), serverName(std::move(name)), serverVersion(std::move(version)) {}

nlohmann::ordered_json McpServer::makeError(const nlohmann::json& id, int code, const std::string& message) {
    nlohmann::ordered_json error;
    error["jsonrpc"] = "2.0";
    error["id"] = ordered(id);
    error["error"]["code"] = code;
    error["error"]["message"] = message;
    return error;
}

std::optional<nlohmann::ordered_json> McpServer::handleText(const std::string& body, const ToolCallContext& ctx) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        return makeError(nullptr, kParseError, std::string("Parse error: ") + e.what());
    }
    return handle(message, ctx);
}

std::optional<nlohmann::ordered_json> McpServer::handle(const nlohmann::json& message, const ToolCallContext& ctx) {
    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        if (message.is_object() && message.contains("id") && !message.contains("method")) {
            // A response from the client; nothing is waiting for it here
            return std::nullopt;
        }
        return makeError(message.is_object() && message.contains("id") ? message["id"] : nlohmann::json(nullptr),
                         kInvalidRequest, "Invalid Request");
    }

    const std::string method = message["method"].get<std::string>();
    const bool isNotification = !message.contains("id");
    const nlohmann::json id = isNotification ? nlohmann::json(nullptr) : message["id"];
    nlohmann::json params = message.value("params", nlohmann::json::object());
    if (!params.is_object()) params = nlohmann::json::object();

    if (isNotification) {
        Logger::getInstance().debug("Notification " + method);
        return std::nullopt;
    }

    nlohmann::ordered_json result;
    if (method == "initialize") {
        result["protocolVersion"] = params.value("protocolVersion", "2024-11-05");
        result["capabilities"]["tools"]["listChanged"] = false;
        result["serverInfo"]["name"] = serverName;
        result["serverInfo"]["version"] = serverVersion;
    } else if (method == "ping") {
        result = nlohmann::ordered_json::object();
    } else if (method == "tools/list") {
        result = host.listTools();
    } else if (method == "tools/call") {
        if (!params.contains("name") || !params["name"].is_string()) {
            return makeError(id, kInvalidParams, "tools/call requires a tool name");
        }
        if (!host.hasTool(params["name"].get<std::string>())) {
            return makeError(id, kInvalidParams, "Unknown tool: " + params["name"].get<std::string>());
        }
        result = callTool(params, ctx);
    } else {
        return makeError(id, kMethodNotFound, "Method not found: " + method);
    }

    nlohmann::ordered_json response;
    response["jsonrpc"] = "2.0";
    response["id"] = ordered(id);
    response["result"] = std::move(result);
    return response;
}

nlohmann::ordered_json McpServer::callTool(const nlohmann::json& params, const ToolCallContext& ctx) {
    const std::string name = params["name"].get<std::string>();
    nlohmann::json args = params.value("arguments", nlohmann::json::object());

    Logger::getInstance().action("tools/call " + name + " " + args.dump());
    nlohmann::json output = host.executeTool(name, args, ctx);

    // Tool-level failures become isError results, not protocol errors
    if (output.is_object() && output.contains("error")) {
        std::string text = output["error"].is_string() ? output["error"].get<std::string>() : output["error"].dump();
        Logger::getInstance().warn("Tool '" + name + "' failed: " + text);
        auto result = textContent(text);
        result["isError"] = true;
        return result;
    }
    if (!output.is_object() || !output.contains("content")) {
        return textContent(output.dump());
    }
    return ordered(output);
}
