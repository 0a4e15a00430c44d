#include "registry/ToolDescriptor.h"
#include <algorithm>
#include <stdexcept>

ToolDescriptor ToolDescriptor::fromCatalogEntry(const nlohmann::ordered_json& entry,
                                                const std::shared_ptr<ServerEndpoint>& owner) {
    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string() ||
        entry["name"].get<std::string>().empty()) {
        throw std::invalid_argument("catalog entry without a tool name: " + entry.dump());
    }

    ToolDescriptor desc;
    desc.name = entry["name"].get<std::string>();
    if (entry.contains("description") && entry["description"].is_string()) {
        desc.description = entry["description"].get<std::string>();
    }
    if (owner) {
        desc.serverName = owner->name;
        desc.endpoint = owner;
    }

    // Older servers use "parameters" instead of "inputSchema"
    if (entry.contains("inputSchema") && entry["inputSchema"].is_object()) {
        desc.inputSchema = entry["inputSchema"];
    } else if (entry.contains("parameters") && entry["parameters"].is_object()) {
        desc.inputSchema = entry["parameters"];
    }

    std::vector<std::string> required;
    if (desc.inputSchema.contains("required") && desc.inputSchema["required"].is_array()) {
        for (const auto& r : desc.inputSchema["required"]) {
            if (r.is_string()) required.push_back(r.get<std::string>());
        }
    }

    if (desc.inputSchema.contains("properties") && desc.inputSchema["properties"].is_object()) {
        for (const auto& [key, prop] : desc.inputSchema["properties"].items()) {
            ParameterSpec spec;
            spec.name = key;
            if (prop.is_object()) {
                if (prop.contains("type") && prop["type"].is_string()) {
                    spec.type = prop["type"].get<std::string>();
                }
                if (prop.contains("description") && prop["description"].is_string()) {
                    spec.description = prop["description"].get<std::string>();
                }
            }
            spec.required = std::find(required.begin(), required.end(), key) != required.end();
            desc.parameters.push_back(std::move(spec));
        }
    }

    // Required names that the schema never declared as properties still count
    for (const auto& r : required) {
        if (!desc.findParameter(r)) {
            desc.parameters.push_back({r, "", true, ""});
        }
    }
    return desc;
}

nlohmann::ordered_json ToolDescriptor::toJson() const {
    nlohmann::ordered_json params = nlohmann::ordered_json::array();
    for (const auto& p : parameters) {
        nlohmann::ordered_json item;
        item["name"] = p.name;
        item["type"] = p.type.empty() ? "any" : p.type;
        item["required"] = p.required;
        if (!p.description.empty()) item["description"] = p.description;
        params.push_back(std::move(item));
    }

    nlohmann::ordered_json out;
    out["name"] = name;
    out["description"] = description;
    out["server"] = serverName;
    out["parameters"] = std::move(params);
    return out;
}
