#include "registry/ToolRegistry.h"
#include "transport/SessionManager.h"
#include "utils/Logger.h"
#include <algorithm>

ToolRegistry::ToolRegistry() : current(std::make_shared<RegistrySnapshot>()) {}

std::vector<ToolDescriptor> ToolRegistry::refresh(ISession& session) {
    auto endpoint = session.endpoint();
    const std::string name = endpoint ? endpoint->name : "";

    nlohmann::ordered_json catalog;
    try {
        catalog = session.listTools();
    } catch (const TransportError& e) {
        throw TransportError(ErrorKind::RegistryError,
            "catalog query to '" + name + "' failed [" + errorKindName(e.kind()) + "]: " + e.what());
    }

    if (!catalog.contains("tools") || !catalog["tools"].is_array()) {
        throw TransportError(ErrorKind::RegistryError, "catalog from '" + name + "' has no tools array");
    }

    std::vector<ToolDescriptor> tools;
    for (const auto& entry : catalog["tools"]) {
        try {
            tools.push_back(ToolDescriptor::fromCatalogEntry(entry, endpoint));
        } catch (const std::invalid_argument& e) {
            Logger::getInstance().warn("Skipping tool from '" + name + "': " + e.what());
        }
    }

    replace(endpoint, tools);
    Logger::getInstance().info("Registered " + std::to_string(tools.size()) + " tools from '" + name + "'");
    return tools;
}

void ToolRegistry::replace(const std::shared_ptr<ServerEndpoint>& endpoint, std::vector<ToolDescriptor> tools) {
    const std::string name = endpoint ? endpoint->name : "";

    std::lock_guard<std::mutex> lock(writeMutex);
    auto next = std::make_shared<RegistrySnapshot>(*std::atomic_load(&current));

    auto& order = next->endpointOrder;
    order.erase(std::remove(order.begin(), order.end(), name), order.end());
    order.push_back(name);
    next->byEndpoint[name] = std::move(tools);

    aggregate(*next);
    publish(std::move(next));
}

int ToolRegistry::refreshAll(SessionManager& sessions) {
    int ok = 0;
    for (ISession* session : sessions.connectedSessions()) {
        try {
            refresh(*session);
            ok++;
        } catch (const TransportError& e) {
            Logger::getInstance().warn(e.what());
        }
    }
    return ok;
}

void ToolRegistry::remove(const std::string& endpointName) {
    std::lock_guard<std::mutex> lock(writeMutex);
    auto base = std::atomic_load(&current);
    if (!base->byEndpoint.count(endpointName)) return;

    auto next = std::make_shared<RegistrySnapshot>(*base);
    next->byEndpoint.erase(endpointName);
    auto& order = next->endpointOrder;
    order.erase(std::remove(order.begin(), order.end(), endpointName), order.end());

    aggregate(*next);
    publish(std::move(next));
    Logger::getInstance().info("Removed tools of endpoint '" + endpointName + "'");
}

void ToolRegistry::aggregate(RegistrySnapshot& snap) {
    snap.tools.clear();
    snap.collisions.clear();
    for (const auto& server : snap.endpointOrder) {
        for (const auto& tool : snap.byEndpoint[server]) {
            auto it = snap.tools.find(tool.name);
            if (it != snap.tools.end()) {
                if (it->second.serverName != server) {
                    snap.collisions.push_back({tool.name, it->second.serverName, server});
                }
                it->second = tool;
            } else {
                snap.tools.emplace(tool.name, tool);
            }
        }
    }
}

void ToolRegistry::publish(std::shared_ptr<RegistrySnapshot> next) {
    auto previous = std::atomic_load(&current);
    next->version = previous->version + 1;
    for (const auto& c : next->collisions) {
        bool known = std::any_of(previous->collisions.begin(), previous->collisions.end(),
            [&c](const ToolCollision& p) {
                return p.toolName == c.toolName && p.shadowedServer == c.shadowedServer &&
                       p.winningServer == c.winningServer;
            });
        if (known) continue;
        Logger::getInstance().warn("Tool '" + c.toolName + "' from '" + c.winningServer +
                                   "' shadows the one from '" + c.shadowedServer + "'");
    }
    std::atomic_store(&current, std::shared_ptr<const RegistrySnapshot>(std::move(next)));
}

std::map<std::string, ToolDescriptor> ToolRegistry::allTools() const {
    return snapshot()->tools;
}

std::optional<ToolDescriptor> ToolRegistry::resolve(const std::string& name) const {
    auto snap = snapshot();
    auto it = snap->tools.find(name);
    if (it == snap->tools.end()) return std::nullopt;
    return it->second;
}

std::vector<ToolCollision> ToolRegistry::collisions() const {
    return snapshot()->collisions;
}

std::shared_ptr<const RegistrySnapshot> ToolRegistry::snapshot() const {
    return std::atomic_load(&current);
}
