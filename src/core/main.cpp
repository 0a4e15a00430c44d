#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <filesystem>
#include "core/ConfigManager.h"
#include "core/LLMClient.h"
#include "dispatch/Dispatcher.h"
#include "dispatch/OrchestrationContext.h"
#include "registry/ToolRegistry.h"
#include "router/IntentRouter.h"
#include "router/LLMIntentClassifier.h"
#include "transport/SessionManager.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

// ANSI Color Codes
const std::string RESET = "\033[0m";
const std::string BOLD = "\033[1m";
const std::string CYAN = "\033[38;5;51m";
const std::string GRAY = "\033[38;5;242m";
const std::string GREEN = "\033[38;5;46m";
const std::string YELLOW = "\033[38;5;226m";

namespace {

void printTools(const ToolRegistry& registry) {
    auto snap = registry.snapshot();
    if (snap->tools.empty()) {
        std::cout << YELLOW << "  (no tools registered)" << RESET << std::endl;
        return;
    }
    for (const auto& [name, tool] : snap->tools) {
        std::cout << "  " << CYAN << BOLD << name << RESET << GRAY << " @" << tool.serverName << RESET;
        std::string params;
        for (const auto& p : tool.parameters) {
            params += (params.empty() ? "" : ", ") + p.name + (p.required ? "" : "?") +
                      (p.type.empty() ? "" : ": " + p.type);
        }
        std::cout << "(" << params << ")" << std::endl;
        if (!tool.description.empty()) {
            std::cout << GRAY << "      " << tool.description << RESET << std::endl;
        }
    }
    for (const auto& c : snap->collisions) {
        std::cout << YELLOW << "  ! " << c.toolName << " from '" << c.shadowedServer
                  << "' is shadowed by '" << c.winningServer << "'" << RESET << std::endl;
    }
}

// Forwards server-pushed notifications to the log until the subscription ends
std::thread watchEvents(std::shared_ptr<EventSubscription> sub, std::string server) {
    return std::thread([sub, server]() {
        while (auto event = sub->next()) {
            Logger::getInstance().info("[" + server + "] " + event->type + " " + event->payload.dump());
        }
    });
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = "switchboard.json";
    if (argc >= 2) {
        configPath = argv[1];
    }

    Config cfg;
    try {
        cfg = Config::load(configPath);
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }

    Logger::getInstance().setLogFile(cfg.logging.file);
    Logger::getInstance().setDebugEnabled(cfg.logging.debug);

    if (cfg.servers.empty()) {
        std::cerr << "Config " << fs::u8path(configPath).u8string() << " lists no servers" << std::endl;
        return 1;
    }

    TransportOptions transport;
    transport.connectTimeoutMs = cfg.transport.connectTimeoutMs;
    transport.callTimeoutMs = cfg.transport.callTimeoutMs;
    transport.maxReconnectAttempts = cfg.transport.maxReconnectAttempts;
    transport.backoffInitialMs = cfg.transport.backoffInitialMs;
    transport.backoffMaxMs = cfg.transport.backoffMaxMs;
    transport.streamReadTimeoutS = cfg.transport.streamReadTimeoutS;

    SessionManager sessions(transport);
    for (const auto& [name, server] : cfg.servers) {
        sessions.addEndpoint(server);
    }

    std::cout << BOLD << "switchboard" << RESET << GRAY << "  connecting to " << cfg.servers.size()
              << " servers..." << RESET << std::endl;
    sessions.connectAll();

    ToolRegistry registry;
    registry.refreshAll(sessions);

    std::vector<std::shared_ptr<EventSubscription>> subscriptions;
    std::vector<std::thread> watchers;
    for (ISession* session : sessions.connectedSessions()) {
        auto sub = session->subscribe();
        subscriptions.push_back(sub);
        watchers.push_back(watchEvents(sub, session->endpoint()->name));
    }

    OrchestrationContext ctx(sessions, registry, std::chrono::milliseconds(cfg.transport.callTimeoutMs));
    Dispatcher dispatcher(ctx);
    LLMClient llm(cfg.llm.apiKey, cfg.llm.baseUrl, cfg.llm.model);
    LLMIntentClassifier classifier(llm);
    IntentRouter router(classifier);

    printTools(registry);
    std::cout << GRAY << "Commands: /tools  /refresh  /quit" << RESET << std::endl;

    std::string line;
    while (true) {
        std::cout << GREEN << "> " << RESET << std::flush;
        if (!std::getline(std::cin, line)) break;
        if (line.empty()) continue;

        if (line == "/quit" || line == "/exit") break;
        if (line == "/tools") {
            printTools(registry);
            continue;
        }
        if (line == "/refresh") {
            // Failed endpoints keep their tools so calls report EndpointUnavailable
            int ok = registry.refreshAll(sessions);
            std::cout << GRAY << "Refreshed " << ok << " endpoints, " << registry.size() << " tools" << RESET << std::endl;
            continue;
        }

        RouteResult route = router.route(line, registry);
        if (!route.ok) {
            std::cout << route.toJson().dump(2) << std::endl;
            continue;
        }
        if (route.calls.empty()) {
            std::string reply = llm.chat(line, cfg.llm.systemRole);
            std::cout << (reply.empty() ? "(no response from the language model)" : reply) << std::endl;
            continue;
        }

        for (const auto& result : dispatcher.dispatchPlan(route.calls)) {
            std::cout << result.toJson().dump(2) << std::endl;
        }
    }

    for (auto& sub : subscriptions) sub->cancel();
    sessions.shutdown();
    for (auto& w : watchers) {
        if (w.joinable()) w.join();
    }
    return 0;
}
