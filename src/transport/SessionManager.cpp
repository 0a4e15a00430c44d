#include "transport/SessionManager.h"
#include "transport/TransportSession.h"
#include "transport/HttpSseChannel.h"
#include "utils/Logger.h"
#include <future>

SessionManager::SessionManager(TransportOptions options, ChannelFactory factory)
    : options(options), channelFactory(factory ? std::move(factory) : HttpSseChannel::factory(options)) {}

SessionManager::~SessionManager() {
    shutdown();
}

std::shared_ptr<ServerEndpoint> SessionManager::addEndpoint(const Config::Server& server) {
    auto endpoint = std::make_shared<ServerEndpoint>(server.name, server.scheme, server.host, server.port, server.apiKey);
    auto session = std::make_unique<TransportSession>(endpoint, channelFactory, options);

    std::lock_guard<std::mutex> lock(mtx);
    if (sessions.count(server.name)) {
        Logger::getInstance().warn("Endpoint '" + server.name + "' configured twice, replacing the earlier one");
    }
    sessions[server.name] = std::move(session);
    return endpoint;
}

void SessionManager::addSession(std::unique_ptr<ISession> session) {
    if (!session) return;
    std::string name = session->endpoint()->name;
    std::lock_guard<std::mutex> lock(mtx);
    sessions[name] = std::move(session);
}

int SessionManager::connectAll() {
    std::vector<std::pair<std::string, std::future<bool>>> futures;
    {
        std::lock_guard<std::mutex> lock(mtx);
        for (auto& [name, session] : sessions) {
            ISession* s = session.get();
            futures.push_back({name, std::async(std::launch::async, [s]() {
                try {
                    s->connect();
                    return true;
                } catch (const TransportError& e) {
                    Logger::getInstance().error("Endpoint '" + s->endpoint()->name + "' unavailable [" +
                                                errorKindName(e.kind()) + "]: " + e.what());
                    return false;
                } catch (const std::exception& e) {
                    s->endpoint()->state = ConnectionState::Failed;
                    Logger::getInstance().error("Endpoint '" + s->endpoint()->name + "' failed to connect: " + e.what());
                    return false;
                }
            })});
        }
    }

    int count = 0;
    for (auto& f : futures) {
        if (f.second.get()) {
            count++;
        }
    }
    Logger::getInstance().info("Connected " + std::to_string(count) + "/" + std::to_string(futures.size()) + " endpoints");
    return count;
}

ISession* SessionManager::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(name);
    return it == sessions.end() ? nullptr : it->second.get();
}

std::vector<std::shared_ptr<ServerEndpoint>> SessionManager::endpoints() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::shared_ptr<ServerEndpoint>> out;
    for (const auto& [name, session] : sessions) {
        out.push_back(session->endpoint());
    }
    return out;
}

std::vector<ISession*> SessionManager::connectedSessions() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<ISession*> out;
    for (const auto& [name, session] : sessions) {
        if (session->endpoint()->state == ConnectionState::Connected) {
            out.push_back(session.get());
        }
    }
    return out;
}

void SessionManager::shutdown() {
    std::map<std::string, std::unique_ptr<ISession>> closing;
    {
        std::lock_guard<std::mutex> lock(mtx);
        closing.swap(sessions);
    }
    for (auto& [name, session] : closing) {
        session->close();
    }
}
