#include "server/SseServer.h"
#include "transport/SseParser.h"
#include "utils/Logger.h"
#include <httplib.h>
#include <iomanip>
#include <random>
#include <sstream>

void SseServer::Session::push(std::string chunk) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (closed) return;
        outbox.push_back(std::move(chunk));
    }
    cv.notify_one();
}

bool SseServer::Session::next(std::string& chunk, std::chrono::seconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    cv.wait_for(lock, timeout, [this]() { return closed || !outbox.empty(); });
    if (outbox.empty()) return false;
    chunk = std::move(outbox.front());
    outbox.pop_front();
    return true;
}

void SseServer::Session::close() {
    {
        std::lock_guard<std::mutex> lock(mtx);
        closed = true;
    }
    cancel->cancel();
    cv.notify_all();
}

bool SseServer::Session::isClosed() const {
    std::lock_guard<std::mutex> lock(mtx);
    return closed;
}

SseServer::SseServer(McpServer& mcp, Options options)
    : mcp(mcp), opts(std::move(options)), http(std::make_unique<httplib::Server>()) {
    setupRoutes();
}

SseServer::~SseServer() {
    stop();
}

std::string SseServer::newSessionId() {
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::ostringstream out;
    out << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return out.str();
}

bool SseServer::authorized(const httplib::Request& req) const {
    return !opts.apiKey.empty() && req.get_header_value("Authorization") == "Bearer " + opts.apiKey;
}

std::shared_ptr<SseServer::Session> SseServer::findSession(const std::string& id) const {
    std::lock_guard<std::mutex> lock(sessionsMutex);
    auto it = sessions.find(id);
    return it == sessions.end() ? nullptr : it->second;
}

void SseServer::dropSession(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex);
        auto it = sessions.find(id);
        if (it == sessions.end()) return;
        session = it->second;
        sessions.erase(it);
    }
    session->close();
    Logger::getInstance().info("SSE session " + id + " closed");
}

size_t SseServer::sessionCount() const {
    std::lock_guard<std::mutex> lock(sessionsMutex);
    return sessions.size();
}

void SseServer::setupRoutes() {
    http->Get("/sse", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorized(req)) {
            Logger::getInstance().warn("Rejected /sse from " + req.remote_addr + ": bad api key");
            res.status = 401;
            res.set_content("Unauthorized", "text/plain");
            return;
        }

        auto session = std::make_shared<Session>(newSessionId());
        {
            std::lock_guard<std::mutex> lock(sessionsMutex);
            sessions[session->id] = session;
        }
        session->push(SseParser::format("endpoint", "/messages/?session_id=" + session->id));
        Logger::getInstance().info("SSE session " + session->id + " opened from " + req.remote_addr);

        const auto keepAlive = std::chrono::seconds(opts.keepAliveSeconds);
        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        res.set_chunked_content_provider(
            "text/event-stream",
            [session, keepAlive](size_t, httplib::DataSink& sink) {
                std::string chunk;
                if (session->next(chunk, keepAlive)) {
                    return sink.write(chunk.data(), chunk.size());
                }
                if (session->isClosed()) {
                    sink.done();
                    return true;
                }
                static const std::string ping = ": ping\n\n";
                return sink.write(ping.data(), ping.size());
            },
            [this, session](bool) {
                dropSession(session->id);
            });
    });

    auto onMessage = [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorized(req)) {
            res.status = 401;
            res.set_content("Unauthorized", "text/plain");
            return;
        }
        auto session = findSession(req.get_param_value("session_id"));
        if (!session) {
            res.status = 404;
            res.set_content("Could not find session", "text/plain");
            return;
        }
        res.status = 202;
        res.set_content("Accepted", "text/plain");
        submit(session, req.body);
    };
    http->Post("/messages/", onMessage);
    http->Post("/messages", onMessage);
}

void SseServer::submit(std::shared_ptr<Session> session, std::string body) {
    std::lock_guard<std::mutex> lock(workersMutex);
    // Reap finished calls
    for (auto it = workers.begin(); it != workers.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it = workers.erase(it);
        } else {
            ++it;
        }
    }

    workers.push_back(std::async(std::launch::async, [this, session, body = std::move(body)]() {
        ToolCallContext ctx;
        ctx.cancel = session->cancel;
        ctx.notify = [session](const std::string& method, const nlohmann::json& params) {
            nlohmann::json note = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
            session->push(SseParser::format("message", note.dump()));
        };

        try {
            auto reply = mcp.handleText(body, ctx);
            if (reply) session->push(SseParser::format("message", reply->dump()));
        } catch (const std::exception& e) {
            Logger::getInstance().error("Request on session " + session->id + " failed: " + e.what());
            auto id = nlohmann::json::parse(body, nullptr, false);
            nlohmann::json reqId = id.is_object() && id.contains("id") ? id["id"] : nlohmann::json(nullptr);
            session->push(SseParser::format("message", McpServer::makeError(reqId, -32603, e.what()).dump()));
        }
    }));
}

bool SseServer::bind() {
    if (opts.apiKey.empty()) {
        Logger::getInstance().error("Refusing to serve without an api key");
        return false;
    }
    if (opts.port == 0) {
        int port = http->bind_to_any_port(opts.host);
        if (port <= 0) return false;
        boundPort = port;
    } else {
        if (!http->bind_to_port(opts.host, opts.port)) return false;
        boundPort = opts.port;
    }
    Logger::getInstance().success("Serving MCP over SSE on http://" + opts.host + ":" + std::to_string(boundPort.load()) + "/sse");
    return true;
}

bool SseServer::start() {
    if (!bind()) return false;
    listenThread = std::thread([this]() { http->listen_after_bind(); });
    return true;
}

bool SseServer::run() {
    if (!bind()) return false;
    return http->listen_after_bind();
}

void SseServer::stop() {
    if (stopping.exchange(true)) return;

    std::map<std::string, std::shared_ptr<Session>> open;
    {
        std::lock_guard<std::mutex> lock(sessionsMutex);
        open = sessions;
    }
    for (auto& [id, session] : open) session->close();

    http->stop();
    if (listenThread.joinable()) listenThread.join();

    std::lock_guard<std::mutex> lock(workersMutex);
    for (auto& w : workers) w.wait();
    workers.clear();
}
