#include "transport/TransportSession.h"
#include "utils/Logger.h"
#include <algorithm>

namespace {
    template <typename Json>
    std::string errorText(const Json& error) {
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            return error["message"].template get<std::string>();
        }
        return error.dump();
    }

    // Joins the text parts of an MCP tool result
    std::string contentText(const nlohmann::json& result) {
        std::string text;
        if (result.contains("content") && result["content"].is_array()) {
            for (const auto& part : result["content"]) {
                if (part.is_object() && part.contains("text") && part["text"].is_string()) {
                    if (!text.empty()) text += "\n";
                    text += part["text"].get<std::string>();
                }
            }
        }
        return text.empty() ? result.dump() : text;
    }

    // Parses a JSON-RPC response and returns its "result", throwing RemoteError on an error reply
    template <typename Json>
    Json resultOf(const std::string& method, const std::string& raw) {
        Json response;
        try {
            response = Json::parse(raw);
        } catch (const nlohmann::json::parse_error& e) {
            throw TransportError(ErrorKind::RemoteError, method + " returned malformed JSON: " + e.what());
        }
        if (response.contains("error")) {
            throw TransportError(ErrorKind::RemoteError, method + " failed: " + errorText(response["error"]));
        }
        if (response.contains("result")) return response["result"];
        return Json::object();
    }

    DispatchResult interpretResponse(uint64_t id, const std::string& raw) {
        nlohmann::json response = nlohmann::json::parse(raw, nullptr, false);
        if (response.is_discarded()) {
            return DispatchResult::failure(id, ErrorKind::RemoteError, "malformed response");
        }
        if (response.contains("error")) {
            return DispatchResult::failure(id, ErrorKind::RemoteError, errorText(response["error"]));
        }
        nlohmann::json result = response.contains("result") ? response["result"] : nlohmann::json(nullptr);
        if (result.is_object() && result.value("isError", false)) {
            return DispatchResult::failure(id, ErrorKind::RemoteError, contentText(result));
        }
        return DispatchResult::success(id, std::move(result));
    }
}

TransportSession::TransportSession(std::shared_ptr<ServerEndpoint> endpoint,
                                   ChannelFactory factory,
                                   TransportOptions options,
                                   Sleeper sleeper)
    : ep(std::move(endpoint)), channelFactory(std::move(factory)), opts(options), sleeper(std::move(sleeper)) {}

TransportSession::~TransportSession() {
    close();
}

std::chrono::milliseconds TransportSession::backoffDelay(int attempt, const TransportOptions& options) {
    long long delay = options.backoffInitialMs;
    for (int i = 1; i < attempt && delay < options.backoffMaxMs; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<long long>(delay, options.backoffMaxMs));
}

void TransportSession::connect() {
    if (closed) {
        throw TransportError(ErrorKind::EndpointUnavailable, "session to '" + ep->name + "' is closed");
    }
    if (ep->apiKey.empty()) {
        ep->state = ConnectionState::Failed;
        throw TransportError(ErrorKind::AuthError, "no api key configured for endpoint '" + ep->name + "'");
    }
    connectWithRetry("connect");
}

void TransportSession::connectWithRetry(const std::string& phase) {
    ep->state = ConnectionState::Connecting;
    const int attempts = std::max(1, opts.maxReconnectAttempts);
    std::string lastError;

    for (int attempt = 1; attempt <= attempts && !closed; ++attempt) {
        try {
            openChannel();
            ep->state = ConnectionState::Connected;
            Logger::getInstance().success("Endpoint '" + ep->name + "' connected (" + ep->baseUrl() + ")");
            return;
        } catch (const TransportError& e) {
            if (e.kind() == ErrorKind::AuthError) {
                ep->state = ConnectionState::Failed;
                Logger::getInstance().error("Endpoint '" + ep->name + "': " + e.what());
                throw;
            }
            lastError = e.what();
            Logger::getInstance().warn(phase + " attempt " + std::to_string(attempt) + "/" +
                                       std::to_string(attempts) + " to '" + ep->name + "' failed: " + lastError);
            if (attempt < attempts) {
                pause(backoffDelay(attempt, opts));
            }
        }
    }

    ep->state = closed ? ConnectionState::Disconnected : ConnectionState::Failed;
    throw TransportError(ErrorKind::ConnectionError,
        "endpoint '" + ep->name + "' unreachable after " + std::to_string(attempts) + " attempts: " + lastError);
}

void TransportSession::openChannel() {
    std::shared_ptr<IChannel> ch = channelFactory(*ep);
    const uint64_t gen = ++generation;

    ch->open(
        [this, gen](const SseEvent& ev) { if (generation == gen) handleMessage(ev); },
        [this, gen](const std::string& reason) { if (generation == gen) handleDrop(reason); });

    {
        std::lock_guard<std::mutex> lock(channelMutex);
        if (closed) {
            ch->close();
            throw TransportError(ErrorKind::ConnectionError, "session to '" + ep->name + "' is closed");
        }
        channel = ch;
    }

    try {
        nlohmann::json params = {
            {"protocolVersion", "2024-11-05"},
            {"capabilities", nlohmann::json::object()},
            {"clientInfo", {{"name", "switchboard"}, {"version", "1.0.0"}}}
        };
        resultOf<nlohmann::json>("initialize",
            request("initialize", params, std::chrono::milliseconds(opts.connectTimeoutMs)));
        notify("notifications/initialized", nlohmann::json::object());
    } catch (const TransportError&) {
        {
            std::lock_guard<std::mutex> lock(channelMutex);
            if (channel == ch) channel.reset();
        }
        ch->close();
        throw;
    }
}

void TransportSession::pause(std::chrono::milliseconds delay) {
    if (sleeper) {
        sleeper(delay);
        return;
    }
    std::unique_lock<std::mutex> lock(sleepMutex);
    sleepCv.wait_for(lock, delay, [this]() { return closed.load(); });
}

nlohmann::ordered_json TransportSession::listTools() {
    ConnectionState state = ep->state;
    if (state == ConnectionState::Failed) {
        throw TransportError(ErrorKind::EndpointUnavailable, "endpoint '" + ep->name + "' is marked failed");
    }
    if (state != ConnectionState::Connected) {
        throw TransportError(ErrorKind::ConnectionError,
            "endpoint '" + ep->name + "' is " + connectionStateName(state));
    }

    nlohmann::ordered_json tools = nlohmann::ordered_json::array();
    nlohmann::json params = nlohmann::json::object();
    // Follow nextCursor pagination until the catalog is complete
    while (true) {
        auto page = resultOf<nlohmann::ordered_json>("tools/list",
            request("tools/list", params, std::chrono::milliseconds(opts.callTimeoutMs)));
        if (page.contains("tools") && page["tools"].is_array()) {
            for (auto& t : page["tools"]) tools.push_back(t);
        }
        if (!page.contains("nextCursor") || !page["nextCursor"].is_string()) break;
        params["cursor"] = page["nextCursor"].get<std::string>();
    }
    nlohmann::ordered_json catalog = nlohmann::ordered_json::object();
    catalog["tools"] = std::move(tools);
    return catalog;
}

DispatchResult TransportSession::call(const DispatchRequest& req, const std::shared_ptr<CancellationToken>& cancel) {
    const uint64_t id = req.correlationId;

    if (closed) {
        return DispatchResult::failure(id, ErrorKind::EndpointUnavailable, "session to '" + ep->name + "' is closed");
    }
    if (ep->apiKey.empty()) {
        return DispatchResult::failure(id, ErrorKind::AuthError, "no api key configured for endpoint '" + ep->name + "'");
    }
    ConnectionState state = ep->state;
    if (state == ConnectionState::Failed) {
        return DispatchResult::failure(id, ErrorKind::EndpointUnavailable, "endpoint '" + ep->name + "' is marked failed");
    }
    if (state != ConnectionState::Connected) {
        return DispatchResult::failure(id, ErrorKind::ConnectionError,
            "endpoint '" + ep->name + "' is " + connectionStateName(state));
    }
    if (DispatchClock::now() >= req.deadline) {
        return DispatchResult::failure(id, ErrorKind::Timeout, "deadline already passed");
    }

    const std::string key = nlohmann::json(id).dump();
    std::future<std::string> future;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        if (pending.count(key)) {
            return DispatchResult::failure(id, ErrorKind::DuplicateRequest,
                "correlation id " + key + " already in flight");
        }
        future = pending[key].get_future();
    }

    nlohmann::ordered_json message = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", "tools/call"},
        {"params", {{"name", req.toolName}, {"arguments", req.arguments}}}
    };

    try {
        send(message.dump());
        std::string response = awaitResponse(key, future, req.deadline, cancel);
        return interpretResponse(id, response);
    } catch (const TransportError& e) {
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            pending.erase(key);
        }
        if (e.kind() == ErrorKind::AuthError) {
            ep->state = ConnectionState::Failed;
            Logger::getInstance().error("Endpoint '" + ep->name + "' marked failed: " + e.what());
        }
        return DispatchResult::failure(id, e.kind(), e.what());
    }
}

std::string TransportSession::request(const std::string& method, const nlohmann::json& params,
                                      std::chrono::milliseconds timeout) {
    nlohmann::json id = "sb-" + std::to_string(++internalIds);
    const std::string key = id.dump();

    std::future<std::string> future;
    {
        std::lock_guard<std::mutex> lock(pendingMutex);
        future = pending[key].get_future();
    }

    nlohmann::json message = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    };

    try {
        send(message.dump());
        return awaitResponse(key, future, DispatchClock::now() + timeout, nullptr);
    } catch (const TransportError&) {
        std::lock_guard<std::mutex> lock(pendingMutex);
        pending.erase(key);
        throw;
    }
}

void TransportSession::notify(const std::string& method, const nlohmann::json& params) {
    nlohmann::json message = {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params}
    };
    send(message.dump());
}

void TransportSession::send(const std::string& body) {
    std::shared_ptr<IChannel> ch;
    {
        std::lock_guard<std::mutex> lock(channelMutex);
        ch = channel;
    }
    if (!ch) {
        throw TransportError(ErrorKind::ConnectionError, "no open channel to '" + ep->name + "'");
    }
    ch->post(body);
}

std::string TransportSession::awaitResponse(const std::string& key, std::future<std::string>& future,
                                            DispatchClock::time_point deadline,
                                               const std::shared_ptr<CancellationToken>& cancel) {
    const auto slice = std::chrono::milliseconds(50);
    while (true) {
        auto now = DispatchClock::now();
        if (cancel && cancel->isCancelled()) {
            // A response arriving later finds no pending entry and is discarded
            std::lock_guard<std::mutex> lock(pendingMutex);
            pending.erase(key);
            throw TransportError(ErrorKind::Cancelled, "call cancelled by caller");
        }
        if (now >= deadline) {
            std::lock_guard<std::mutex> lock(pendingMutex);
            pending.erase(key);
            throw TransportError(ErrorKind::Timeout, "no response from '" + ep->name + "' before deadline");
        }
        auto wait = std::min<DispatchClock::duration>(deadline - now, slice);
        if (future.wait_for(wait) == std::future_status::ready) {
            return future.get();
        }
    }
}

void TransportSession::handleMessage(const SseEvent& event) {
    nlohmann::json msg;
    try {
        msg = nlohmann::json::parse(event.data);
    } catch (const nlohmann::json::parse_error& e) {
        if (event.event != "message") {
            publish({event.event, event.data});
        } else {
            Logger::getInstance().warn("Malformed message from '" + ep->name + "': " + e.what());
        }
        return;
    }

    bool isResponse = msg.is_object() && msg.contains("id") && !msg.contains("method") &&
                      (msg.contains("result") || msg.contains("error"));
    if (isResponse) {
        const std::string key = msg["id"].dump();
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pending.find(key);
        if (it != pending.end()) {
            it->second.set_value(event.data);
            pending.erase(it);
        } else {
            Logger::getInstance().debug("Discarding response " + key + " from '" + ep->name + "' (no waiter)");
        }
        return;
    }

    if (msg.is_object() && msg.contains("method") && msg["method"].is_string()) {
        publish({msg["method"].get<std::string>(), msg.value("params", nlohmann::json::object())});
    } else {
        publish({event.event, std::move(msg)});
    }
}

void TransportSession::handleDrop(const std::string& reason) {
    if (closed) return;

    const std::string message = "connection to '" + ep->name + "' dropped: " + reason;
    ConnectionState expected = ConnectionState::Connected;
    if (!ep->state.compare_exchange_strong(expected, ConnectionState::Connecting)) {
        // A connect loop already owns recovery
        failPending(ErrorKind::ConnectionError, message);
        return;
    }

    Logger::getInstance().warn(message + ", reconnecting");
    failPending(ErrorKind::ConnectionError, message);

    std::lock_guard<std::mutex> lock(reconnectMutex);
    if (closed) return;
    if (reconnectThread.joinable()) reconnectThread.join();
    reconnectThread = std::thread([this]() { reconnectLoop(); });
}

void TransportSession::reconnectLoop() {
    std::shared_ptr<IChannel> old;
    {
        std::lock_guard<std::mutex> lock(channelMutex);
        old = std::move(channel);
        channel.reset();
    }
    if (old) old->close();

    try {
        connectWithRetry("reconnect");
    } catch (const TransportError& e) {
        Logger::getInstance().error("Endpoint '" + ep->name + "' marked failed: " + e.what());
        closeSubscribers();
    }
}

void TransportSession::failPending(ErrorKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lock(pendingMutex);
    for (auto& [key, promise] : pending) {
        promise.set_exception(std::make_exception_ptr(TransportError(kind, message)));
    }
    pending.clear();
}

std::shared_ptr<EventSubscription> TransportSession::subscribe() {
    auto sub = std::make_shared<EventSubscription>();
    if (closed || ep->state == ConnectionState::Failed) {
        sub->close();
        return sub;
    }
    std::lock_guard<std::mutex> lock(subsMutex);
    subscribers.push_back(sub);
    return sub;
}

void TransportSession::publish(SessionEvent event) {
    std::lock_guard<std::mutex> lock(subsMutex);
    subscribers.erase(std::remove_if(subscribers.begin(), subscribers.end(),
        [](const std::weak_ptr<EventSubscription>& w) {
            auto s = w.lock();
            return !s || !s->isActive();
        }), subscribers.end());

    for (auto& weak : subscribers) {
        if (auto sub = weak.lock()) {
            sub->push(event);
        }
    }
}

void TransportSession::closeSubscribers() {
    std::lock_guard<std::mutex> lock(subsMutex);
    for (auto& weak : subscribers) {
        if (auto sub = weak.lock()) sub->close();
    }
    subscribers.clear();
}

void TransportSession::close() {
    if (closed.exchange(true)) return;
    sleepCv.notify_all();
    ++generation;

    std::shared_ptr<IChannel> ch;
    {
        std::lock_guard<std::mutex> lock(channelMutex);
        ch = std::move(channel);
        channel.reset();
    }
    if (ch) ch->close();

    {
        std::lock_guard<std::mutex> lock(reconnectMutex);
        if (reconnectThread.joinable()) reconnectThread.join();
    }

    failPending(ErrorKind::ConnectionError, "session to '" + ep->name + "' closed");
    closeSubscribers();
    if (ep->state != ConnectionState::Failed) {
        ep->state = ConnectionState::Disconnected;
    }
}
