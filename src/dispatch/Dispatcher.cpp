#include "dispatch/Dispatcher.h"
#include "dispatch/ArgumentValidator.h"
#include "utils/Logger.h"

Dispatcher::Dispatcher(OrchestrationContext& context) : ctx(context) {}

uint64_t Dispatcher::nextCorrelationId() {
    std::lock_guard<std::mutex> lock(mtx);
    uint64_t id = ++counter;
    // Caller-chosen ids the counter has now passed are spent; forget them
    while (seenAbove.erase(id)) {
        id = ++counter;
    }
    issued.insert(id);
    return id;
}

DispatchRequest Dispatcher::makeRequest(const std::string& toolName, ArgumentMap arguments) {
    DispatchRequest req;
    req.toolName = toolName;
    req.arguments = arguments.is_null() ? ArgumentMap::object() : std::move(arguments);
    req.correlationId = nextCorrelationId();
    req.deadline = DispatchClock::now() + ctx.callTimeout;
    return req;
}

DispatchResult Dispatcher::dispatch(const DispatchRequest& request) {
    const uint64_t id = request.correlationId;

    auto token = CancellationToken::create();
    {
        std::lock_guard<std::mutex> lock(mtx);
        bool fresh = id <= counter ? issued.erase(id) > 0 : seenAbove.insert(id).second;
        if (!fresh) {
            return DispatchResult::failure(id, ErrorKind::DuplicateRequest,
                "correlation id " + std::to_string(id) + " was already used");
        }
        inFlight[id] = token;
    }

    DispatchResult result;
    try {
        result = dispatchResolved(request, token);
    } catch (const std::exception& e) {
        result = DispatchResult::failure(id, ErrorKind::RemoteError, std::string("dispatch failed: ") + e.what());
    }
    finish(id);

    if (!result.ok) {
        Logger::getInstance().warn("Call #" + std::to_string(id) + " " + request.toolName + " failed [" +
                                   errorKindName(result.errorKind) + "]: " + result.message);
    }
    return result;
}

DispatchResult Dispatcher::dispatchResolved(const DispatchRequest& request,
                                            const std::shared_ptr<CancellationToken>& token) {
    const uint64_t id = request.correlationId;

    auto tool = ctx.registry.resolve(request.toolName);
    if (!tool) {
        return DispatchResult::failure(id, ErrorKind::UnknownTool, "no server exposes tool '" + request.toolName + "'");
    }

    if (auto error = ArgumentValidator::validate(*tool, request.arguments)) {
        return DispatchResult::failure(id, ErrorKind::InvalidArguments, *error);
    }

    auto endpoint = tool->endpoint.lock();
    if (!endpoint) {
        return DispatchResult::failure(id, ErrorKind::EndpointUnavailable,
            "endpoint '" + tool->serverName + "' owning '" + request.toolName + "' is gone");
    }
    if (endpoint->state == ConnectionState::Failed) {
        return DispatchResult::failure(id, ErrorKind::EndpointUnavailable,
            "endpoint '" + endpoint->name + "' is marked failed");
    }

    ISession* session = ctx.sessions.find(endpoint->name);
    if (!session) {
        return DispatchResult::failure(id, ErrorKind::EndpointUnavailable,
            "no session for endpoint '" + endpoint->name + "'");
    }

    DispatchRequest outgoing = request;
    if (outgoing.arguments.is_null()) outgoing.arguments = ArgumentMap::object();

    Logger::getInstance().debug("Call #" + std::to_string(id) + " " + request.toolName + " -> " + endpoint->name);
    DispatchResult result = session->call(outgoing, token);
    // Sessions echo the id; never let a misbehaving one break that
    result.correlationId = id;
    return result;
}

void Dispatcher::finish(uint64_t correlationId) {
    std::lock_guard<std::mutex> lock(mtx);
    inFlight.erase(correlationId);
}

bool Dispatcher::cancel(uint64_t correlationId) {
    std::lock_guard<std::mutex> lock(mtx);
    auto it = inFlight.find(correlationId);
    if (it == inFlight.end()) return false;
    it->second->cancel();
    return true;
}

std::vector<DispatchResult> Dispatcher::dispatchPlan(const std::vector<PlannedCall>& plan) {
    std::vector<DispatchResult> results;
    results.reserve(plan.size());
    for (const auto& step : plan) {
        results.push_back(dispatch(makeRequest(step.toolName, step.arguments)));
    }
    return results;
}

size_t Dispatcher::trackedIdCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return issued.size() + seenAbove.size();
}

size_t Dispatcher::inFlightCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return inFlight.size();
}
