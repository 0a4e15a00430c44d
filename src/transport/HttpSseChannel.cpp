#include "transport/HttpSseChannel.h"
#include "utils/Logger.h"
#include <httplib.h>
#include <chrono>

HttpSseChannel::HttpSseChannel(const ServerEndpoint& endpoint, const TransportOptions& options)
    : name(endpoint.name), baseUrl(endpoint.baseUrl()), apiKey(endpoint.apiKey), options(options) {}

HttpSseChannel::~HttpSseChannel() {
    close();
}

ChannelFactory HttpSseChannel::factory(const TransportOptions& options) {
    return [options](const ServerEndpoint& endpoint) -> std::unique_ptr<IChannel> {
        return std::make_unique<HttpSseChannel>(endpoint, options);
    };
}

void HttpSseChannel::open(MessageHandler onMessage, DropHandler onDrop) {
    messageHandler = std::move(onMessage);
    dropHandler = std::move(onDrop);

    streamClient = std::make_unique<httplib::Client>(baseUrl);
    streamClient->set_connection_timeout(std::chrono::milliseconds(options.connectTimeoutMs));
    streamClient->set_read_timeout(std::chrono::seconds(options.streamReadTimeoutS));
    streamClient->set_keep_alive(true);

    readerThread = std::thread([this]() { readLoop(); });

    std::unique_lock<std::mutex> lock(stateMutex);
    bool ready = stateCv.wait_for(lock, std::chrono::milliseconds(options.connectTimeoutMs),
                                  [this]() { return opened || openFailed; });
    if (ready && opened) return;

    ErrorKind kind = ready ? failureKind : ErrorKind::ConnectionError;
    std::string message = ready ? failureMessage
                                : "timed out waiting for endpoint event from '" + name + "'";
    lock.unlock();
    close();
    throw TransportError(kind, message);
}

void HttpSseChannel::readLoop() {
    httplib::Headers headers = {
        {"Authorization", "Bearer " + apiKey},
        {"Accept", "text/event-stream"},
        {"Cache-Control", "no-cache"}
    };

    SseParser parser([this](const SseEvent& ev) { onSseEvent(ev); });
    int status = 0;

    auto res = streamClient->Get("/sse", headers,
        [&](const httplib::Response& response) {
            status = response.status;
            return response.status == 200;
        },
        [&](const char* data, size_t length) {
            if (closing) return false;
            parser.feed(data, length);
            return !closing.load();
        });

    bool wasOpened;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        wasOpened = opened;
    }

    if (!wasOpened) {
        if (status == 401 || status == 403) {
            failOpen(ErrorKind::AuthError, "endpoint '" + name + "' rejected api key (HTTP " + std::to_string(status) + ")");
        } else if (status != 0 && status != 200) {
            failOpen(ErrorKind::ConnectionError, "endpoint '" + name + "' returned HTTP " + std::to_string(status));
        } else if (!res) {
            failOpen(ErrorKind::ConnectionError, "endpoint '" + name + "' unreachable: " + httplib::to_string(res.error()));
        } else {
            failOpen(ErrorKind::ConnectionError, "endpoint '" + name + "' closed the stream before announcing a call channel");
        }
        return;
    }

    if (!closing && dropHandler) {
        std::string reason = res ? "stream ended" : httplib::to_string(res.error());
        dropHandler(reason);
    }
}

void HttpSseChannel::onSseEvent(const SseEvent& event) {
    if (event.event == "endpoint") {
        std::string path = event.data;
        // Some servers announce an absolute URL; keep only the path part
        size_t scheme = path.find("://");
        if (scheme != std::string::npos) {
            size_t slash = path.find('/', scheme + 3);
            path = slash == std::string::npos ? "/" : path.substr(slash);
        }
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            messagesPath = path;
            opened = true;
        }
        stateCv.notify_all();
        return;
    }

    bool ready;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        ready = opened;
    }
    if (ready && messageHandler) {
        messageHandler(event);
    }
}

void HttpSseChannel::failOpen(ErrorKind kind, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        openFailed = true;
        failureKind = kind;
        failureMessage = message;
    }
    stateCv.notify_all();
}

void HttpSseChannel::post(const std::string& body) {
    std::string path;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        path = messagesPath;
    }
    if (path.empty() || closing) {
        throw TransportError(ErrorKind::ConnectionError, "call channel to '" + name + "' is not open");
    }

    httplib::Client cli(baseUrl);
    cli.set_connection_timeout(std::chrono::milliseconds(options.connectTimeoutMs));
    cli.set_read_timeout(std::chrono::milliseconds(options.callTimeoutMs));
    cli.set_write_timeout(std::chrono::milliseconds(options.callTimeoutMs));

    httplib::Headers headers = {
        {"Authorization", "Bearer " + apiKey}
    };

    auto res = cli.Post(path, headers, body, "application/json");
    if (!res) {
        throw TransportError(ErrorKind::ConnectionError,
            "post to '" + name + "' failed: " + httplib::to_string(res.error()));
    }
    if (res->status == 401 || res->status == 403) {
        throw TransportError(ErrorKind::AuthError,
            "endpoint '" + name + "' rejected api key (HTTP " + std::to_string(res->status) + ")");
    }
    if (res->status < 200 || res->status >= 300) {
        throw TransportError(ErrorKind::ConnectionError,
            "endpoint '" + name + "' refused message (HTTP " + std::to_string(res->status) + "): " + res->body);
    }
}

void HttpSseChannel::close() {
    closing = true;
    if (streamClient) {
        streamClient->stop();
    }
    if (readerThread.joinable()) {
        if (readerThread.get_id() == std::this_thread::get_id()) {
            readerThread.detach();
        } else {
            readerThread.join();
        }
    }
}
