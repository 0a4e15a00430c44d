#pragma once
#include <string>
#include <vector>
#include <map>
#include <fstream>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>

struct Config {
    struct LLM {
        std::string apiKey;
        std::string baseUrl = "https://api.openai.com/v1";
        std::string model = "gpt-4o-mini";
        std::string systemRole;
    } llm;

    struct Server {
        std::string name;
        std::string scheme = "http";
        std::string host = "localhost";
        int port = 80;
        std::string apiKey;
    };
    // logical server name -> endpoint settings
    std::map<std::string, Server> servers;

    struct Transport {
        int connectTimeoutMs = 5000;
        int callTimeoutMs = 30000;
        int maxReconnectAttempts = 5;
        int backoffInitialMs = 1000;
        int backoffMaxMs = 30000;
        int streamReadTimeoutS = 300;
    } transport;

    struct Crawl {
        int maxDepth = 2;
        double rateLimitPerSecond = 1.0;
        int maxPages = 50;
        int fetchTimeoutS = 15;
    } crawl;

    struct Logging {
        std::string file = "switchboard.log";
        bool debug = false;
    } logging;

    // switchboard-server only
    struct Serve {
        std::string host = "localhost";
        int port = 3006;
        std::string apiKey;
        std::vector<std::string> toolsets = {"crawler", "tasks", "calendar", "memory"};
        std::string tasksDir = "tasks";
        std::string memoryDir = "memories";
        std::string eventsFile;
    } serve;

    static Config parse(const nlohmann::json& j) {
        Config cfg;
        if (j.contains("llm")) {
            const auto& l = j.at("llm");
            cfg.llm.apiKey = l.value("api_key", "");
            cfg.llm.baseUrl = l.value("base_url", cfg.llm.baseUrl);
            cfg.llm.model = l.value("model", cfg.llm.model);
            cfg.llm.systemRole = l.value("system_role", "");
        }

        if (j.contains("servers")) {
            for (const auto& [name, item] : j.at("servers").items()) {
                Server server;
                server.name = name;
                server.scheme = item.value("scheme", "http");
                server.host = item.at("host").get<std::string>();
                server.port = item.at("port").get<int>();
                server.apiKey = item.value("api_key", "");
                if (server.scheme != "http" && server.scheme != "https") {
                    throw std::runtime_error("Server '" + name + "' has unsupported scheme: " + server.scheme);
                }
                cfg.servers[name] = std::move(server);
            }
        }

        if (j.contains("transport")) {
            const auto& t = j.at("transport");
            cfg.transport.connectTimeoutMs = t.value("connect_timeout_ms", cfg.transport.connectTimeoutMs);
            cfg.transport.callTimeoutMs = t.value("call_timeout_ms", cfg.transport.callTimeoutMs);
            cfg.transport.maxReconnectAttempts = t.value("max_reconnect_attempts", cfg.transport.maxReconnectAttempts);
            cfg.transport.backoffInitialMs = t.value("backoff_initial_ms", cfg.transport.backoffInitialMs);
            cfg.transport.backoffMaxMs = t.value("backoff_max_ms", cfg.transport.backoffMaxMs);
            cfg.transport.streamReadTimeoutS = t.value("stream_read_timeout_s", cfg.transport.streamReadTimeoutS);
        }

        if (j.contains("crawl")) {
            const auto& c = j.at("crawl");
            cfg.crawl.maxDepth = c.value("max_depth", cfg.crawl.maxDepth);
            cfg.crawl.rateLimitPerSecond = c.value("rate_limit_per_second", cfg.crawl.rateLimitPerSecond);
            cfg.crawl.maxPages = c.value("max_pages", cfg.crawl.maxPages);
            cfg.crawl.fetchTimeoutS = c.value("fetch_timeout_s", cfg.crawl.fetchTimeoutS);
        }

        if (j.contains("logging")) {
            cfg.logging.file = j["logging"].value("file", cfg.logging.file);
            cfg.logging.debug = j["logging"].value("debug", false);
        }

        if (j.contains("serve")) {
            const auto& s = j.at("serve");
            cfg.serve.host = s.value("host", cfg.serve.host);
            cfg.serve.port = s.value("port", cfg.serve.port);
            cfg.serve.apiKey = s.value("api_key", "");
            if (s.contains("toolsets")) {
                cfg.serve.toolsets = s["toolsets"].get<std::vector<std::string>>();
            }
            cfg.serve.tasksDir = s.value("tasks_dir", cfg.serve.tasksDir);
            cfg.serve.memoryDir = s.value("memory_dir", cfg.serve.memoryDir);
            cfg.serve.eventsFile = s.value("events_file", "");
        }

        return cfg;
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }

        try {
            return parse(j);
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error("Invalid config " + path.string() + ": " + e.what());
        }
    }
};
