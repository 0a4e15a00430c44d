#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "core/ConfigManager.h"
#include "crawl/HtmlExtractor.h"
#include "crawl/PageFetcher.h"
#include "server/CalendarTools.h"
#include "server/CrawlerTools.h"
#include "server/McpServer.h"
#include "server/MemoryTools.h"
#include "server/SseServer.h"
#include "server/TaskTools.h"
#include "server/ToolHost.h"
#include "utils/Logger.h"

namespace {
std::atomic<bool> g_stop{false};

void onSignal(int) {
    g_stop = true;
}
} // namespace

int main(int argc, char* argv[]) {
    std::string configPath = argc >= 2 ? argv[1] : "switchboard-server.json";

    Config cfg;
    try {
        cfg = Config::load(configPath);
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }

    Logger::getInstance().setLogFile(cfg.logging.file);
    Logger::getInstance().setDebugEnabled(cfg.logging.debug);

    ToolHost host;
    std::string name = "switchboard";
    for (const auto& toolset : cfg.serve.toolsets) {
        if (toolset == "crawler") {
            auto env = std::make_shared<CrawlerEnvironment>();
            env->fetcher = std::make_shared<HttpPageFetcher>(cfg.crawl.fetchTimeoutS);
            env->extractor = std::make_shared<HtmlExtractor>();
            env->clock = std::make_shared<CrawlClock>();
            env->defaults = cfg.crawl;
            registerCrawlerTools(host, env);
        } else if (toolset == "tasks") {
            registerTaskTools(host, std::make_shared<TaskStore>(cfg.serve.tasksDir));
        } else if (toolset == "calendar") {
            registerCalendarTools(host, cfg.serve.eventsFile);
        } else if (toolset == "memory") {
            registerMemoryTools(host, std::make_shared<FileMemoryStore>(cfg.serve.memoryDir));
        } else {
            std::cerr << "Unknown toolset '" << toolset << "' (expected crawler, tasks, calendar or memory)" << std::endl;
            return 1;
        }
        name += "-" + toolset;
    }
    if (host.getToolCount() == 0) {
        std::cerr << "No toolsets enabled in " << configPath << std::endl;
        return 1;
    }

    McpServer mcp(host, name);
    SseServer::Options options;
    options.host = cfg.serve.host;
    options.port = cfg.serve.port;
    options.apiKey = cfg.serve.apiKey;

    SseServer server(mcp, options);
    if (!server.start()) {
        Logger::getInstance().error("Could not listen on " + options.host + ":" + std::to_string(options.port));
        return 1;
    }
    Logger::getInstance().info(std::to_string(host.getToolCount()) + " tools available");

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    Logger::getInstance().info("Shutting down");
    server.stop();
    return 0;
}
