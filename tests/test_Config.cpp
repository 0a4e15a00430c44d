#include <gtest/gtest.h>
#include "core/ConfigManager.h"
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / fs::path("switchboard_config_test_" + std::to_string(now));
        fs::create_directories(testDir);
    }

    void TearDown() override {
        fs::remove_all(testDir);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = (testDir / name).string();
        std::ofstream f(path);
        f << content;
        return path;
    }

    fs::path testDir;
};

TEST_F(ConfigTest, OnlyServersRequiredEverythingElseDefaults) {
    auto path = write("min.json", R"({
        "servers": {"tasks": {"host": "localhost", "port": 8010, "api_key": "secret-key1"}}
    })");
    Config cfg = Config::load(path);

    ASSERT_EQ(cfg.servers.size(), 1u);
    const auto& tasks = cfg.servers.at("tasks");
    EXPECT_EQ(tasks.name, "tasks");
    EXPECT_EQ(tasks.scheme, "http");
    EXPECT_EQ(tasks.port, 8010);
    EXPECT_EQ(tasks.apiKey, "secret-key1");

    EXPECT_EQ(cfg.transport.backoffInitialMs, 1000);
    EXPECT_EQ(cfg.transport.backoffMaxMs, 30000);
    EXPECT_EQ(cfg.transport.maxReconnectAttempts, 5);
    EXPECT_EQ(cfg.crawl.maxDepth, 2);
    EXPECT_DOUBLE_EQ(cfg.crawl.rateLimitPerSecond, 1.0);
    EXPECT_EQ(cfg.crawl.maxPages, 50);
    EXPECT_EQ(cfg.logging.file, "switchboard.log");
    EXPECT_FALSE(cfg.logging.debug);
    EXPECT_EQ(cfg.llm.model, "gpt-4o-mini");
    EXPECT_EQ(cfg.serve.toolsets, (std::vector<std::string>{"crawler", "tasks", "calendar", "memory"}));
    EXPECT_EQ(cfg.serve.memoryDir, "memories");
}

TEST_F(ConfigTest, FullFileOverridesDefaults) {
    auto path = write("full.json", R"({
        "llm": {"api_key": "sk", "base_url": "http://localhost:11434/v1", "model": "llama3"},
        "servers": {
            "calendar": {"host": "cal.internal", "port": 443, "api_key": "k2", "scheme": "https"},
            "crawler": {"host": "127.0.0.1", "port": 8020, "api_key": "k3"}
        },
        "transport": {"connect_timeout_ms": 100, "call_timeout_ms": 200, "max_reconnect_attempts": 2,
                      "backoff_initial_ms": 10, "backoff_max_ms": 40},
        "crawl": {"max_depth": 1, "rate_limit_per_second": 4.5, "max_pages": 9, "fetch_timeout_s": 3},
        "logging": {"file": "", "debug": true},
        "serve": {"port": 9000, "api_key": "srv", "toolsets": ["tasks"], "tasks_dir": "/tmp/t",
                  "memory_dir": "/tmp/m"}
    })");
    Config cfg = Config::load(path);

    EXPECT_EQ(cfg.llm.baseUrl, "http://localhost:11434/v1");
    EXPECT_EQ(cfg.servers.at("calendar").scheme, "https");
    EXPECT_EQ(cfg.servers.at("crawler").host, "127.0.0.1");
    EXPECT_EQ(cfg.transport.connectTimeoutMs, 100);
    EXPECT_EQ(cfg.transport.maxReconnectAttempts, 2);
    EXPECT_EQ(cfg.transport.backoffMaxMs, 40);
    EXPECT_DOUBLE_EQ(cfg.crawl.rateLimitPerSecond, 4.5);
    EXPECT_EQ(cfg.crawl.fetchTimeoutS, 3);
    EXPECT_TRUE(cfg.logging.file.empty());
    EXPECT_TRUE(cfg.logging.debug);
    EXPECT_EQ(cfg.serve.port, 9000);
    ASSERT_EQ(cfg.serve.toolsets.size(), 1u);
    EXPECT_EQ(cfg.serve.toolsets[0], "tasks");
    EXPECT_EQ(cfg.serve.tasksDir, "/tmp/t");
    EXPECT_EQ(cfg.serve.memoryDir, "/tmp/m");
}

TEST_F(ConfigTest, ErrorsNameTheFile) {
    auto broken = write("broken.json", "{ not json");
    try {
        Config::load(broken);
        FAIL() << "expected a parse error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("broken.json"), std::string::npos);
    }

    auto missingPort = write("noport.json", R"({"servers": {"a": {"host": "h"}}})");
    EXPECT_THROW(Config::load(missingPort), std::runtime_error);

    EXPECT_THROW(Config::load((testDir / "absent.json").string()), std::runtime_error);
}

TEST_F(ConfigTest, RejectsUnknownScheme) {
    nlohmann::json j = {{"servers", {{"a", {{"host", "h"}, {"port", 1}, {"scheme", "ftp"}}}}}};
    EXPECT_THROW(Config::parse(j), std::runtime_error);
}
