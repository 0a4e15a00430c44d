#pragma once
#include <memory>
#include <string>
#include "core/ConfigManager.h"
#include "crawl/CrawlEngine.h"
#include "server/ITool.h"

class ToolHost;

/**
 * @brief crawler 工具集共享的协作者与默认参数
 */
struct CrawlerEnvironment {
    std::shared_ptr<IPageFetcher> fetcher;
    std::shared_ptr<IHtmlExtractor> extractor;
    std::shared_ptr<CrawlClock> clock;
    Config::Crawl defaults;
};

/**
 * @brief crawl_site: 从种子 URL 做有界、限速的广度优先爬取
 *
 * 每得到一条记录就推送一次 notifications/crawl_record,
 * 最终结果包含全部记录与结束状态。
 */
class CrawlSiteTool : public ITool {
public:
    explicit CrawlSiteTool(std::shared_ptr<CrawlerEnvironment> env);

    std::string getName() const override { return "crawl_site"; }
    std::string getDescription() const override;
    nlohmann::ordered_json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) override;

    // Builds crawl options from tool arguments; throws std::invalid_argument on bad values
    static CrawlOptions parseOptions(const nlohmann::json& args, const Config::Crawl& defaults);

private:
    std::shared_ptr<CrawlerEnvironment> env;
};

// crawl_page: 抓取单个页面, 返回标题、正文和链接
class CrawlPageTool : public ITool {
public:
    explicit CrawlPageTool(std::shared_ptr<CrawlerEnvironment> env);

    std::string getName() const override { return "crawl_page"; }
    std::string getDescription() const override;
    nlohmann::ordered_json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) override;

private:
    std::shared_ptr<CrawlerEnvironment> env;
};

// search_page: 在单个页面的正文中查找包含关键字的段落 (不区分大小写)
class SearchPageTool : public ITool {
public:
    explicit SearchPageTool(std::shared_ptr<CrawlerEnvironment> env);

    std::string getName() const override { return "search_page"; }
    std::string getDescription() const override;
    nlohmann::ordered_json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& args, const ToolCallContext& ctx) override;

private:
    std::shared_ptr<CrawlerEnvironment> env;
};

void registerCrawlerTools(ToolHost& host, std::shared_ptr<CrawlerEnvironment> env);
