#include "server/CrawlerTools.h"
#include "server/ToolHost.h"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    std::string requireUrl(const nlohmann::json& args, const char* key) {
        if (!args.contains(key) || !args[key].is_string() || args[key].get<std::string>().empty()) {
            throw std::invalid_argument(std::string("Missing required parameter: ") + key);
        }
        return args[key].get<std::string>();
    }

    // Fetches one page through the crawl engine so both share fetch and extraction rules
    CrawlRecord fetchOne(CrawlerEnvironment& env, const std::string& url, const ToolCallContext& ctx) {
        CrawlOptions opts;
        opts.seedUrl = url;
        opts.maxDepth = 0;
        opts.maxPages = 1;
        opts.rateLimitPerSecond = 0;

        CrawlEngine engine(opts, *env.fetcher, *env.extractor, env.clock, ctx.cancel);
        auto record = engine.next();
        if (!record) {
            if (engine.status() == CrawlStatus::Failed) {
                throw std::invalid_argument(engine.failureReason());
            }
            throw std::runtime_error("fetch of " + url + " was cancelled");
        }
        return *record;
    }
}

CrawlSiteTool::CrawlSiteTool(std::shared_ptr<CrawlerEnvironment> env) : env(std::move(env)) {}

std::string CrawlSiteTool::getDescription() const {
    return "Recursively crawl a website breadth-first from a seed URL, bounded by depth, page count and "
           "request rate. Returns title, text and links for every visited page.";
}

nlohmann::ordered_json CrawlSiteTool::getSchema() const {
    nlohmann::ordered_json schema;
    schema["type"] = "object";
    auto& props = schema["properties"];
    props["seed_url"] = {{"type", "string"}, {"description", "Absolute http(s) URL to start from"}};
    props["max_depth"] = {{"type", "integer"}, {"description", "Maximum link depth from the seed"},
                          {"default", env->defaults.maxDepth}};
    props["rate_limit_per_second"] = {{"type", "number"}, {"description", "Maximum fetches per second"},
                                      {"default", env->defaults.rateLimitPerSecond}};
    props["scope"] = {{"type", "string"}, {"enum", {"same-origin", "allow-list"}}, {"default", "same-origin"}};
    props["allow_hosts"] = {{"type", "array"}, {"items", {{"type", "string"}}},
                            {"description", "Hosts that may be followed when scope is allow-list"}};
    props["max_pages"] = {{"type", "integer"}, {"description", "Maximum number of pages to fetch"},
                          {"default", env->defaults.maxPages}};
    schema["required"] = nlohmann::ordered_json::array({"seed_url"});
    return schema;
}

CrawlOptions CrawlSiteTool::parseOptions(const nlohmann::json& args, const Config::Crawl& defaults) {
    CrawlOptions opts;
    // "url" is accepted as an alias of "seed_url"
    opts.seedUrl = requireUrl(args, args.contains("url") && !args.contains("seed_url") ? "url" : "seed_url");
    opts.maxDepth = defaults.maxDepth;
    opts.rateLimitPerSecond = defaults.rateLimitPerSecond;
    opts.maxPages = defaults.maxPages;

    if (args.contains("max_depth")) {
        if (!args["max_depth"].is_number_integer() || args["max_depth"].get<int>() < 0) {
            throw std::invalid_argument("max_depth must be a non-negative integer");
        }
        opts.maxDepth = args["max_depth"].get<int>();
    }
    if (args.contains("rate_limit_per_second")) {
        if (!args["rate_limit_per_second"].is_number() || args["rate_limit_per_second"].get<double>() <= 0) {
            throw std::invalid_argument("rate_limit_per_second must be a positive number");
        }
        opts.rateLimitPerSecond = args["rate_limit_per_second"].get<double>();
    }
    if (args.contains("max_pages")) {
        if (!args["max_pages"].is_number_integer() || args["max_pages"].get<int>() < 0) {
            throw std::invalid_argument("max_pages must be a non-negative integer");
        }
        opts.maxPages = args["max_pages"].get<int>();
    }
    if (args.contains("scope")) {
        std::string scope = args["scope"].is_string() ? lower(args["scope"].get<std::string>()) : "";
        if (scope == "same-origin" || scope == "same_origin") {
            opts.scope = CrawlScope::SameOrigin;
        } else if (scope == "allow-list" || scope == "allow_list" || scope == "allowlist") {
            opts.scope = CrawlScope::AllowList;
        } else {
            throw std::invalid_argument("scope must be 'same-origin' or 'allow-list'");
        }
    }
    if (args.contains("allow_hosts")) {
        if (!args["allow_hosts"].is_array()) {
            throw std::invalid_argument("allow_hosts must be an array of host names");
        }
        for (const auto& h : args["allow_hosts"]) {
            if (h.is_string()) opts.allowHosts.push_back(h.get<std::string>());
        }
    }
    return opts;
}

nlohmann::json CrawlSiteTool::execute(const nlohmann::json& args, const ToolCallContext& ctx) {
    CrawlOptions opts;
    try {
        opts = parseOptions(args, env->defaults);
    } catch (const std::invalid_argument& e) {
        return errorResult(e.what());
    }

    CrawlEngine engine(opts, *env->fetcher, *env->extractor, env->clock, ctx.cancel);
    const std::string seed = opts.seedUrl;
    auto records = engine.run([&ctx, &seed](const CrawlRecord& record) {
        ctx.push("notifications/crawl_record", {{"seed_url", seed}, {"record", record.toJson()}});
    });

    if (engine.status() == CrawlStatus::Failed) {
        return errorResult(engine.failureReason());
    }

    nlohmann::json list = nlohmann::json::array();
    int failed = 0;
    for (const auto& r : records) {
        if (!r.ok()) failed++;
        list.push_back(r.toJson());
    }

    nlohmann::json summary;
    summary["seed_url"] = seed;
    summary["status"] = crawlStatusName(engine.status());
    summary["crawled_pages"] = records.size();
    summary["failed_pages"] = failed;
    summary["records"] = std::move(list);
    return textResult(summary.dump(2));
}

CrawlPageTool::CrawlPageTool(std::shared_ptr<CrawlerEnvironment> env) : env(std::move(env)) {}

std::string CrawlPageTool::getDescription() const {
    return "Fetch a single web page and return its title, readable text and outbound links.";
}

nlohmann::ordered_json CrawlPageTool::getSchema() const {
    nlohmann::ordered_json schema;
    schema["type"] = "object";
    schema["properties"]["url"] = {{"type", "string"}, {"description", "Absolute http(s) URL of the page"}};
    schema["required"] = nlohmann::ordered_json::array({"url"});
    return schema;
}

nlohmann::json CrawlPageTool::execute(const nlohmann::json& args, const ToolCallContext& ctx) {
    CrawlRecord record;
    try {
        record = fetchOne(*env, requireUrl(args, "url"), ctx);
    } catch (const std::invalid_argument& e) {
        return errorResult(e.what());
    }
    if (!record.ok()) {
        return errorResult("Failed to fetch " + record.url + " (" + fetchOutcomeName(record.outcome) + "): " + record.error);
    }

    nlohmann::json out;
    out["url"] = record.url;
    out["title"] = record.title;
    out["text"] = record.text;
    out["links"] = record.links;
    return textResult(out.dump(2));
}

SearchPageTool::SearchPageTool(std::shared_ptr<CrawlerEnvironment> env) : env(std::move(env)) {}

std::string SearchPageTool::getDescription() const {
    return "Search a web page for a keyword or phrase and return the matching paragraphs.";
}

nlohmann::ordered_json SearchPageTool::getSchema() const {
    nlohmann::ordered_json schema;
    schema["type"] = "object";
    schema["properties"]["url"] = {{"type", "string"}, {"description", "Absolute http(s) URL of the page"}};
    schema["properties"]["query"] = {{"type", "string"}, {"description", "Keyword or phrase to search for"}};
    schema["required"] = nlohmann::ordered_json::array({"url", "query"});
    return schema;
}

nlohmann::json SearchPageTool::execute(const nlohmann::json& args, const ToolCallContext& ctx) {
    if (!args.contains("query") || !args["query"].is_string() || args["query"].get<std::string>().empty()) {
        return errorResult("Missing required parameter: query");
    }
    const std::string query = args["query"].get<std::string>();

    CrawlRecord record;
    try {
        record = fetchOne(*env, requireUrl(args, "url"), ctx);
    } catch (const std::invalid_argument& e) {
        return errorResult(e.what());
    }
    if (!record.ok()) {
        return errorResult("Failed to fetch " + record.url + " (" + fetchOutcomeName(record.outcome) + "): " + record.error);
    }

    const std::string needle = lower(query);
    nlohmann::json matches = nlohmann::json::array();
    std::istringstream lines(record.text);
    std::string line;
    while (std::getline(lines, line)) {
        if (lower(line).find(needle) != std::string::npos) {
            size_t first = line.find_first_not_of(" \t");
            matches.push_back(first == std::string::npos ? line : line.substr(first));
        }
    }

    nlohmann::json out;
    out["url"] = record.url;
    out["query"] = query;
    out["matches"] = std::move(matches);
    return textResult(out.dump(2));
}

void registerCrawlerTools(ToolHost& host, std::shared_ptr<CrawlerEnvironment> env) {
    host.registerTool(std::make_unique<CrawlSiteTool>(env));
    host.registerTool(std::make_unique<CrawlPageTool>(env));
    host.registerTool(std::make_unique<SearchPageTool>(env));
}
