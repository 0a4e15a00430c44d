#include "crawl/CrawlEngine.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>

CrawlEngine::CrawlEngine(CrawlOptions options,
                         IPageFetcher& fetcher,
                         IHtmlExtractor& extractor,
                         std::shared_ptr<CrawlClock> clock,
                         std::shared_ptr<CancellationToken> cancelToken)
    : opts(std::move(options)),
      fetcher(fetcher),
      extractor(extractor),
      clock(clock ? std::move(clock) : std::make_shared<CrawlClock>()),
      token(cancelToken ? std::move(cancelToken) : CancellationToken::create()),
      limiter(opts.rateLimitPerSecond, this->clock) {}

bool CrawlEngine::start() {
    if (state != CrawlStatus::Idle) return state == CrawlStatus::Running;

    seed = Url::parse(opts.seedUrl);
    if (!seed) {
        failure = "invalid seed url '" + opts.seedUrl + "' (absolute http/https URL required)";
    } else if (opts.maxDepth < 0) {
        failure = "max_depth must be >= 0";
    } else if (opts.scope == CrawlScope::AllowList && opts.allowHosts.empty()) {
        failure = "allow-list scope needs at least one host";
    }
    if (!failure.empty()) {
        Logger::getInstance().error("Crawl not started: " + failure);
        state = CrawlStatus::Failed;
        return false;
    }

    for (auto& host : opts.allowHosts) {
        std::transform(host.begin(), host.end(), host.begin(), [](unsigned char c) { return std::tolower(c); });
    }

    enqueue(*seed, 0);
    state = CrawlStatus::Running;
    Logger::getInstance().info("Crawl started at " + seed->str() + " (max depth " + std::to_string(opts.maxDepth) + ")");
    return true;
}

bool CrawlEngine::inScope(const Url& url) const {
    if (!seed) return false;
    if (opts.scope == CrawlScope::SameOrigin) {
        return url.sameOrigin(*seed);
    }
    for (const auto& host : opts.allowHosts) {
        if (url.host == host) return true;
        // Subdomains of an allowed host are allowed too
        if (url.host.size() > host.size() &&
            url.host.compare(url.host.size() - host.size(), host.size(), host) == 0 &&
            url.host[url.host.size() - host.size() - 1] == '.') {
            return true;
        }
    }
    return false;
}

void CrawlEngine::enqueue(const Url& url, int depth) {
    if (depth > opts.maxDepth) return;
    // Marked on discovery so the same URL never sits in the frontier twice
    if (!visited.insert(url.str()).second) return;
    frontier.push_back({url, depth});
}

std::optional<CrawlRecord> CrawlEngine::next() {
    if (state == CrawlStatus::Idle && !start()) return std::nullopt;
    if (state != CrawlStatus::Running) return std::nullopt;

    if (cancelled()) {
        state = CrawlStatus::Cancelled;
        Logger::getInstance().info("Crawl cancelled after " + std::to_string(fetches) + " pages");
        return std::nullopt;
    }

    if (frontier.empty() || (opts.maxPages > 0 && fetches >= opts.maxPages)) {
        state = CrawlStatus::Completed;
        Logger::getInstance().success("Crawl completed: " + std::to_string(fetches) + " pages fetched");
        return std::nullopt;
    }

    FrontierEntry entry = frontier.front();
    frontier.pop_front();

    // Cancellation may arrive while waiting on the rate limit
    if (!limiter.acquire(token.get()) || cancelled()) {
        state = CrawlStatus::Cancelled;
        Logger::getInstance().info("Crawl cancelled after " + std::to_string(fetches) + " pages");
        return std::nullopt;
    }

    CrawlRecord record = fetchPage(entry);
    fetches++;

    if (record.ok() && entry.depth < opts.maxDepth) {
        for (const auto& link : record.links) {
            auto url = Url::parse(link);
            if (url && inScope(*url)) enqueue(*url, entry.depth + 1);
        }
    }
    return record;
}

CrawlRecord CrawlEngine::fetchPage(const FrontierEntry& entry) {
    CrawlRecord record;
    record.url = entry.url.str();
    record.depth = entry.depth;

    Logger::getInstance().debug("Fetching " + record.url + " (depth " + std::to_string(entry.depth) + ")");
    FetchResponse response = fetcher.fetch(entry.url);
    record.statusCode = response.status;

    if (response.status == 0) {
        record.outcome = FetchOutcome::Timeout;
        record.error = response.error.empty() ? "no response" : response.error;
    } else if (response.status < 200 || response.status >= 300) {
        record.outcome = FetchOutcome::HttpError;
        record.error = response.error.empty() ? "HTTP " + std::to_string(response.status) : response.error;
    } else {
        std::string type = response.contentType;
        std::transform(type.begin(), type.end(), type.begin(), [](unsigned char c) { return std::tolower(c); });
        bool textual = type.empty() || type.find("html") != std::string::npos || type.find("text/") == 0 ||
                       type.find("xml") != std::string::npos;
        if (!textual) {
            record.outcome = FetchOutcome::ParseError;
            record.error = "unsupported content type '" + response.contentType + "'";
        } else {
            try {
                ExtractedPage page = extractor.extract(response.body);
                record.title = std::move(page.title);
                record.text = std::move(page.text);
                for (const auto& href : page.links) {
                    auto url = Url::resolve(entry.url, href);
                    if (!url) continue;
                    std::string canonical = url->str();
                    if (std::find(record.links.begin(), record.links.end(), canonical) == record.links.end()) {
                        record.links.push_back(canonical);
                    }
                }
            } catch (const std::exception& e) {
                record.outcome = FetchOutcome::ParseError;
                record.error = e.what();
            }
        }
    }

    if (!record.ok()) {
        Logger::getInstance().warn("Fetch of " + record.url + " failed (" + fetchOutcomeName(record.outcome) +
                                   "): " + record.error);
    }
    return record;
}

std::vector<CrawlRecord> CrawlEngine::run(const RecordCallback& onRecord) {
    std::vector<CrawlRecord> records;
    while (auto record = next()) {
        if (onRecord) onRecord(*record);
        records.push_back(std::move(*record));
    }
    return records;
}

void CrawlEngine::cancel() {
    token->cancel();
}
