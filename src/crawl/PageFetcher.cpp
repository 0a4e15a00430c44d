#include "crawl/PageFetcher.h"
#include "utils/Logger.h"
#include <httplib.h>

HttpPageFetcher::HttpPageFetcher(int timeoutSeconds, std::string userAgent)
    : timeoutSeconds(timeoutSeconds),
      userAgent(userAgent.empty()
          ? "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36 switchboard-crawler"
          : std::move(userAgent)) {}

FetchResponse HttpPageFetcher::fetch(const Url& url) {
    FetchResponse out;
    try {
        httplib::Client cli(url.origin());
        cli.set_follow_location(true);
        cli.set_decompress(true);
        cli.set_connection_timeout(timeoutSeconds);
        cli.set_read_timeout(timeoutSeconds);

        httplib::Headers headers = {
            {"User-Agent", userAgent},
            {"Accept", "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"},
            {"Accept-Language", "en-US,en;q=0.5"}
        };

        auto res = cli.Get(url.target(), headers);
        if (!res) {
            out.timedOut = true;
            out.error = httplib::to_string(res.error());
            return out;
        }
        out.status = res->status;
        out.body = std::move(res->body);
        out.contentType = res->get_header_value("Content-Type");
        if (out.status < 200 || out.status >= 300) {
            out.error = "HTTP " + std::to_string(out.status);
        }
    } catch (const std::exception& e) {
        out.error = std::string("fetch exception: ") + e.what();
        Logger::getInstance().debug("Fetch of " + url.str() + " threw: " + e.what());
    }
    return out;
}
