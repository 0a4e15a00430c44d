#pragma once
#include <optional>
#include <string>

/**
 * @brief 规范化后的 http(s) URL
 *
 * 规范形式: scheme/host 小写, 去掉默认端口和 fragment,
 * 空路径变为 "/", 解析掉 "." 与 ".." 段, query 原样保留。
 */
struct Url {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string path = "/";
    std::string query;

    // Absolute http/https URLs only; anything else yields std::nullopt
    static std::optional<Url> parse(const std::string& text);

    // Resolves an href found on the page at `base`; non-http(s) links yield std::nullopt
    static std::optional<Url> resolve(const Url& base, const std::string& href);

    static std::string removeDotSegments(const std::string& path);

    int defaultPort() const { return scheme == "https" ? 443 : 80; }
    int effectivePort() const { return port ? port : defaultPort(); }

    // scheme://host[:port]
    std::string origin() const;
    // path[?query]
    std::string target() const;
    std::string str() const { return origin() + target(); }

    bool sameOrigin(const Url& other) const {
        return scheme == other.scheme && host == other.host && effectivePort() == other.effectivePort();
    }
};
