#include "crawl/Url.h"
#include <algorithm>
#include <cctype>
#include <vector>

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    std::string trimSpace(const std::string& s) {
        size_t first = s.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = s.find_last_not_of(" \t\r\n");
        return s.substr(first, last - first + 1);
    }

    // Length of a leading "scheme:" or 0 when there is none
    size_t schemeLength(const std::string& s) {
        if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return 0;
        for (size_t i = 1; i < s.size(); ++i) {
            char c = s[i];
            if (c == ':') return i;
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') return 0;
        }
        return 0;
    }

    std::string stripFragment(const std::string& s) {
        size_t hash = s.find('#');
        return hash == std::string::npos ? s : s.substr(0, hash);
    }

    void splitQuery(const std::string& in, std::string& path, std::string& query) {
        size_t q = in.find('?');
        if (q == std::string::npos) {
            path = in;
            query.clear();
        } else {
            path = in.substr(0, q);
            query = in.substr(q + 1);
        }
    }
}

std::optional<Url> Url::parse(const std::string& text) {
    std::string s = stripFragment(trimSpace(text));
    size_t slen = schemeLength(s);
    if (slen == 0 || s.compare(slen, 3, "://") != 0) return std::nullopt;

    Url url;
    url.scheme = lower(s.substr(0, slen));
    if (url.scheme != "http" && url.scheme != "https") return std::nullopt;

    std::string rest = s.substr(slen + 3);
    size_t end = rest.find_first_of("/?");
    std::string authority = rest.substr(0, end);
    std::string tail = end == std::string::npos ? "" : rest.substr(end);

    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    std::string host = authority;
    size_t colon = authority.rfind(':');
    // Leave bracketed IPv6 literals intact
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        host = authority.substr(0, colon);
        std::string portText = authority.substr(colon + 1);
        if (!portText.empty()) {
            if (!std::all_of(portText.begin(), portText.end(), [](unsigned char c) { return std::isdigit(c); }) ||
                portText.size() > 5) {
                return std::nullopt;
            }
            url.port = std::stoi(portText);
            if (url.port <= 0 || url.port > 65535) return std::nullopt;
        }
    }
    url.host = lower(host);
    if (url.host.empty()) return std::nullopt;
    if (url.port == url.defaultPort()) url.port = 0;

    std::string path;
    splitQuery(tail, path, url.query);
    url.path = removeDotSegments(path.empty() ? "/" : path);
    return url;
}

std::optional<Url> Url::resolve(const Url& base, const std::string& href) {
    std::string ref = trimSpace(href);
    if (ref.empty() || ref[0] == '#') return base;

    if (schemeLength(ref) > 0) {
        return parse(ref);
    }
    if (ref.compare(0, 2, "//") == 0) {
        return parse(base.scheme + ":" + ref);
    }

    ref = stripFragment(ref);
    Url out = base;
    std::string path;
    std::string query;
    splitQuery(ref, path, query);

    if (path.empty()) {
        // "?q" keeps the base path
        out.query = query;
        return out;
    }
    if (path[0] == '/') {
        out.path = removeDotSegments(path);
    } else {
        size_t slash = base.path.rfind('/');
        std::string dir = slash == std::string::npos ? "/" : base.path.substr(0, slash + 1);
        out.path = removeDotSegments(dir + path);
    }
    out.query = query;
    return out;
}

std::string Url::removeDotSegments(const std::string& path) {
    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        segments.push_back(path.substr(pos, next - pos));
        pos = next + 1;
    }

    std::vector<std::string> out;
    // The first segment is what precedes the leading slash
    for (size_t i = 1; i < segments.size(); ++i) {
        const std::string& seg = segments[i];
        bool last = i + 1 == segments.size();
        if (seg == ".") {
            if (last) out.push_back("");
        } else if (seg == "..") {
            if (!out.empty()) out.pop_back();
            if (last) out.push_back("");
        } else {
            out.push_back(seg);
        }
    }

    std::string result;
    for (const auto& seg : out) result += "/" + seg;
    return result.empty() ? "/" : result;
}

std::string Url::origin() const {
    std::string out = scheme + "://" + host;
    if (port && port != defaultPort()) out += ":" + std::to_string(port);
    return out;
}

std::string Url::target() const {
    return query.empty() ? path : path + "?" + query;
}
