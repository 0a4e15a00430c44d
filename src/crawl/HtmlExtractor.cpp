#include "crawl/HtmlExtractor.h"
#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

std::string HtmlExtractor::tagName(const std::string& tag) {
    std::string name = tag;
    if (!name.empty() && name[0] == '/') name = name.substr(1);
    size_t space = name.find_first_of(" \t\r\n/");
    if (space != std::string::npos) name = name.substr(0, space);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::tolower(c); });
    return name;
}

std::string HtmlExtractor::attribute(const std::string& tag, const std::string& name) {
    std::string lowerTag = tag;
    std::transform(lowerTag.begin(), lowerTag.end(), lowerTag.begin(), [](unsigned char c) { return std::tolower(c); });

    size_t pos = 0;
    while ((pos = lowerTag.find(name, pos)) != std::string::npos) {
        bool boundary = pos > 0 && std::isspace(static_cast<unsigned char>(lowerTag[pos - 1]));
        size_t i = pos + name.size();
        while (i < tag.size() && std::isspace(static_cast<unsigned char>(tag[i]))) ++i;
        if (!boundary || i >= tag.size() || tag[i] != '=') {
            pos += name.size();
            continue;
        }
        ++i;
        while (i < tag.size() && std::isspace(static_cast<unsigned char>(tag[i]))) ++i;
        if (i >= tag.size()) return "";

        char quote = tag[i];
        if (quote == '"' || quote == '\'') {
            size_t end = tag.find(quote, i + 1);
            if (end == std::string::npos) return "";
            return tag.substr(i + 1, end - i - 1);
        }
        size_t end = tag.find_first_of(" \t\r\n>", i);
        return tag.substr(i, end == std::string::npos ? std::string::npos : end - i);
    }
    return "";
}

std::string HtmlExtractor::decodeEntities(std::string text) {
    auto replaceAll = [](std::string& s, const std::string& from, const std::string& to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.length(), to);
            pos += to.length();
        }
    };

    replaceAll(text, "&nbsp;", " ");
    replaceAll(text, "&lt;", "<");
    replaceAll(text, "&gt;", ">");
    replaceAll(text, "&quot;", "\"");
    replaceAll(text, "&apos;", "'");
    replaceAll(text, "&#39;", "'");
    // Last, so "&amp;lt;" stays "&lt;"
    replaceAll(text, "&amp;", "&");
    return text;
}

ExtractedPage HtmlExtractor::extract(const std::string& html) {
    if (html.find('\0') != std::string::npos) {
        throw std::invalid_argument("content is binary, not HTML");
    }

    ExtractedPage page;
    std::string text;
    text.reserve(html.size());

    bool inTag = false;
    bool inHidden = false;
    bool inTitle = false;
    std::string hiddenTag;
    std::string currentTag;

    for (size_t i = 0; i < html.size(); ++i) {
        char c = html[i];

        if (!inTag && html.compare(i, 4, "<!--") == 0) {
            size_t end = html.find("-->", i + 4);
            if (end == std::string::npos) break;
            i = end + 2;
            continue;
        }

        if (c == '<' && !inTag) {
            inTag = true;
            currentTag.clear();
            continue;
        }

        if (inTag) {
            if (c != '>') {
                currentTag += c;
                continue;
            }
            inTag = false;
            std::string name = tagName(currentTag);
            bool closing = !currentTag.empty() && currentTag[0] == '/';

            if (inHidden) {
                if (closing && name == hiddenTag) inHidden = false;
                continue;
            }
            if (!closing && (name == "script" || name == "style" || name == "noscript" || name == "template")) {
                if (currentTag.empty() || currentTag.back() != '/') {
                    inHidden = true;
                    hiddenTag = name;
                }
            } else if (name == "title") {
                inTitle = !closing;
            } else if (name == "a" && !closing) {
                std::string href = decodeEntities(attribute(currentTag, "href"));
                if (!href.empty()) page.links.push_back(href);
            } else if (name == "p" || name == "div" || name == "br" || name == "li" || name == "tr" ||
                       name == "h1" || name == "h2" || name == "h3" || name == "h4" || name == "section" ||
                       name == "article" || name == "header" || name == "footer" || name == "table") {
                if (!text.empty() && text.back() != '\n') text += '\n';
            }
            continue;
        }

        if (inHidden) continue;
        if (inTitle) {
            page.title += c;
        } else {
            text += c;
        }
    }

    text = decodeEntities(text);

    // Collapse runs of blank space
    static const std::regex spaces(R"raw([ \t\r]+)raw");
    static const std::regex newlines(R"raw(\s*\n\s*\n\s*)raw");
    text = std::regex_replace(text, spaces, " ");
    text = std::regex_replace(text, newlines, "\n\n");

    auto trim = [](const std::string& s) {
        size_t first = s.find_first_not_of(" \n\r\t");
        if (first == std::string::npos) return std::string();
        size_t last = s.find_last_not_of(" \n\r\t");
        return s.substr(first, last - first + 1);
    };
    page.text = trim(text);
    page.title = trim(decodeEntities(page.title));

    if (maxTextLength && page.text.size() > maxTextLength) {
        // Do not cut a UTF-8 sequence in half
        size_t cut = maxTextLength;
        while (cut > 0 && (static_cast<unsigned char>(page.text[cut]) & 0xC0) == 0x80) --cut;
        page.text = page.text.substr(0, cut);
    }
    return page;
}
