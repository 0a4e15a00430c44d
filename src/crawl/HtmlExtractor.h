#pragma once
#include <string>
#include <vector>

struct ExtractedPage {
    std::string title;
    std::string text;
    std::vector<std::string> links;   // raw href values, in document order
};

/**
 * @brief HTML -> 正文 + 链接 (外部协作者)
 *
 * 无法解析时抛 std::invalid_argument。
 */
class IHtmlExtractor {
public:
    virtual ~IHtmlExtractor() = default;
    virtual ExtractedPage extract(const std::string& html) = 0;
};

/**
 * @brief 逐字符扫描标签的简单实现
 *
 * 去掉 script/style/noscript 内容, 块级标签换行, 解码常见实体,
 * 收集 <a href> 链接与 <title>。
 */
class HtmlExtractor : public IHtmlExtractor {
public:
    explicit HtmlExtractor(size_t maxTextLength = 30000) : maxTextLength(maxTextLength) {}

    ExtractedPage extract(const std::string& html) override;

    static std::string decodeEntities(std::string text);

private:
    size_t maxTextLength;

    static std::string tagName(const std::string& tag);
    static std::string attribute(const std::string& tag, const std::string& name);
};
