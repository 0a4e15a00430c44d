#include <gtest/gtest.h>
#include "crawl/HtmlExtractor.h"

TEST(HtmlExtractorTest, ExtractsTitleTextAndLinks) {
    HtmlExtractor extractor;
    auto page = extractor.extract(
        "<html><head><title>Home &amp; Garden</title>"
        "<style>body { color: red; }</style></head>"
        "<body><h1>Welcome</h1><p>First paragraph.</p>"
        "<script>var x = '<a href=\"/hidden\">';</script>"
        "<a href=\"/about\">About</a> <a class=\"nav\" href='contact.html'>Contact</a>"
        "<!-- <a href=\"/commented\">x</a> -->"
        "</body></html>");

    EXPECT_EQ(page.title, "Home & Garden");
    EXPECT_NE(page.text.find("Welcome"), std::string::npos);
    EXPECT_NE(page.text.find("First paragraph."), std::string::npos);
    EXPECT_EQ(page.text.find("color: red"), std::string::npos);
    EXPECT_EQ(page.text.find("var x"), std::string::npos);

    ASSERT_EQ(page.links.size(), 2u);
    EXPECT_EQ(page.links[0], "/about");
    EXPECT_EQ(page.links[1], "contact.html");
}

TEST(HtmlExtractorTest, BlockTagsBreakLines) {
    HtmlExtractor extractor;
    auto page = extractor.extract("<div>one</div><div>two</div><ul><li>three</li></ul>");
    EXPECT_NE(page.text.find("one\ntwo"), std::string::npos);
    EXPECT_NE(page.text.find("three"), std::string::npos);
}

TEST(HtmlExtractorTest, DecodesEntitiesOnce) {
    EXPECT_EQ(HtmlExtractor::decodeEntities("a &lt;b&gt; &amp;lt; &quot;c&quot;"), "a <b> &lt; \"c\"");
}

TEST(HtmlExtractorTest, ATagsWithoutHrefAndDataAttributes) {
    HtmlExtractor extractor;
    auto page = extractor.extract("<a name=\"top\">x</a><a data-href=\"/no\" href=\"/yes\">y</a>");
    ASSERT_EQ(page.links.size(), 1u);
    EXPECT_EQ(page.links[0], "/yes");
}

TEST(HtmlExtractorTest, NonAsciiAttributesAndTagNames) {
    HtmlExtractor extractor;
    auto page = extractor.extract(
        "<p>Caf\xc3\xa9 \xe2\x80\x94 men\xc3\xba</p>"
        "<A title=\"caf\xc3\xa9 \xc3\x9c" "ber\" HREF=\"/x\">x</A>"
        "<\xc3\xa9l\xc3\xa9ment href=\"/ignored\">y</\xc3\xa9l\xc3\xa9ment>");
    ASSERT_EQ(page.links.size(), 1u);
    EXPECT_EQ(page.links[0], "/x");
    EXPECT_NE(page.text.find("Caf\xc3\xa9"), std::string::npos);
}

TEST(HtmlExtractorTest, BinaryContentIsAParseError) {
    HtmlExtractor extractor;
    std::string binary("\x89PNG\r\n\x1a\n\0\0\0", 11);
    EXPECT_THROW(extractor.extract(binary), std::invalid_argument);
}

TEST(HtmlExtractorTest, TruncatesLongText) {
    HtmlExtractor extractor(10);
    auto page = extractor.extract("<p>" + std::string(100, 'a') + "</p>");
    EXPECT_EQ(page.text.size(), 10u);
}
