// End-to-end conversions through the libxml2 HTML tokenizer.

#include <gtest/gtest.h>

#include <vector>

#include "converter.hpp"
#include "sax_source.hpp"

using namespace sax2md;

namespace {

std::string md(std::string_view html, bool strip_tags = false) {
    Options options;
    options.strip_tags = strip_tags;
    Converter converter(std::move(options));
    auto out = converter.convert(html);
    EXPECT_TRUE(out.has_value()) << out.error();
    return out.value_or("");
}

}

// ==============================================================================
// Tokenizer events
// ==============================================================================

TEST(SaxSourceTest, EmitsOpenTextClose) {
    EventLog log;
    ASSERT_TRUE(parse_html("<b>x</b>", log).has_value());
    ASSERT_EQ(log.events.size(), 3u);
    ASSERT_TRUE(std::holds_alternative<OpenEvent>(log.events[0]));
    EXPECT_EQ(std::get<OpenEvent>(log.events[0]).name, "b");
    ASSERT_TRUE(std::holds_alternative<TextEvent>(log.events[1]));
    EXPECT_EQ(std::get<TextEvent>(log.events[1]).value, "x");
    ASSERT_TRUE(std::holds_alternative<CloseEvent>(log.events[2]));
    EXPECT_EQ(std::get<CloseEvent>(log.events[2]).name, "b");
}

TEST(SaxSourceTest, AttributesKeepSourceOrder) {
    EventLog log;
    ASSERT_TRUE(parse_html("<img src=\"s\" alt=\"t\">", log).has_value());
    ASSERT_FALSE(log.events.empty());
    const auto& img = std::get<OpenEvent>(log.events.front());
    ASSERT_EQ(img.attrs.size(), 2u);
    EXPECT_EQ(img.attrs[0].first, "src");
    EXPECT_EQ(img.attrs[0].second, "s");
    EXPECT_EQ(img.attrs[1].first, "alt");
    EXPECT_EQ(img.attrs[1].second, "t");
}

TEST(SaxSourceTest, TextAroundEntitiesIsOneEvent) {
    EventLog log;
    ASSERT_TRUE(parse_html("<p>a &amp; b</p>", log).has_value());
    ASSERT_EQ(log.events.size(), 3u);
    EXPECT_EQ(std::get<TextEvent>(log.events[1]).value, "a & b");
}

TEST(SaxSourceTest, EmptyInputProducesNoEvents) {
    EventLog log;
    ASSERT_TRUE(parse_html("", log).has_value());
    EXPECT_TRUE(log.events.empty());
}

TEST(SaxSourceTest, SiblingsAfterFirstTopLevelElementAreDelivered) {
    EventLog log;
    ASSERT_TRUE(parse_html("<h1>a</h1><h2>b</h2>", log).has_value());
    EXPECT_EQ(log.events.size(), 6u);
}

// ==============================================================================
// Conversions
// ==============================================================================

TEST(ConverterTest, Bold) {
    EXPECT_EQ(md("<b>this is a test</b>"), "**this is a test**");
}

TEST(ConverterTest, Italic) {
    EXPECT_EQ(md("<i>this is a test</i>"), "*this is a test*");
}

TEST(ConverterTest, UppercaseTagNames) {
    EXPECT_EQ(md("<B>x</B>"), "**x**");
}

TEST(ConverterTest, Anchor) {
    EXPECT_EQ(md("<a href=\"http://example.org\">this is a test</a>"), "[this is a test](http://example.org)");
}

TEST(ConverterTest, Image) {
    EXPECT_EQ(md("<img src=\"http://example.org/test.gif\" alt=\"I am a little teapot\">"),
              "![I am a little teapot](http://example.org/test.gif)");
}

TEST(ConverterTest, Paragraph) {
    EXPECT_EQ(md("<p>this is a test</p>"), "this is a test\n\n");
}

TEST(ConverterTest, Headings) {
    EXPECT_EQ(md("<h1>test</h1><h2>test</h2>"), "# test\n\n## test\n\n");
}

TEST(ConverterTest, Blockquote) {
    EXPECT_EQ(md("<blockquote>I am a little teapot short and stout</blockquote>"),
              "> I am a little teapot short and stout\n\n");
}

TEST(ConverterTest, CodeBlock) {
    EXPECT_EQ(md("<code>size_t strcspn(const char[]* str, const char[]* del)</code>"),
              "```\nsize_t strcspn(const char[]* str, const char[]* del)\n```\n\n");
}

TEST(ConverterTest, PreWrappedCode) {
    EXPECT_EQ(md("<pre><code>int x;</code></pre>"), "```\nint x;\n```\n\n");
}

TEST(ConverterTest, HorizontalRule) {
    EXPECT_EQ(md("<hr>"), "- - -\n\n");
}

TEST(ConverterTest, OrderedListWithImplicitItemCloses) {
    EXPECT_EQ(md("<ol><li> this is the first <li> this is the second</ol>"),
              "1. this is the first\n1. this is the second\n\n\n");
}

TEST(ConverterTest, UnorderedList) {
    EXPECT_EQ(md("<ul><li>first</li><li>second</li></ul>"), "* first\n* second\n\n\n");
}

TEST(ConverterTest, LayoutWhitespaceIsDropped) {
    EXPECT_EQ(md("<p>a\n\tb</p>"), "ab\n\n");
    EXPECT_EQ(strip_layout_whitespace("a\n\tb c"), "ab c");
}

TEST(ConverterTest, EntitiesAreDecoded) {
    EXPECT_EQ(md("<p>a &amp; b</p>"), "a & b\n\n");
}

TEST(ConverterTest, UnmappedMarkupPassesThrough) {
    EXPECT_EQ(md("<span class=\"x\">hi</span>"), "<span class=\"x\">hi</span>");
    EXPECT_EQ(md("<p>a<br>b</p>"), "a<br>b\n\n");
}

TEST(ConverterTest, UnmappedMarkupIsStripped) {
    EXPECT_EQ(md("<span class=\"x\">hi</span>", true), "hi");
    EXPECT_EQ(md("<p>a<br>b</p>", true), "ab\n\n");
}

TEST(ConverterTest, EmptyInput) {
    EXPECT_EQ(md(""), "");
}

TEST(ConverterTest, ReportsUnmappedTags) {
    std::vector<Diagnostic> seen;
    Options options;
    options.on_diagnostic = [&seen](const Diagnostic& d) { seen.push_back(d); };
    Converter converter(std::move(options));
    ASSERT_TRUE(converter.convert("<span>hi</span>").has_value());
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].kind, DiagnosticKind::UNMAPPED_TAG);
    EXPECT_EQ(seen[0].tag, "span");
}

TEST(ConverterTest, RepeatedCallsAreIndependent) {
    Converter converter;
    const char* html = "<ul><li><a href=\"u\">t</a></li></ul><p>x</p>";
    auto first = converter.convert(html);
    auto second = converter.convert(html);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(*first, "* [t](u)\n\n\nx\n\n");
}

TEST(ConverterTest, CustomDialect) {
    Options options;
    options.dialect.set("b", TagSpec{"__", "__"});
    Converter converter(std::move(options));
    auto out = converter.convert("<b>x</b>");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "__x__");
    EXPECT_EQ(converter.config().dialect.resolve("b")->open, "__");
}
