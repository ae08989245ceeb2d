#include <gtest/gtest.h>

#include "tag_rebuild.hpp"

using namespace sax2md;

TEST(TagRebuildTest, OpenTagWithAttributesInOrder) {
    Attrs attrs = {{"class", "note"}, {"id", "x1"}};
    EXPECT_EQ(rebuild_tag("span", attrs, TagPhase::OPEN), "<span class=\"note\" id=\"x1\">");
}

TEST(TagRebuildTest, OpenTagWithoutAttributes) {
    EXPECT_EQ(rebuild_tag("div", TagPhase::OPEN), "<div>");
}

TEST(TagRebuildTest, CloseTag) {
    EXPECT_EQ(rebuild_tag("span", TagPhase::CLOSE), "</span>");
}

TEST(TagRebuildTest, VoidElementsHaveNoCloseTag) {
    EXPECT_EQ(rebuild_tag("br", TagPhase::CLOSE), "");
    EXPECT_EQ(rebuild_tag("BR", TagPhase::CLOSE), "");
    EXPECT_EQ(rebuild_tag("br", TagPhase::OPEN), "<br>");
    EXPECT_TRUE(is_void_tag_name("wbr"));
    EXPECT_FALSE(is_void_tag_name("span"));
}

TEST(TagRebuildTest, AttributeValuesAreEscaped) {
    Attrs attrs = {{"title", "a \"b\" <c> & d"}};
    EXPECT_EQ(rebuild_tag("abbr", attrs, TagPhase::OPEN),
              "<abbr title=\"a &quot;b&quot; &lt;c&gt; &amp; d\">");
    EXPECT_EQ(escape_attr_value("plain"), "plain");
}

TEST(TagRebuildTest, NonAsciiTagNamesAreNotVoid) {
    EXPECT_FALSE(is_void_tag_name("\xC3\xA9img"));
    EXPECT_EQ(rebuild_tag("\xC3\xA9t", TagPhase::CLOSE), "</\xC3\xA9t>");
}
