#include <mender/html/element_table.h>
#include <gtest/gtest.h>
#include <string>

using namespace mender::html;

// ============================================================================
// Lookup
// ============================================================================

// 1. Case-insensitive lookup by name
TEST(ElementTable, LookupByName) {
    EXPECT_EQ(element_info("div").code, ElementCode::Div);
    EXPECT_EQ(element_info("DIV").code, ElementCode::Div);
    EXPECT_EQ(element_info("Table").code, ElementCode::Table);
    EXPECT_EQ(element_info("div").name, "div");
}

// 2. Lookup by code agrees with lookup by name
TEST(ElementTable, LookupByCode) {
    for (const char* name : {"a", "body", "br", "li", "p", "script", "td", "title", "xmp"}) {
        const ElementInfo& by_name = element_info(name);
        EXPECT_EQ(&element_info(by_name.code), &by_name) << name;
    }
}

// 3. Unknown names share one container entry under body
TEST(ElementTable, UnknownElement) {
    const ElementInfo& custom = element_info("my-widget");
    EXPECT_EQ(custom.code, ElementCode::Unknown);
    EXPECT_EQ(&custom, &element_info("other-widget"));
    EXPECT_TRUE(custom.is_container());
    ASSERT_FALSE(custom.parents.empty());
    EXPECT_EQ(custom.parents.front(), ElementCode::Body);
}

// ============================================================================
// Flags and relations
// ============================================================================

// 4. Void elements
TEST(ElementTable, VoidElements) {
    for (const char* name : {"area", "base", "br", "col", "hr", "img", "input", "link", "meta", "wbr"}) {
        EXPECT_TRUE(element_info(name).is_empty()) << name;
        EXPECT_EQ(element_info(name).content_class, ContentClass::Void) << name;
    }
    EXPECT_FALSE(element_info("p").is_empty());
}

// 5. Preferred parents
TEST(ElementTable, PreferredParents) {
    EXPECT_EQ(element_info("title").parents.front(), ElementCode::Head);
    EXPECT_EQ(element_info("p").parents.front(), ElementCode::Body);
    EXPECT_EQ(element_info("tr").parents.front(), ElementCode::Tbody);
    EXPECT_EQ(element_info("td").parents.front(), ElementCode::Tr);
    EXPECT_EQ(element_info("body").parents.front(), ElementCode::Html);
    EXPECT_TRUE(element_info("html").parents.empty());
    EXPECT_TRUE(element_info("li").is_parent(ElementCode::Ul));
    EXPECT_TRUE(element_info("li").is_parent(ElementCode::Ol));
}

// 6. Parent search bounds
TEST(ElementTable, Bounds) {
    EXPECT_EQ(element_info("td").bounds, ElementCode::Table);
    EXPECT_EQ(element_info("tr").bounds, ElementCode::Table);
    EXPECT_FALSE(element_info("p").bounds.has_value());
}

// 7. Closing sets
TEST(ElementTable, Closes) {
    EXPECT_TRUE(element_info("p").closes_element(ElementCode::P));
    EXPECT_TRUE(element_info("li").closes_element(ElementCode::Li));
    EXPECT_TRUE(element_info("dd").closes_element(ElementCode::Dt));
    EXPECT_TRUE(element_info("td").closes_element(ElementCode::Th));
    EXPECT_TRUE(element_info("h2").closes_element(ElementCode::H1));
    EXPECT_TRUE(element_info("body").closes_element(ElementCode::Head));
    EXPECT_FALSE(element_info("span").closes_element(ElementCode::P));
    EXPECT_FALSE(element_info("b").closes_element(ElementCode::B));
}

// 8. Inline and block flags
TEST(ElementTable, InlineAndBlock) {
    EXPECT_TRUE(element_info("b").is_inline());
    EXPECT_TRUE(element_info("em").is_inline());
    EXPECT_FALSE(element_info("span").is_inline());
    EXPECT_TRUE(element_info("table").is_block());
    EXPECT_TRUE(element_info("table").is_container());
    EXPECT_EQ(element_info("tbody").flags, 0);
    EXPECT_EQ(element_info("head").flags, 0);
}

// ============================================================================
// Content classes and text modes
// ============================================================================

// 9. Content classes
TEST(ElementTable, ContentClasses) {
    EXPECT_EQ(element_info("html").content_class, ContentClass::Root);
    EXPECT_EQ(element_info("b").content_class, ContentClass::Formatting);
    EXPECT_EQ(element_info("a").content_class, ContentClass::Formatting);
    EXPECT_EQ(element_info("td").content_class, ContentClass::TableStructure);
    EXPECT_EQ(element_info("li").content_class, ContentClass::ListItem);
    EXPECT_EQ(element_info("option").content_class, ContentClass::Select);
    EXPECT_EQ(element_info("script").content_class, ContentClass::RawText);
    EXPECT_EQ(element_info("section").content_class, ContentClass::Block);
    EXPECT_EQ(element_info("abbr").content_class, ContentClass::Inline);
    EXPECT_EQ(element_info("div").content_class, ContentClass::Container);
}

// 10. Content class names
TEST(ElementTable, ContentClassNames) {
    EXPECT_STREQ(content_class_name(ContentClass::TableStructure), "table-structure");
    EXPECT_STREQ(content_class_name(ContentClass::Void), "void");
}

// 11. Text modes
TEST(ElementTable, TextModes) {
    EXPECT_EQ(element_info("script").text_mode, TextMode::RawText);
    EXPECT_EQ(element_info("style").text_mode, TextMode::RawText);
    EXPECT_EQ(element_info("title").text_mode, TextMode::RcData);
    EXPECT_EQ(element_info("textarea").text_mode, TextMode::RcData);
    EXPECT_EQ(element_info("plaintext").text_mode, TextMode::PlainText);
    EXPECT_EQ(element_info("div").text_mode, TextMode::Normal);
}

// 12. Special elements are the ones whose body is always scanned as text
TEST(ElementTable, SpecialFlags) {
    for (const char* name : {"script", "style", "xmp", "title", "textarea", "plaintext"}) {
        EXPECT_TRUE(element_info(name).is_special()) << name;
        EXPECT_NE(element_info(name).text_mode, TextMode::Normal) << name;
    }
    for (const char* name : {"iframe", "noembed", "noframes", "noscript", "div", "template"}) {
        EXPECT_FALSE(element_info(name).is_special()) << name;
    }
}
