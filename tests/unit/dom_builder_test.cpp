#include <mender/dom/dom_builder.h>
#include <mender/dom/simple_node.h>
#include <mender/html/parser.h>
#include <gtest/gtest.h>
#include <string>

using namespace mender::dom;
using mender::html::Parser;

static std::string tree(std::string_view input, bool balance = true) {
    Parser parser;
    parser.set_feature("balance-tags", balance);
    DomBuilder builder;
    parser.parse(input, builder);
    return builder.document().serialize();
}

// ============================================================================
// Tree building
// ============================================================================

// 1. Implied elements appear in the tree
TEST(DomBuilder, ImpliedElements) {
    EXPECT_EQ(tree("<ul><li>a<li>b</ul>"),
              "#document\n"
              "| <html>\n"
              "|   <head>\n"
              "|   <body>\n"
              "|     <ul>\n"
              "|       <li>\n"
              "|         \"a\"\n"
              "|       <li>\n"
              "|         \"b\"\n");
}

// 2. Attributes are listed sorted below their element
TEST(DomBuilder, Attributes) {
    EXPECT_EQ(tree("<a title=t href=h>l</a>"),
              "#document\n"
              "| <html>\n"
              "|   <head>\n"
              "|   <body>\n"
              "|     <a>\n"
              "|       href=\"h\"\n"
              "|       title=\"t\"\n"
              "|       \"l\"\n");
}

// 3. Doctype and comment nodes
TEST(DomBuilder, DoctypeAndComment) {
    EXPECT_EQ(tree("<!DOCTYPE html><!--c-->"),
              "#document\n"
              "| <!DOCTYPE html>\n"
              "| <!-- c -->\n"
              "| <html>\n"
              "|   <head>\n"
              "|   <body>\n");
}

// 4. Void elements never take children
TEST(DomBuilder, VoidElements) {
    Parser parser;
    DomBuilder builder;
    parser.parse("<p>a<br>b", builder);
    const SimpleNode* p = builder.document().find_element("p");
    ASSERT_NE(p, nullptr);
    ASSERT_EQ(p->children.size(), 3u);
    EXPECT_EQ(p->children[1]->tag_name, "br");
    EXPECT_TRUE(p->children[1]->children.empty());
    EXPECT_EQ(p->children[2]->data, "b");
}

// 5. Unbalanced input: end tags close up to their match, strays are ignored
TEST(DomBuilder, UnbalancedStream) {
    EXPECT_EQ(tree("<b><i>x</b>y</p>", false),
              "#document\n"
              "| <b>\n"
              "|   <i>\n"
              "|     \"x\"\n"
              "| \"y\"\n");
}

// 6. CDATA content merges with surrounding text
TEST(DomBuilder, CDataMergesIntoText) {
    Parser parser;
    DomBuilder builder;
    parser.parse("<p>x<![CDATA[y]]>", builder);
    const SimpleNode* p = builder.document().find_element("p");
    ASSERT_NE(p, nullptr);
    ASSERT_EQ(p->children.size(), 1u);
    EXPECT_EQ(p->children[0]->type, SimpleNode::Text);
    EXPECT_EQ(p->children[0]->data, "xy");
}

// 7. Processing instructions become nodes
TEST(DomBuilder, ProcessingInstruction) {
    Parser parser;
    parser.set_feature("document-fragment", true);
    DomBuilder builder;
    parser.parse("<?php echo 1 ?>", builder);
    ASSERT_EQ(builder.document().children.size(), 1u);
    const SimpleNode& pi = *builder.document().children[0];
    EXPECT_EQ(pi.type, SimpleNode::ProcessingInstruction);
    EXPECT_EQ(pi.tag_name, "php");
    EXPECT_EQ(pi.data, "echo 1");
}

// ============================================================================
// Queries
// ============================================================================

// 8. Text content skips comments
TEST(SimpleNode, TextContent) {
    Parser parser;
    DomBuilder builder;
    parser.parse("<div>a<!--c--><b>b</b></div>", builder);
    EXPECT_EQ(builder.document().text_content(), "ab");
}

// 9. Element lookup in document order
TEST(SimpleNode, FindElements) {
    Parser parser;
    DomBuilder builder;
    parser.parse("<div id=1><p>a</p><div id=2></div></div>", builder);
    const SimpleNode* first = builder.document().find_element("div");
    ASSERT_NE(first, nullptr);
    ASSERT_NE(first->attribute("id"), nullptr);
    EXPECT_EQ(first->attribute("id")->value, "1");
    auto divs = builder.document().find_all_elements("div");
    ASSERT_EQ(divs.size(), 2u);
    EXPECT_EQ(divs[1]->attribute("id")->value, "2");
    EXPECT_EQ(divs[1]->parent, first);
    EXPECT_EQ(builder.document().find_element("span"), nullptr);
}

// 10. Document encoding comes from the start event
TEST(DomBuilder, Encoding) {
    Parser parser;
    DomBuilder builder;
    parser.parse("<meta charset=utf-8><p>\xC3\xA9", builder);
    EXPECT_EQ(builder.encoding(), "UTF-8");
    EXPECT_EQ(builder.document().find_element("p")->text_content(), "\xC3\xA9");
}

// 11. Taking the document leaves an empty one behind
TEST(DomBuilder, TakeDocument) {
    Parser parser;
    DomBuilder builder;
    parser.parse("<p>x", builder);
    auto document = builder.take_document();
    ASSERT_NE(document, nullptr);
    EXPECT_NE(document->find_element("p"), nullptr);
    EXPECT_TRUE(builder.document().children.empty());
}

// 12. A builder may be reused
TEST(DomBuilder, Reuse) {
    Parser parser;
    DomBuilder builder;
    parser.parse("<p>x", builder);
    parser.parse("<span>y", builder);
    EXPECT_EQ(builder.document().find_element("p"), nullptr);
    EXPECT_NE(builder.document().find_element("span"), nullptr);
}
