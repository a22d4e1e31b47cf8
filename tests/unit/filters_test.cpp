#include <mender/filters/element_remover.h>
#include <mender/filters/event_filter.h>
#include <mender/filters/event_printer.h>
#include <mender/filters/html_writer.h>
#include <mender/html/parser.h>
#include <gtest/gtest.h>
#include "recording_handler.h"
#include <sstream>
#include <string>

using namespace mender::filters;
using mender::core::ParserConfig;
using mender::html::Parser;
using mender::testing::RecordingHandler;

static std::string write_html(std::string_view input, const ParserConfig& config = ParserConfig{}) {
    Parser parser{mender::core::Configuration(config)};
    std::ostringstream out;
    HtmlWriter writer(out);
    parser.parse(input, writer);
    return out.str();
}

static std::string print_events(std::string_view input, bool fragment, bool mark = false) {
    ParserConfig config;
    config.document_fragment = fragment;
    Parser parser{mender::core::Configuration(config)};
    std::ostringstream out;
    EventPrinter printer(out);
    printer.set_mark_synthesized(mark);
    parser.parse(input, printer);
    return out.str();
}

static ParserConfig utf8_config() {
    ParserConfig config;
    config.default_encoding = "UTF-8";
    return config;
}

// ============================================================================
// EventFilter
// ============================================================================

// 1. Forwards to the next handler
TEST(EventFilter, Forwards) {
    RecordingHandler sink;
    EventFilter filter(&sink);
    Parser parser;
    parser.parse("<p>x", filter);
    EXPECT_EQ(sink.str(), "<html><head></head><body><p>x</p></body></html>");
    EXPECT_EQ(filter.next(), &sink);
}

// 2. Drops events without a next handler
TEST(EventFilter, DropsWithoutNext) {
    EventFilter filter;
    Parser parser;
    EXPECT_NO_THROW(parser.parse("<p>x", filter));
    RecordingHandler sink;
    filter.set_next(&sink);
    parser.parse("y", filter);
    EXPECT_EQ(sink.str(), "<html><head></head><body>y</body></html>");
}

// ============================================================================
// ElementRemover
// ============================================================================

// 3. Accepted, removed and stripped elements
TEST(ElementRemover, AcceptRemoveStrip) {
    RecordingHandler sink;
    ElementRemover remover(&sink);
    remover.accept_element("p");
    remover.accept_element("b");
    remover.accept_element("A", {"HREF"});
    remover.remove_element("script");
    Parser parser;
    parser.parse("<p>Hi <script>x</script><b class=c>b</b><span>s</span> "
                 "<a href=u title=t>l</a></p>", remover);
    EXPECT_EQ(sink.str(), "<p>Hi <b>b</b>s <a href=\"u\">l</a></p>");
}

// 4. Removed content includes nested elements
TEST(ElementRemover, RemovesNestedContent) {
    RecordingHandler sink;
    ElementRemover remover(&sink);
    remover.accept_element("div");
    remover.remove_element("ul");
    Parser parser;
    parser.parse("<div>a<ul><li>b<li>c</ul>d</div>", remover);
    EXPECT_EQ(sink.str(), "<div>ad</div>");
}

// 5. Void elements do not disturb depth tracking
TEST(ElementRemover, VoidElements) {
    RecordingHandler sink;
    ElementRemover remover(&sink);
    remover.accept_element("br");
    remover.accept_element("p");
    remover.remove_element("img");
    Parser parser;
    parser.parse("<p>a<img src=x>b<br>c</p>", remover);
    EXPECT_EQ(sink.str(), "<p>ab<br></br>c</p>");
}

// 6. Comments inside removed elements vanish
TEST(ElementRemover, CommentsInsideRemoved) {
    RecordingHandler sink;
    ElementRemover remover(&sink);
    remover.remove_element("div");
    Parser parser;
    parser.parse("<!--a--><div><!--b--></div>", remover);
    EXPECT_EQ(sink.str(), "<!--a-->");
}

// 7. Lookups are case-insensitive
TEST(ElementRemover, CaseInsensitive) {
    ElementRemover remover;
    remover.accept_element("P");
    remover.remove_element("Script");
    EXPECT_TRUE(remover.accepted("p"));
    EXPECT_TRUE(remover.removed("SCRIPT"));
    EXPECT_FALSE(remover.accepted("div"));
}

// ============================================================================
// HtmlWriter
// ============================================================================

// 8. Text and attributes are escaped
TEST(HtmlWriter, Escaping) {
    EXPECT_EQ(write_html("<p class=\"x&quot;y\">a &amp; b &lt; \xC3\xA9</p>", utf8_config()),
              "<html><head></head><body><p class=\"x&quot;y\">a &amp; b &lt; &eacute;</p></body></html>");
}

// 9. Raw text is written as is
TEST(HtmlWriter, RawText) {
    EXPECT_EQ(write_html("<script>a<b && c</script>"),
              "<html><head><script>a<b && c</script></head><body></body></html>");
}

// 10. CDATA is written as is
TEST(HtmlWriter, CData) {
    EXPECT_EQ(write_html("<p><![CDATA[a<b]]>"),
              "<html><head></head><body><p><![CDATA[a<b]]></p></body></html>");
}

// 11. Void elements have no end tag, valueless attributes no value
TEST(HtmlWriter, VoidAndValueless) {
    EXPECT_EQ(write_html("<input disabled><br>"),
              "<html><head></head><body><input disabled><br></body></html>");
}

// 12. Doctype and leading comment
TEST(HtmlWriter, DoctypeAndComment) {
    EXPECT_EQ(write_html("<!DOCTYPE html PUBLIC \"p\" \"s\"><!--c--><p>x"),
              "<!DOCTYPE html PUBLIC \"p\" \"s\">\n<!--c-->\n"
              "<html><head></head><body><p>x</p></body></html>");
}

// 13. Declared charsets are rewritten to UTF-8
TEST(HtmlWriter, CharsetRewritten) {
    EXPECT_EQ(write_html("<meta charset=latin1><p>\xE9"),
              "<html><head><meta charset=\"UTF-8\"></head><body><p>&eacute;</p></body></html>");
    EXPECT_EQ(write_html("<meta http-equiv=Content-Type content=\"text/html; charset=iso-8859-1\">"),
              "<html><head><meta http-equiv=\"Content-Type\" "
              "content=\"text/html; charset=UTF-8\"></head><body></body></html>");
}

// 14. Escape helpers
TEST(HtmlWriter, EscapeHelpers) {
    EXPECT_EQ(HtmlWriter::escape_text("a<b>&c"), "a&lt;b&gt;&amp;c");
    EXPECT_EQ(HtmlWriter::escape_text("\xE2\x82\xAC"), "&euro;");
    EXPECT_EQ(HtmlWriter::escape_text("\"'"), "\"'");
    EXPECT_EQ(HtmlWriter::escape_attribute("a\"b&c<"), "a&quot;b&amp;c<");
}

// 15. Events are forwarded after writing
TEST(HtmlWriter, ForwardsEvents) {
    std::ostringstream out;
    RecordingHandler sink;
    HtmlWriter writer(out, &sink);
    Parser parser;
    parser.parse("<p>x", writer);
    EXPECT_EQ(sink.str(), out.str());
}

// ============================================================================
// EventPrinter
// ============================================================================

// 16. One line per event, attributes sorted
TEST(EventPrinter, Lines) {
    EXPECT_EQ(print_events("<p id=a class=b>x\ny</p>", true),
              "(p\nAclass b\nAid a\n\"x\\ny\n)p\n");
}

// 17. Comments, processing instructions, doctype, CDATA
TEST(EventPrinter, OtherEvents) {
    EXPECT_EQ(print_events("<!DOCTYPE html><!--c--><?php x?><![CDATA[d]]>", true),
              "!html \"\" \"\"\n#c\n?php x\n[\n\"d\n]\n");
}

// 18. Synthesized events are marked on request
TEST(EventPrinter, MarksSynthesized) {
    EXPECT_EQ(print_events("<p>x", false, true),
              "(html *\n(head *\n)head *\n(body *\n(p\n\"x\n)p *\n)body *\n)html *\n");
}

// 19. Escaping
TEST(EventPrinter, Escape) {
    EXPECT_EQ(EventPrinter::escape("a\tb\\c\n"), "a\\tb\\\\c\\n");
}
