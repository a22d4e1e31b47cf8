#include <mender/html/tag_balancer.h>
#include <mender/core/error.h>
#include <mender/html/parser.h>
#include <gtest/gtest.h>
#include "recording_handler.h"
#include <string>

using namespace mender::html;
using mender::core::ParserConfig;
using mender::testing::RecordedEvent;
using mender::testing::RecordingHandler;
using mender::testing::fragment_to_string;
using mender::testing::parse_to_string;

// Wraps body content in the implied document skeleton.
static std::string document(const std::string& body) {
    return "<html><head></head><body>" + body + "</body></html>";
}

static Token tag(Token::Type type, const std::string& name) {
    Token token;
    token.type = type;
    token.name = name;
    return token;
}

static Token text(const std::string& data) {
    Token token;
    token.type = Token::Text;
    token.data = data;
    return token;
}

// ============================================================================
// Implied structure
// ============================================================================

// 1. Empty input still produces a document
TEST(TagBalancer, EmptyDocument) {
    EXPECT_EQ(parse_to_string(""), document(""));
}

// 2. Bare text lands in body
TEST(TagBalancer, BareText) {
    EXPECT_EQ(parse_to_string("Hello"), document("Hello"));
}

// 3. Leading whitespace is dropped
TEST(TagBalancer, LeadingWhitespaceDropped) {
    EXPECT_EQ(parse_to_string("  \n<p>x"), document("<p>x</p>"));
}

// 4. Head content goes into an implied head
TEST(TagBalancer, ImpliedHead) {
    EXPECT_EQ(parse_to_string("<title>T</title><p>x"),
              "<html><head><title>T</title></head><body><p>x</p></body></html>");
}

// 5. Explicit skeleton passes through
TEST(TagBalancer, ExplicitSkeleton) {
    EXPECT_EQ(parse_to_string("<html><body>x</body></html>"), document("x"));
}

// 6. </head> waits for body content
TEST(TagBalancer, HeadEndBuffered) {
    EXPECT_EQ(parse_to_string("<html><head></head>  <body>x"), document("x"));
    EXPECT_EQ(parse_to_string("<head></head><script>s</script><body>"),
              "<html><head><script>s</script></head><body></body></html>");
}

// 7. Text after head opens body
TEST(TagBalancer, TextAfterHeadOpensBody) {
    EXPECT_EQ(parse_to_string("<html><head></head>x"), document("x"));
}

// 8. Text before the first element is replayed inside body
TEST(TagBalancer, EarlyTextReplayed) {
    EXPECT_EQ(parse_to_string("hello <b>x</b>"), document("hello <b>x</b>"));
    EXPECT_EQ(parse_to_string("x<!--c-->"), document("x<!--c-->"));
}

// 9. Doctype and leading comments stay before the root
TEST(TagBalancer, DoctypeBeforeRoot) {
    EXPECT_EQ(parse_to_string("<!DOCTYPE html><!--c--><p>x"),
              "<!DOCTYPE html><!--c-->" + document("<p>x</p>"));
    EXPECT_EQ(parse_to_string("<p>x<!DOCTYPE html>"), document("<p>x</p>"));
}

// 10. Duplicate html, head and body are dropped
TEST(TagBalancer, DuplicateRootElements) {
    EXPECT_EQ(parse_to_string("<html><body><html><body>x</body></body>"), document("x"));
    EXPECT_EQ(parse_to_string("<head></head><head><title>t</title>"),
              "<html><head><title>t</title></head><body></body></html>");
}

// ============================================================================
// Closing rules
// ============================================================================

// 11. Paragraphs close each other
TEST(TagBalancer, ParagraphsClose) {
    EXPECT_EQ(parse_to_string("<p>A<p>B"), document("<p>A</p><p>B</p>"));
}

// 12. List items close each other
TEST(TagBalancer, ListItemsClose) {
    EXPECT_EQ(parse_to_string("<ul><li>a<li>b</ul>"),
              document("<ul><li>a</li><li>b</li></ul>"));
}

// 13. Definition terms and descriptions
TEST(TagBalancer, DefinitionListItems) {
    EXPECT_EQ(parse_to_string("<dl><dt>a<dd>b<dt>c</dl>"),
              document("<dl><dt>a</dt><dd>b</dd><dt>c</dt></dl>"));
}

// 14. Headings close open headings
TEST(TagBalancer, HeadingsClose) {
    EXPECT_EQ(parse_to_string("<h1>a<h2>b"), document("<h1>a</h1><h2>b</h2>"));
}

// 15. Options close each other
TEST(TagBalancer, OptionsClose) {
    EXPECT_EQ(parse_to_string("<select><option>a<option>b</select>"),
              document("<select><option>a</option><option>b</option></select>"));
}

// 16. Block inside inline is kept inside
TEST(TagBalancer, BlockInsideInline) {
    EXPECT_EQ(parse_to_string("<b>A<div>B</div>C</b>"), document("<b>A<div>B</div>C</b>"));
}

// 17. Stray end tags are dropped
TEST(TagBalancer, StrayEndTagDropped) {
    EXPECT_EQ(parse_to_string("<p>a</span>b"), document("<p>ab</p>"));
    EXPECT_EQ(parse_to_string("</div>x"), document("x"));
}

// 18. An end tag closes the elements opened inside it
TEST(TagBalancer, EndTagClosesInner) {
    EXPECT_EQ(parse_to_string("<div><span><em>x</div>y"),
              document("<div><span><em>x</em></span></div>y"));
}

// 19. Misnested inline elements are re-opened
TEST(TagBalancer, MisnestedInlineReopened) {
    EXPECT_EQ(parse_to_string("<i>a<b>b</i>c</b>"),
              document("<i>a<b>b</b></i><b>c</b>"));
}

// 20. Re-opened elements keep their attributes
TEST(TagBalancer, ReopenKeepsAttributes) {
    EXPECT_EQ(parse_to_string("<i><b class=c>x</i>y</b>"),
              document("<i><b class=\"c\">x</b></i><b class=\"c\">y</b>"));
}

// 21. Block end tag does not reach past a block
TEST(TagBalancer, InlineEndStopsAtBlock) {
    EXPECT_EQ(parse_to_string("<b><p>x</b>y</p>"), document("<b><p>x</p></b>y"));
}

// ============================================================================
// Tables
// ============================================================================

// 22. tbody is implied
TEST(TagBalancer, ImpliedTbody) {
    EXPECT_EQ(parse_to_string("<table><tr><td>A</td></tr></table>"),
              document("<table><tbody><tr><td>A</td></tr></tbody></table>"));
}

// 23. Unclosed cells and rows close at </table>
TEST(TagBalancer, UnclosedCells) {
    EXPECT_EQ(parse_to_string("<table><tr><td>a<td>b<tr><td>c</table>"),
              document("<table><tbody><tr><td>a</td><td>b</td></tr><tr><td>c</td></tr></tbody></table>"));
}

// 24. A table inside table structure closes the open table
TEST(TagBalancer, NestedTableClosesOuter) {
    EXPECT_EQ(parse_to_string("<table><table>"), document("<table></table><table></table>"));
}

// 25. A table inside a cell nests
TEST(TagBalancer, TableInsideCellNests) {
    EXPECT_EQ(parse_to_string("<table><tr><td><table></table></td></tr></table>"),
              document("<table><tbody><tr><td><table></table></td></tr></tbody></table>"));
}

// 26. A table closes open formatting elements
TEST(TagBalancer, TableClosesFormatting) {
    EXPECT_EQ(parse_to_string("<b><table><tr><td>x</td></tr></table>"),
              document("<b></b><table><tbody><tr><td>x</td></tr></tbody></table>"));
}

// ============================================================================
// Select, forms, frames
// ============================================================================

// 27. Only options survive inside select
TEST(TagBalancer, SelectContent) {
    EXPECT_EQ(parse_to_string("<select><option>a<div>b</div></select>"),
              document("<select><option>ab</option></select>"));
}

// 28. Nested forms are dropped
TEST(TagBalancer, NestedFormDropped) {
    EXPECT_EQ(parse_to_string("<form><form>x</form>"), document("<form>x</form>"));
}

// 29. Frameset documents have no body
TEST(TagBalancer, Frameset) {
    EXPECT_EQ(parse_to_string("<frameset><frame src=a></frameset>"),
              "<html><head></head><frameset><frame src=\"a\"></frame></frameset></html>");
}

// ============================================================================
// Void and self-closing elements
// ============================================================================

// 30. Void elements get an end event
TEST(TagBalancer, VoidEndEvents) {
    EXPECT_EQ(parse_to_string("<br>x"), document("<br></br>x"));
    ParserConfig config;
    config.void_end_events = false;
    EXPECT_EQ(parse_to_string("<br>x", config), document("<br>x"));
}

// 31. "/>" closes unknown elements only
TEST(TagBalancer, SelfClosing) {
    EXPECT_EQ(parse_to_string("<custom/>x"), document("<custom></custom>x"));
    EXPECT_EQ(parse_to_string("<div/>x"), document("<div>x</div>"));
    ParserConfig config;
    config.allow_selfclosing_tags = true;
    EXPECT_EQ(parse_to_string("<div/>x", config), document("<div></div>x"));
}

// ============================================================================
// Content outside body and html
// ============================================================================

// 32. Content after </body> lands inside body
TEST(TagBalancer, ContentAfterBody) {
    EXPECT_EQ(parse_to_string("<body>a</body>b"), document("ab"));
    EXPECT_EQ(parse_to_string("<p>a</p></html><p>b"), document("<p>a</p><p>b</p>"));
}

// 33. Content after </body> is dropped when configured
TEST(TagBalancer, IgnoreOutsideContent) {
    ParserConfig config;
    config.ignore_outside_content = true;
    EXPECT_EQ(parse_to_string("<body>a</body>b", config), document("a"));
}

// ============================================================================
// Fragments
// ============================================================================

// 34. Fragments have no implied skeleton
TEST(TagBalancer, Fragment) {
    EXPECT_EQ(fragment_to_string("<b>x</b><p>y"), "<b>x</b><p>y</p>");
    EXPECT_EQ(fragment_to_string("hi <b>x</b>"), "hi <b>x</b>");
    EXPECT_EQ(fragment_to_string(""), "");
}

// ============================================================================
// Other events
// ============================================================================

// 35. CDATA, comments and processing instructions pass through
TEST(TagBalancer, OtherEvents) {
    EXPECT_EQ(parse_to_string("<p><![CDATA[a<b]]><!--c--><?php x?>"),
              document("<p><![CDATA[a<b]]><!--c--><?php x></p>"));
}

// 36. XML declaration only at the start
TEST(TagBalancer, XmlDeclaration) {
    EXPECT_EQ(parse_to_string("<?xml version=\"1.0\"?><p>x"),
              "<?xml 1.0  ?>" + document("<p>x</p>"));
    EXPECT_EQ(parse_to_string("<p>x<?xml version=\"1.0\"?>"), document("<p>x</p>"));
}

// ============================================================================
// Augmentations, limits, diagnostics
// ============================================================================

// 37. Implied events are marked synthesized
TEST(TagBalancer, SynthesizedMarks) {
    mender::html::Parser parser;
    RecordingHandler handler;
    parser.parse("<p>a", handler);
    ASSERT_GE(handler.events.size(), 2u);
    const auto& html = handler.events[1];
    EXPECT_EQ(html.text, "<html>");
    EXPECT_TRUE(html.augs.synthesized);
    ASSERT_TRUE(html.augs.location.has_value());
    EXPECT_EQ(html.augs.location->begin_column, 1);

    auto starts = handler.of_kind(RecordedEvent::StartElement);
    ASSERT_EQ(starts.size(), 4u);
    EXPECT_EQ(starts[3]->name, "p");
    EXPECT_FALSE(starts[3]->augs.synthesized);

    auto ends = handler.of_kind(RecordedEvent::EndElement);
    ASSERT_FALSE(ends.empty());
    EXPECT_EQ(ends[1]->name, "p");
    EXPECT_TRUE(ends[1]->augs.synthesized);
}

// 38. Streams are always well nested
TEST(TagBalancer, AlwaysWellNested) {
    const char* inputs[] = {
        "<b><i><u>x</b></i></u>",
        "<table><td><p><li>x</table>y",
        "</p></p><p></b>",
        "<select><table><tr><td>x",
        "<form><table><form><tr><td></form>",
        "<html><frameset><body>x",
        "<a><a><a>x",
    };
    for (const char* input : inputs) {
        mender::html::Parser parser;
        RecordingHandler handler;
        parser.parse(input, handler);
        EXPECT_TRUE(handler.well_nested()) << input << " -> " << handler.str();
        EXPECT_EQ(handler.start_documents, 1) << input;
        EXPECT_EQ(handler.end_documents, 1) << input;
    }
}

// 39. Nesting past max-depth closes the stream and throws
TEST(TagBalancer, MaxDepth) {
    ParserConfig config;
    config.max_depth = 3;
    mender::html::Parser parser{mender::core::Configuration(config)};
    RecordingHandler handler;
    try {
        parser.parse("<div><div><div>", handler);
        FAIL() << "expected LimitError";
    } catch (const mender::core::LimitError& error) {
        EXPECT_EQ(error.depth(), 3u);
    }
    EXPECT_EQ(handler.str(), document("<div></div>"));
    EXPECT_TRUE(handler.well_nested());
    EXPECT_EQ(handler.end_documents, 1);
}

// 40. Recovery is reported when errors are reported
TEST(TagBalancer, Diagnostics) {
    ParserConfig config;
    config.report_errors = true;
    mender::core::DiagnosticEmitter diagnostics;
    RecordingHandler handler;
    TagBalancer balancer(handler, config, &diagnostics);
    balancer.start_document("UTF-8", {});
    balancer.process(tag(Token::StartTag, "p"));
    balancer.process(text("a"));
    balancer.process(tag(Token::EndTag, "span"));
    balancer.process(Token{});
    EXPECT_TRUE(balancer.finished());
    EXPECT_EQ(balancer.depth(), 0u);

    auto end_tags = diagnostics.events_by_stage("end-tag");
    ASSERT_EQ(end_tags.size(), 1u);
    EXPECT_EQ(end_tags[0].module, "balancer");
    EXPECT_FALSE(diagnostics.events_by_stage("start-tag").empty());
}

// 41. The open element stack is visible while balancing
TEST(TagBalancer, OpenElements) {
    RecordingHandler handler;
    TagBalancer balancer(handler, ParserConfig{});
    balancer.start_document("UTF-8", {});
    balancer.process(tag(Token::StartTag, "div"));
    balancer.process(tag(Token::StartTag, "span"));
    ASSERT_EQ(balancer.depth(), 4u);
    EXPECT_EQ(balancer.open_elements()[0].name, "html");
    EXPECT_EQ(balancer.open_elements()[3].name, "span");
    balancer.end_document({});
    EXPECT_EQ(balancer.depth(), 0u);
    EXPECT_TRUE(handler.well_nested());
    balancer.process(tag(Token::StartTag, "p"));
    EXPECT_EQ(handler.end_documents, 1);
}

// ============================================================================
// Optional balancing features
// ============================================================================

// 42. Self-closing iframes when allowed
TEST(TagBalancer, SelfClosingIframe) {
    EXPECT_EQ(parse_to_string("<iframe/>x"), document("<iframe>x</iframe>"));
    ParserConfig config;
    config.allow_selfclosing_iframe = true;
    EXPECT_EQ(parse_to_string("<iframe/>x", config), document("<iframe></iframe>x"));
}

// 43. Fragment parsed inside an open context
TEST(TagBalancer, FragmentContext) {
    mender::core::Configuration configuration;
    configuration.set_feature("document-fragment", true);
    configuration.set_property("fragment-context-stack", "html body table tbody");
    mender::html::Parser parser{configuration};

    RecordingHandler rows;
    parser.parse("<tr><td>a</td></tr>", rows);
    EXPECT_EQ(rows.str(), "<tr><td>a</td></tr>");
    EXPECT_TRUE(rows.well_nested());

    RecordingHandler unclosed;
    parser.parse("<tr><td>a", unclosed);
    EXPECT_EQ(unclosed.str(), "<tr><td>a</td></tr>");

    // Context elements cannot be closed from inside the fragment.
    RecordingHandler stray;
    parser.parse("a</tbody></table>b", stray);
    EXPECT_EQ(stray.str(), "ab");
}

// 44. An open context element is not closed by its closing set
TEST(TagBalancer, FragmentContextNotClosed) {
    ParserConfig config;
    config.document_fragment = true;
    config.fragment_context = {"body", "p"};
    EXPECT_EQ(parse_to_string("x<p>y", config), "x<p>y</p>");
}

// 45. CDATA reported as a comment passes through as a comment
TEST(TagBalancer, CDataAsComment) {
    ParserConfig config;
    config.cdata_sections = false;
    EXPECT_EQ(parse_to_string("<p><![CDATA[x]]>", config), document("<p><!--[CDATA[x]]--></p>"));
}

// 46. An inserted doctype wins over the document's own
TEST(TagBalancer, InsertDoctype) {
    ParserConfig config;
    config.insert_doctype = true;
    EXPECT_EQ(parse_to_string("<p>a", config), "<!DOCTYPE html>" + document("<p>a</p>"));
    EXPECT_EQ(parse_to_string("<!DOCTYPE foo><p>a", config), "<!DOCTYPE html>" + document("<p>a</p>"));
}

// 47. Synthesized events keep the items of the event that caused them
TEST(TagBalancer, SynthesizedEventsKeepItems) {
    RecordingHandler handler;
    TagBalancer balancer(handler, ParserConfig{});
    balancer.start_document("UTF-8", {});
    Token p = tag(Token::StartTag, "p");
    p.augs.set_item("origin", "feed");
    balancer.process(p);
    balancer.process(Token{});

    auto starts = handler.of_kind(RecordedEvent::StartElement);
    ASSERT_EQ(starts.size(), 4u);
    EXPECT_TRUE(starts[0]->augs.synthesized);
    ASSERT_NE(starts[0]->augs.item("origin"), nullptr);
    EXPECT_EQ(*starts[0]->augs.item("origin"), "feed");

    auto ends = handler.of_kind(RecordedEvent::EndElement);
    ASSERT_EQ(ends.size(), 4u);
    EXPECT_EQ(ends[1]->name, "p");
    EXPECT_TRUE(ends[1]->augs.synthesized);
    ASSERT_NE(ends[1]->augs.item("origin"), nullptr);
}

// 48. Discarded elements do not swallow later end tags
TEST(TagBalancer, DiscardedStarts) {
    EXPECT_EQ(parse_to_string("<body>a<body>b</body>c"), document("abc"));

    std::string input = "<select>";
    for (int i = 0; i < 5000; ++i) input += "<div>";
    input += "<option>a</select>b";
    EXPECT_EQ(parse_to_string(input), document("<select><option>a</option></select>b"));
}

// 49. Select keeps its option groups
TEST(TagBalancer, SelectOptionGroups) {
    EXPECT_EQ(parse_to_string("<select><optgroup><option>a</select>"),
              document("<select><optgroup><option>a</option></optgroup></select>"));
}

// 50. A form directly in table structure is closed at once
TEST(TagBalancer, FormInTable) {
    EXPECT_EQ(parse_to_string("<table><form></table>"), document("<table><form></form></table>"));
    EXPECT_EQ(parse_to_string("<table><tr><td><form>x</form></table>"),
              document("<table><tbody><tr><td><form>x</form></td></tr></tbody></table>"));
}
