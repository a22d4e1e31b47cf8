#include <mender/html/encoding.h>
#include <gtest/gtest.h>
#include <string>

using namespace mender::html;

// ============================================================================
// Labels
// ============================================================================

// 1. Known labels, any case, trimmed
TEST(EncodingLabel, KnownLabels) {
    EXPECT_EQ(encoding_from_label("utf-8"), Encoding::Utf8);
    EXPECT_EQ(encoding_from_label("UTF8"), Encoding::Utf8);
    EXPECT_EQ(encoding_from_label(" Latin1 "), Encoding::Latin1);
    EXPECT_EQ(encoding_from_label("ISO-8859-1"), Encoding::Latin1);
    EXPECT_EQ(encoding_from_label("cp1252"), Encoding::Windows1252);
    EXPECT_EQ(encoding_from_label("us-ascii"), Encoding::Ascii);
    EXPECT_EQ(encoding_from_label("utf-16"), Encoding::Utf16Le);
    EXPECT_EQ(encoding_from_label("UTF-16BE"), Encoding::Utf16Be);
}

// 2. Unknown labels
TEST(EncodingLabel, UnknownLabel) {
    EXPECT_FALSE(encoding_from_label("klingon").has_value());
    EXPECT_FALSE(encoding_from_label("").has_value());
}

// 3. Canonical names
TEST(EncodingLabel, Names) {
    EXPECT_STREQ(encoding_name(Encoding::Utf8), "UTF-8");
    EXPECT_STREQ(encoding_name(Encoding::Windows1252), "windows-1252");
    EXPECT_STREQ(encoding_name(Encoding::Latin1), "ISO-8859-1");
    EXPECT_STREQ(encoding_source_name(EncodingSource::MetaTag), "meta");
    EXPECT_STREQ(encoding_source_name(EncodingSource::ByteOrderMark), "byte-order-mark");
}

// ============================================================================
// Sniffing
// ============================================================================

// 4. Byte order marks
TEST(EncodingSniff, ByteOrderMarks) {
    std::size_t length = 0;
    EXPECT_EQ(detect_bom("\xEF\xBB\xBFx", length), Encoding::Utf8);
    EXPECT_EQ(length, 3u);
    EXPECT_EQ(detect_bom("\xFF\xFEx", length), Encoding::Utf16Le);
    EXPECT_EQ(length, 2u);
    EXPECT_EQ(detect_bom("\xFE\xFFx", length), Encoding::Utf16Be);
    EXPECT_FALSE(detect_bom("<html>", length).has_value());
}

// 5. Meta charset
TEST(EncodingSniff, MetaCharset) {
    EncodingSource source = EncodingSource::Default;
    auto label = prescan_charset(R"(<html><head><META CHARSET="ISO-8859-1">)", source);
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(*label, "iso-8859-1");
    EXPECT_EQ(source, EncodingSource::MetaTag);
}

// 6. Meta http-equiv content type
TEST(EncodingSniff, MetaHttpEquiv) {
    EncodingSource source = EncodingSource::Default;
    auto label = prescan_charset(
        R"(<meta http-equiv="Content-Type" content="text/html; charset=utf-8">)", source);
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(*label, "utf-8");
}

// 7. XML declaration
TEST(EncodingSniff, XmlDeclaration) {
    EncodingSource source = EncodingSource::Default;
    auto label = prescan_charset(R"(<?xml version="1.0" encoding="utf-8"?><html>)", source);
    ASSERT_TRUE(label.has_value());
    EXPECT_EQ(*label, "utf-8");
    EXPECT_EQ(source, EncodingSource::XmlDeclaration);
}

// 8. Charsets inside comments are not declarations
TEST(EncodingSniff, IgnoresComments) {
    EncodingSource source = EncodingSource::Default;
    EXPECT_FALSE(prescan_charset("<!-- <meta charset=utf-8> --><p>", source).has_value());
}

// 9. Content type parameter
TEST(EncodingSniff, ContentTypeCharset) {
    EXPECT_EQ(charset_from_content_type("text/html; charset=UTF-8"), std::string("UTF-8"));
    EXPECT_EQ(charset_from_content_type("text/html;charset=\"latin1\""), std::string("latin1"));
    EXPECT_FALSE(charset_from_content_type("text/html").has_value());
}

// 10. BOM beats a declaration
TEST(EncodingDecision, BomFirst) {
    auto decision = determine_encoding("\xEF\xBB\xBF<meta charset=latin1>", Encoding::Windows1252, false);
    EXPECT_EQ(decision.encoding, Encoding::Utf8);
    EXPECT_EQ(decision.source, EncodingSource::ByteOrderMark);
    EXPECT_EQ(decision.bom_length, 3u);
}

// 11. Declaration beats the fallback
TEST(EncodingDecision, DeclarationSecond) {
    auto decision = determine_encoding("<meta charset=utf-8>", Encoding::Windows1252, false);
    EXPECT_EQ(decision.encoding, Encoding::Utf8);
    EXPECT_EQ(decision.source, EncodingSource::MetaTag);
    EXPECT_EQ(decision.declared_label, "utf-8");
    EXPECT_TRUE(decision.label_recognized);
}

// 12. Declarations ignored on request
TEST(EncodingDecision, IgnoreDeclared) {
    auto decision = determine_encoding("<meta charset=utf-8>", Encoding::Latin1, true);
    EXPECT_EQ(decision.encoding, Encoding::Latin1);
    EXPECT_EQ(decision.source, EncodingSource::Default);
}

// 13. Unknown declared label keeps the fallback
TEST(EncodingDecision, UnknownLabelKeepsFallback) {
    auto decision = determine_encoding("<meta charset=klingon>", Encoding::Windows1252, false);
    EXPECT_EQ(decision.encoding, Encoding::Windows1252);
    EXPECT_FALSE(decision.label_recognized);
    EXPECT_EQ(decision.declared_label, "klingon");
}

// 14. A byte-oriented document cannot declare UTF-16
TEST(EncodingDecision, Utf16LabelMeansUtf8) {
    auto decision = determine_encoding("<meta charset=utf-16>", Encoding::Windows1252, false);
    EXPECT_EQ(decision.encoding, Encoding::Utf8);
}

// ============================================================================
// Decoding
// ============================================================================

// 15. UTF-8 sequences of every length
TEST(EncodingDecode, Utf8) {
    auto two = decode_char(Encoding::Utf8, "\xC3\xA9", 0);
    EXPECT_EQ(two.code_point, U'\u00E9');
    EXPECT_EQ(two.length, 2u);
    auto three = decode_char(Encoding::Utf8, "\xE2\x82\xAC", 0);
    EXPECT_EQ(three.code_point, U'\u20AC');
    auto four = decode_char(Encoding::Utf8, "\xF0\x9F\x98\x80", 0);
    EXPECT_EQ(four.code_point, U'\U0001F600');
    EXPECT_EQ(four.length, 4u);
}

// 16. Malformed UTF-8 becomes U+FFFD
TEST(EncodingDecode, MalformedUtf8) {
    auto stray = decode_char(Encoding::Utf8, "\x80z", 0);
    EXPECT_EQ(stray.code_point, kReplacementChar);
    EXPECT_GE(stray.length, 1u);
    auto truncated = decode_char(Encoding::Utf8, "\xE2\x82", 0);
    EXPECT_EQ(truncated.code_point, kReplacementChar);
}

// 17. windows-1252 maps the C1 range
TEST(EncodingDecode, Windows1252) {
    EXPECT_EQ(decode_char(Encoding::Windows1252, "\x80", 0).code_point, U'\u20AC');
    EXPECT_EQ(decode_char(Encoding::Windows1252, "\x93", 0).code_point, U'\u201C');
    EXPECT_EQ(decode_char(Encoding::Windows1252, "\xE9", 0).code_point, U'\u00E9');
    EXPECT_EQ(decode_char(Encoding::Latin1, "\x80", 0).code_point, U'\u0080');
}

// 18. UTF-16 both byte orders
TEST(EncodingDecode, Utf16) {
    std::string le("A\0", 2);
    EXPECT_EQ(decode_char(Encoding::Utf16Le, le, 0).code_point, U'A');
    std::string be("\0A", 2);
    EXPECT_EQ(decode_char(Encoding::Utf16Be, be, 0).code_point, U'A');
    std::string pair("\x3D\xD8\x00\xDE", 4);
    auto decoded = decode_char(Encoding::Utf16Le, pair, 0);
    EXPECT_EQ(decoded.code_point, U'\U0001F600');
    EXPECT_EQ(decoded.length, 4u);
}

// 19. ASCII rejects the high half
TEST(EncodingDecode, Ascii) {
    EXPECT_EQ(decode_char(Encoding::Ascii, "a", 0).code_point, U'a');
    EXPECT_EQ(decode_char(Encoding::Ascii, "\xC0", 0).code_point, kReplacementChar);
}

// 20. UTF-8 encoding
TEST(EncodingDecode, ToUtf8) {
    EXPECT_EQ(to_utf8(U'A'), "A");
    EXPECT_EQ(to_utf8(U'\u00E9'), "\xC3\xA9");
    EXPECT_EQ(to_utf8(U'\u20AC'), "\xE2\x82\xAC");
    EXPECT_EQ(to_utf8(U'\U0001F600'), "\xF0\x9F\x98\x80");
}

// 21. Single-byte windows-1252 mapping
TEST(EncodingDecode, Windows1252Char) {
    EXPECT_EQ(windows1252_char(0x41), U'A');
    EXPECT_EQ(windows1252_char(0x80), U'\u20AC');
    EXPECT_EQ(windows1252_char(0x9F), U'\u0178');
    EXPECT_EQ(windows1252_char(0x81), static_cast<char32_t>(0x81));
    EXPECT_EQ(windows1252_char(0xA0), static_cast<char32_t>(0xA0));
}
