#include <mender/html/encoding.h>
#include <mender/html/entity_resolver.h>
#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <string_view>

using namespace mender::html;

// Helper: feed text to a cursor until it stops
static EntityCursor run_cursor(std::u32string_view text) {
    EntityCursor cursor;
    for (char32_t c : text) {
        if (!cursor.should_continue()) break;
        cursor = step(cursor, c);
    }
    return cursor;
}

static NumericReferenceCursor run_numeric(std::u32string_view text, bool at_end = false) {
    NumericReferenceCursor cursor;
    for (char32_t c : text) {
        if (!cursor.should_continue()) break;
        cursor = step(cursor, c);
    }
    if (at_end && cursor.should_continue()) {
        cursor = cursor.finish();
    }
    return cursor;
}

// ============================================================================
// Trie
// ============================================================================

// 1. Every named reference is loaded
TEST(EntityTrie, LoadsFullTable) {
    const auto& trie = EntityTrie::instance();
    EXPECT_EQ(trie.entity_count(), 2231u);
    EXPECT_GT(trie.node_count(), trie.entity_count());
    EXPECT_EQ(&trie, &EntityTrie::instance());
}

// 2. Semicolon-terminated lookup stops at the terminal node
TEST(EntityTrie, LookupTerminated) {
    auto state = lookup_entity("amp;rest");
    EXPECT_TRUE(state.is_match);
    EXPECT_TRUE(state.end_node);
    EXPECT_TRUE(state.ends_with_semicolon);
    EXPECT_EQ(state.resolved_value, "&");
    EXPECT_EQ(state.entity_or_fragment, "amp;");
    EXPECT_EQ(state.length, 4u);
}

// 3. Longest legacy prefix
TEST(EntityTrie, LookupLegacyPrefix) {
    auto state = lookup_entity("notit;");
    EXPECT_TRUE(state.is_match);
    EXPECT_FALSE(state.ends_with_semicolon);
    EXPECT_EQ(state.entity_or_fragment, "not");
    EXPECT_EQ(state.resolved_value, "\xC2\xAC");
}

// 4. Longer names win over their legacy prefix
TEST(EntityTrie, LookupPrefersLongerName) {
    auto state = lookup_entity("notin;");
    EXPECT_TRUE(state.is_match);
    EXPECT_EQ(state.entity_or_fragment, "notin;");
    EXPECT_EQ(state.resolved_value, "\xE2\x88\x89");
}

// 5. No match
TEST(EntityTrie, LookupNoMatch) {
    auto state = lookup_entity("zzz;");
    EXPECT_FALSE(state.is_match);
    EXPECT_EQ(state.entity_or_fragment, "z");
}

// 6. Values with two code points
TEST(EntityTrie, TwoCodePointValue) {
    auto state = lookup_entity("nvlt;");
    EXPECT_TRUE(state.is_match);
    EXPECT_EQ(state.resolved_value, "<\xE2\x83\x92");
}

// 7. Names are case-sensitive
TEST(EntityTrie, CaseSensitive) {
    EXPECT_EQ(lookup_entity("Eacute;").resolved_value, "\xC3\x89");
    EXPECT_EQ(lookup_entity("eacute;").resolved_value, "\xC3\xA9");
}

// 8. Reverse lookup prefers terminated, short, lower-case names
TEST(EntityTrie, ReverseLookup) {
    EXPECT_EQ(entity_reference_for("&"), "&amp;");
    EXPECT_EQ(entity_reference_for("<"), "&lt;");
    EXPECT_EQ(entity_reference_for("\""), "&quot;");
    EXPECT_EQ(entity_reference_for("\xC3\xA9"), "&eacute;");
    EXPECT_EQ(entity_reference_for("\xC2\xA0"), "&nbsp;");
    EXPECT_EQ(entity_reference_for("x"), "");
}

// ============================================================================
// EntityCursor
// ============================================================================

// 9. Cursor stops at the terminating semicolon
TEST(EntityCursor, StopsAtSemicolon) {
    auto cursor = run_cursor(U"amp;x");
    EXPECT_FALSE(cursor.should_continue());
    EXPECT_EQ(cursor.consumed(), 4u);
    EXPECT_EQ(cursor.rewind_count(), 0u);
    EXPECT_TRUE(cursor.ends_with_semicolon());
    ASSERT_TRUE(cursor.current_match().has_value());
    EXPECT_EQ(cursor.current_match()->resolved_value, "&");
}

// 10. Cursor remembers the last accepting state
TEST(EntityCursor, RewindsToLastMatch) {
    auto cursor = run_cursor(U"copyx");
    EXPECT_FALSE(cursor.should_continue());
    EXPECT_EQ(cursor.consumed(), 5u);
    EXPECT_EQ(cursor.rewind_count(), 1u);
    EXPECT_FALSE(cursor.ends_with_semicolon());
    ASSERT_TRUE(cursor.current_match().has_value());
    EXPECT_EQ(cursor.current_match()->length, 4u);
}

// 11. Step leaves its argument untouched
TEST(EntityCursor, StepIsPure) {
    EntityCursor start;
    auto advanced = step(start, U'a');
    EXPECT_EQ(start.consumed(), 0u);
    EXPECT_EQ(advanced.consumed(), 1u);
    EXPECT_TRUE(advanced.should_continue());
}

// 12. Dead end without any match
TEST(EntityCursor, DeadEnd) {
    auto cursor = run_cursor(U"qq");
    EXPECT_FALSE(cursor.should_continue());
    EXPECT_FALSE(cursor.current_match().has_value());
    EXPECT_EQ(cursor.rewind_count(), cursor.consumed());
}

// 13. A stopped cursor ignores further input
TEST(EntityCursor, StoppedCursorIgnoresInput) {
    auto cursor = run_cursor(U"lt;");
    auto after = step(cursor, U'x');
    EXPECT_EQ(after.consumed(), cursor.consumed());
}

// ============================================================================
// NumericReferenceCursor
// ============================================================================

// 14. Decimal and hexadecimal
TEST(NumericReference, DecimalAndHex) {
    auto dec = run_numeric(U"65;");
    EXPECT_TRUE(dec.ends_with_semicolon());
    EXPECT_EQ(dec.current_match(), std::string("A"));
    EXPECT_EQ(dec.rewind_count(), 0u);
    EXPECT_FALSE(dec.hexadecimal());

    auto hex = run_numeric(U"x20AC;");
    EXPECT_TRUE(hex.hexadecimal());
    EXPECT_EQ(hex.current_match(), std::string("\xE2\x82\xAC"));
}

// 15. Missing semicolon gives back the terminator
TEST(NumericReference, MissingSemicolon) {
    auto cursor = run_numeric(U"65x");
    EXPECT_FALSE(cursor.should_continue());
    EXPECT_FALSE(cursor.ends_with_semicolon());
    EXPECT_EQ(cursor.current_match(), std::string("A"));
    EXPECT_EQ(cursor.rewind_count(), 1u);
}

// 16. End of input while reading digits
TEST(NumericReference, EndOfInput) {
    auto cursor = run_numeric(U"66", true);
    EXPECT_EQ(cursor.current_match(), std::string("B"));
    EXPECT_EQ(cursor.rewind_count(), 0u);
}

// 17. No digits
TEST(NumericReference, NoDigits) {
    auto plain = run_numeric(U"q");
    EXPECT_FALSE(plain.current_match().has_value());
    EXPECT_EQ(plain.rewind_count(), plain.consumed());
    auto hex = run_numeric(U"x;");
    EXPECT_FALSE(hex.current_match().has_value());
    auto empty = run_numeric(U"", true);
    EXPECT_FALSE(empty.current_match().has_value());
}

// 18. Oversized values do not overflow
TEST(NumericReference, HugeValue) {
    auto cursor = run_numeric(U"99999999999999999999;");
    EXPECT_EQ(cursor.current_match(), std::string("\xEF\xBF\xBD"));
}

// 19. Remapping table
TEST(NumericReference, Remap) {
    EXPECT_EQ(remap_numeric_reference(0), kReplacementChar);
    EXPECT_EQ(remap_numeric_reference(0xD800), kReplacementChar);
    EXPECT_EQ(remap_numeric_reference(0x110000), kReplacementChar);
    EXPECT_EQ(remap_numeric_reference(0x80), U'\u20AC');
    EXPECT_EQ(remap_numeric_reference(0x98), U'\u02DC');
    EXPECT_EQ(remap_numeric_reference(0x81), static_cast<char32_t>(0x81));
    EXPECT_EQ(remap_numeric_reference(0x41), U'A');
    for (std::uint32_t code = 0x80; code <= 0x9F; ++code) {
        EXPECT_EQ(remap_numeric_reference(code), windows1252_char(static_cast<unsigned char>(code))) << code;
    }
}

// ============================================================================
// Lookup results
// ============================================================================

// 20. Terminated name with a non-ASCII value
TEST(EntityTrie, LookupBeta) {
    auto state = lookup_entity("Beta;");
    EXPECT_TRUE(state.is_match);
    EXPECT_TRUE(state.end_node);
    EXPECT_TRUE(state.ends_with_semicolon);
    EXPECT_EQ(state.resolved_value, "\xCE\x92");
    EXPECT_EQ(state.length, 5u);
}

// 21. Legacy name and its terminated form
TEST(EntityTrie, LookupLegacyAndTerminatedForms) {
    auto legacy = lookup_entity("gt");
    EXPECT_TRUE(legacy.is_match);
    EXPECT_FALSE(legacy.end_node);
    EXPECT_FALSE(legacy.ends_with_semicolon);
    EXPECT_EQ(legacy.length, 2u);
    EXPECT_EQ(legacy.resolved_value, ">");

    auto terminated = lookup_entity("gt;");
    EXPECT_TRUE(terminated.is_match);
    EXPECT_TRUE(terminated.end_node);
    EXPECT_EQ(terminated.length, 3u);
    EXPECT_EQ(terminated.resolved_value, ">");
}

// 22. A dead end reports the longest walked prefix
TEST(EntityTrie, LookupDeadEndFragment) {
    auto state = lookup_entity("abc;");
    EXPECT_FALSE(state.is_match);
    EXPECT_EQ(state.entity_or_fragment, "ab");
    EXPECT_EQ(state.length, 2u);
}

// 23. The legacy prefix of a longer walk is not an end node
TEST(EntityTrie, LookupLegacyPrefixLength) {
    auto state = lookup_entity("notit;");
    EXPECT_TRUE(state.is_match);
    EXPECT_FALSE(state.end_node);
    EXPECT_EQ(state.length, 3u);
}

// 24. Rewinding to the match and stepping again gives the same match
TEST(EntityCursor, RescanAfterRewind) {
    for (std::u32string_view text : {U"copyx", U"notit;", U"amp;", U"ltx"}) {
        auto first = run_cursor(text);
        ASSERT_TRUE(first.current_match().has_value()) << text.size();
        auto kept = text.substr(0, first.consumed() - first.rewind_count());
        auto again = run_cursor(kept);
        ASSERT_TRUE(again.current_match().has_value());
        EXPECT_EQ(again.current_match()->length, first.current_match()->length);
        EXPECT_EQ(again.current_match()->resolved_value, first.current_match()->resolved_value);
        EXPECT_EQ(again.rewind_count(), 0u);

        auto repeat = run_cursor(text);
        EXPECT_EQ(repeat.consumed(), first.consumed());
        EXPECT_EQ(repeat.rewind_count(), first.rewind_count());
    }
}
