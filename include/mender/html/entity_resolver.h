#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mender::html {

// Result of one named reference lookup.
struct MatchState {
    bool is_match = false;
    bool end_node = false;             // no longer name can match
    bool ends_with_semicolon = false;
    std::string resolved_value;        // UTF-8, may hold two code points
    std::string entity_or_fragment;    // matched name, or longest dead-end prefix
    std::size_t length = 0;            // characters consumed by the match
};

// Compiled trie over all named character references. Built once on first
// use and never mutated afterwards, so lookups may run concurrently.
class EntityTrie {
public:
    struct Node {
        std::vector<std::pair<char32_t, std::uint32_t>> children;  // sorted by char
        std::string_view value;
        std::uint16_t depth = 0;
        bool is_match = false;
        bool end_node = false;
        bool ends_with_semicolon = false;
    };

    static const EntityTrie& instance();

    const Node& root() const { return nodes_[0]; }
    const Node& node(std::uint32_t index) const { return nodes_[index]; }

    // Child of parent for c, or nullopt. Characters outside the range of
    // the level reject without a search.
    std::optional<std::uint32_t> child(std::uint32_t parent, char32_t c) const;

    // Text after '&'. Follows the longest accepting prefix.
    MatchState lookup(std::string_view text) const;

    // "&lt;" for "<". Prefers semicolon-terminated, then shorter, then
    // lower-case names. Empty when value has no named reference.
    std::string entity_reference_for(std::string_view value) const;

    std::size_t node_count() const { return nodes_.size(); }
    std::size_t entity_count() const { return entity_count_; }

private:
    EntityTrie();
    void add(std::string_view name, std::string_view value);

    std::vector<Node> nodes_;
    // Dense table for the first character.
    std::vector<std::uint32_t> root_index_;
    char32_t root_offset_ = 0;
    std::unordered_map<std::string, std::string> reverse_;
    std::size_t entity_count_ = 0;
};

// Incremental named reference matcher. A plain value: step() returns the
// advanced cursor and leaves the argument untouched.
class EntityCursor {
public:
    EntityCursor() = default;

    bool should_continue() const { return !done_; }
    std::size_t consumed() const { return consumed_; }

    // Longest accepting state seen so far.
    std::optional<MatchState> current_match() const;

    // Characters read past the last accepting state.
    std::size_t rewind_count() const;
    bool ends_with_semicolon() const;

    friend EntityCursor step(EntityCursor cursor, char32_t c);

private:
    std::uint32_t node_ = 0;
    std::optional<std::uint32_t> best_;
    std::size_t consumed_ = 0;
    bool done_ = false;
};

EntityCursor step(EntityCursor cursor, char32_t c);

// Numeric reference matcher, fed the characters after "&#".
class NumericReferenceCursor {
public:
    NumericReferenceCursor() = default;

    bool should_continue() const { return state_ == State::Start || state_ == State::HexStart ||
                                          state_ == State::Decimal || state_ == State::Hex; }
    std::size_t consumed() const { return consumed_; }

    // Decoded UTF-8 value, nullopt when no digits were seen. After end of
    // input call finish() first.
    std::optional<std::string> current_match() const;
    std::size_t rewind_count() const { return consumed_ - match_length_; }
    bool ends_with_semicolon() const { return state_ == State::Terminated; }
    bool hexadecimal() const { return hex_; }

    // The input ended while digits were still being read.
    NumericReferenceCursor finish() const;

    friend NumericReferenceCursor step(NumericReferenceCursor cursor, char32_t c);

private:
    enum class State {
        Start,
        HexStart,
        Decimal,
        Hex,
        Terminated,
        SemicolonMissing,
        NoDigits,
    };

    NumericReferenceCursor matched(State state, std::size_t match_length) const;

    State state_ = State::Start;
    std::uint32_t code_ = 0;
    std::size_t consumed_ = 0;
    std::size_t match_length_ = 0;
    bool hex_ = false;
};

NumericReferenceCursor step(NumericReferenceCursor cursor, char32_t c);

// Maps a decoded reference value to the code point browsers use: 0,
// surrogates and values past U+10FFFF become U+FFFD, 0x80-0x9F follow
// windows-1252.
char32_t remap_numeric_reference(std::uint32_t code);

// Convenience wrappers over EntityTrie::instance().
MatchState lookup_entity(std::string_view text);
std::string entity_reference_for(std::string_view value);

} // namespace mender::html
