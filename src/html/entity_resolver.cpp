#include <mender/html/entity_resolver.h>
#include <mender/html/encoding.h>
#include "entity_table.h"
#include <algorithm>
#include <cctype>

namespace mender::html {

namespace {

std::size_t uppercase_count(std::string_view s) {
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(),
        [](unsigned char c) { return std::isupper(c) != 0; }));
}

// True when candidate is a better canonical reference than current.
bool preferred_reference(std::string_view candidate, std::string_view current) {
    bool candidate_semi = !candidate.empty() && candidate.back() == ';';
    bool current_semi = !current.empty() && current.back() == ';';
    if (candidate_semi != current_semi) return candidate_semi;
    if (candidate.size() != current.size()) return candidate.size() < current.size();
    auto candidate_upper = uppercase_count(candidate);
    auto current_upper = uppercase_count(current);
    if (candidate_upper != current_upper) return candidate_upper < current_upper;
    return candidate < current;
}

} // namespace

const EntityTrie& EntityTrie::instance() {
    static const EntityTrie trie;
    return trie;
}

EntityTrie::EntityTrie() {
    nodes_.emplace_back();
    for (std::size_t i = 0; i < detail::kEntityTableSize; ++i) {
        add(detail::kEntityTable[i].name, detail::kEntityTable[i].value);
    }

    const auto& first_level = nodes_[0].children;
    if (!first_level.empty()) {
        root_offset_ = first_level.front().first;
        root_index_.assign(first_level.back().first - root_offset_ + 1, 0);
        for (const auto& [c, index] : first_level) {
            root_index_[c - root_offset_] = index;
        }
    }
}

void EntityTrie::add(std::string_view name, std::string_view value) {
    ++entity_count_;
    std::uint32_t current = 0;
    for (std::size_t i = 0; i < name.size(); ++i) {
        char32_t c = static_cast<unsigned char>(name[i]);
        auto& children = nodes_[current].children;
        auto it = std::lower_bound(children.begin(), children.end(), c,
            [](const std::pair<char32_t, std::uint32_t>& entry, char32_t key) {
                return entry.first < key;
            });
        if (it != children.end() && it->first == c) {
            current = it->second;
            continue;
        }
        auto index = static_cast<std::uint32_t>(nodes_.size());
        children.insert(it, {c, index});
        Node node;
        node.depth = static_cast<std::uint16_t>(i + 1);
        nodes_.push_back(std::move(node));
        current = index;
    }

    Node& terminal = nodes_[current];
    terminal.is_match = true;
    terminal.value = value;
    terminal.ends_with_semicolon = name.back() == ';';
    terminal.end_node = terminal.ends_with_semicolon;

    std::string reference = "&" + std::string(name);
    auto found = reverse_.find(std::string(value));
    if (found == reverse_.end()) {
        reverse_.emplace(std::string(value), std::move(reference));
    } else if (preferred_reference(reference, found->second)) {
        found->second = std::move(reference);
    }
}

std::optional<std::uint32_t> EntityTrie::child(std::uint32_t parent, char32_t c) const {
    if (parent == 0) {
        if (c < root_offset_ || c - root_offset_ >= root_index_.size()) return std::nullopt;
        std::uint32_t index = root_index_[c - root_offset_];
        if (index == 0) return std::nullopt;
        return index;
    }
    const auto& children = nodes_[parent].children;
    if (children.empty() || c < children.front().first || c > children.back().first) {
        return std::nullopt;
    }
    auto it = std::lower_bound(children.begin(), children.end(), c,
        [](const std::pair<char32_t, std::uint32_t>& entry, char32_t key) {
            return entry.first < key;
        });
    if (it == children.end() || it->first != c) return std::nullopt;
    return it->second;
}

MatchState EntityTrie::lookup(std::string_view text) const {
    auto make_state = [&](std::uint32_t index) {
        const Node& n = nodes_[index];
        MatchState state;
        state.is_match = n.is_match;
        state.end_node = n.end_node;
        state.ends_with_semicolon = n.ends_with_semicolon;
        state.resolved_value = std::string(n.value);
        state.entity_or_fragment = std::string(text.substr(0, n.depth));
        state.length = n.depth;
        return state;
    };

    std::uint32_t last = 0;
    std::optional<std::uint32_t> last_match;
    for (char ch : text) {
        auto next = child(last, static_cast<unsigned char>(ch));
        if (!next) {
            break;
        }
        if (nodes_[*next].end_node) {
            return make_state(*next);
        }
        if (nodes_[*next].is_match) {
            last_match = next;
        }
        last = *next;
    }
    return make_state(last_match ? *last_match : last);
}

std::string EntityTrie::entity_reference_for(std::string_view value) const {
    auto it = reverse_.find(std::string(value));
    if (it == reverse_.end()) return {};
    return it->second;
}

// ---------------------------------------------------------------------------
// EntityCursor
// ---------------------------------------------------------------------------

std::optional<MatchState> EntityCursor::current_match() const {
    if (!best_) return std::nullopt;
    const auto& trie = EntityTrie::instance();
    const auto& n = trie.node(*best_);
    MatchState state;
    state.is_match = true;
    state.end_node = n.end_node;
    state.ends_with_semicolon = n.ends_with_semicolon;
    state.resolved_value = std::string(n.value);
    state.length = n.depth;
    return state;
}

std::size_t EntityCursor::rewind_count() const {
    std::size_t matched = best_ ? EntityTrie::instance().node(*best_).depth : 0;
    return consumed_ - matched;
}

bool EntityCursor::ends_with_semicolon() const {
    return best_ && EntityTrie::instance().node(*best_).ends_with_semicolon;
}

EntityCursor step(EntityCursor cursor, char32_t c) {
    if (cursor.done_) {
        return cursor;
    }
    const auto& trie = EntityTrie::instance();
    ++cursor.consumed_;
    auto next = trie.child(cursor.node_, c);
    if (!next) {
        cursor.done_ = true;
        return cursor;
    }
    cursor.node_ = *next;
    const auto& n = trie.node(*next);
    if (n.is_match) {
        cursor.best_ = *next;
    }
    if (n.end_node) {
        cursor.done_ = true;
    }
    return cursor;
}

// ---------------------------------------------------------------------------
// NumericReferenceCursor
// ---------------------------------------------------------------------------

char32_t remap_numeric_reference(std::uint32_t code) {
    if (code == 0 || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) {
        return kReplacementChar;
    }
    if (code >= 0x80 && code <= 0x9F) {
        return windows1252_char(static_cast<unsigned char>(code));
    }
    return code;
}

std::optional<std::string> NumericReferenceCursor::current_match() const {
    if (state_ != State::Terminated && state_ != State::SemicolonMissing) {
        return std::nullopt;
    }
    return to_utf8(remap_numeric_reference(code_));
}

NumericReferenceCursor NumericReferenceCursor::matched(State state, std::size_t match_length) const {
    NumericReferenceCursor result = *this;
    result.state_ = state;
    result.match_length_ = match_length;
    return result;
}

NumericReferenceCursor NumericReferenceCursor::finish() const {
    switch (state_) {
        case State::Decimal:
        case State::Hex:
            return matched(State::SemicolonMissing, consumed_);
        case State::Start:
        case State::HexStart:
            return matched(State::NoDigits, 0);
        default:
            return *this;
    }
}

NumericReferenceCursor step(NumericReferenceCursor cursor, char32_t c) {
    using State = NumericReferenceCursor::State;
    if (!cursor.should_continue()) {
        return cursor;
    }
    ++cursor.consumed_;

    int digit = -1;
    if (c >= '0' && c <= '9') {
        digit = static_cast<int>(c - '0');
    } else if (cursor.hex_ && c >= 'a' && c <= 'f') {
        digit = static_cast<int>(c - 'a' + 10);
    } else if (cursor.hex_ && c >= 'A' && c <= 'F') {
        digit = static_cast<int>(c - 'A' + 10);
    }

    auto accumulate = [&](std::uint32_t base) {
        // Saturate past the Unicode range so long digit runs cannot overflow.
        if (cursor.code_ <= 0x10FFFF) {
            cursor.code_ = cursor.code_ * base + static_cast<std::uint32_t>(digit);
        }
    };

    switch (cursor.state_) {
        case State::Start:
            if (c == 'x' || c == 'X') {
                cursor.hex_ = true;
                cursor.state_ = State::HexStart;
                return cursor;
            }
            if (digit >= 0) {
                cursor.state_ = State::Decimal;
                accumulate(10);
                return cursor;
            }
            return cursor.matched(State::NoDigits, 0);

        case State::HexStart:
            if (digit >= 0) {
                cursor.state_ = State::Hex;
                accumulate(16);
                return cursor;
            }
            return cursor.matched(State::NoDigits, 0);

        case State::Decimal:
        case State::Hex:
            if (digit >= 0) {
                accumulate(cursor.state_ == State::Hex ? 16 : 10);
                return cursor;
            }
            if (c == ';') {
                return cursor.matched(State::Terminated, cursor.consumed_);
            }
            return cursor.matched(State::SemicolonMissing, cursor.consumed_ - 1);

        default:
            return cursor;
    }
}

MatchState lookup_entity(std::string_view text) {
    return EntityTrie::instance().lookup(text);
}

std::string entity_reference_for(std::string_view value) {
    return EntityTrie::instance().entity_reference_for(value);
}

} // namespace mender::html
