#pragma once
#include <mender/html/encoding.h>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace mender::html {

struct SourcePosition {
    int line = 1;
    int column = 1;
    int offset = 0;
};

struct CharSourceOptions {
    Encoding default_encoding = Encoding::Windows1252;
    bool ignore_declared_charset = false;
    bool normalize_newlines = true;
};

// Decoded character stream over a byte source. The encoding is fixed
// before the first character is returned. Keeps a bounded window of
// recently read characters so the scanner can push them back.
class CharSource {
public:
    static constexpr std::int32_t kEof = -1;

    CharSource(std::string bytes, const CharSourceOptions& options);
    // The stream must outlive the source. Read failures throw IoError.
    CharSource(std::istream& in, const CharSourceOptions& options);

    const EncodingDecision& encoding() const { return decision_; }

    std::int32_t read();
    std::int32_t peek();
    bool at_end();

    // Pushes back the last count characters. Throws std::logic_error when
    // more than the retained window is requested.
    void rewind(std::size_t count = 1);

    // Position of the next character to be read.
    const SourcePosition& position() const { return position_; }

private:
    struct Entry {
        char32_t c = 0;
        SourcePosition before;
    };

    void init(const CharSourceOptions& options);
    void fill_bytes(std::size_t wanted);
    std::int32_t decode_next();

    std::istream* stream_ = nullptr;
    std::string bytes_;
    std::size_t byte_pos_ = 0;
    bool bytes_eof_ = false;
    bool normalize_newlines_ = true;

    EncodingDecision decision_;
    SourcePosition position_;
    std::deque<Entry> history_;
    std::vector<Entry> pushback_;
};

} // namespace mender::html
