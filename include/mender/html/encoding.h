#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mender::html {

enum class Encoding {
    Utf8,
    Utf16Le,
    Utf16Be,
    Latin1,
    Windows1252,
    Ascii,
};

enum class EncodingSource {
    ByteOrderMark,
    MetaTag,
    XmlDeclaration,
    Default,
};

struct EncodingDecision {
    Encoding encoding = Encoding::Windows1252;
    EncodingSource source = EncodingSource::Default;
    std::size_t bom_length = 0;
    std::string declared_label;    // label as written in the document, if any
    bool label_recognized = true;  // false when a declared label had no decoder
};

// Case-insensitive, whitespace-trimmed label lookup ("UTF-8", "latin1"...).
std::optional<Encoding> encoding_from_label(std::string_view label);
const char* encoding_name(Encoding encoding);
const char* encoding_source_name(EncodingSource source);

// Returns the encoding announced by a byte order mark at the start of
// bytes and stores the mark's length.
std::optional<Encoding> detect_bom(std::string_view bytes, std::size_t& bom_length);

// Looks for <meta charset>, <meta http-equiv content="..charset=..">
// or an XML declaration inside prefix. Returns the raw label.
std::optional<std::string> prescan_charset(std::string_view prefix, EncodingSource& source);

// BOM first, then the declared charset, then fallback.
EncodingDecision determine_encoding(std::string_view prefix, Encoding fallback,
                                    bool ignore_declared);

// Extracts the charset parameter of a content-type value.
std::optional<std::string> charset_from_content_type(std::string_view content);

struct DecodedChar {
    char32_t code_point;
    std::size_t length;  // bytes consumed
};

// Decodes the character starting at bytes[pos]. Malformed or truncated
// sequences decode to U+FFFD and consume at least one byte.
DecodedChar decode_char(Encoding encoding, std::string_view bytes, std::size_t pos);

// windows-1252 mapping of one byte. The undefined positions in
// 0x80-0x9F map to the C1 control of the same value.
char32_t windows1252_char(unsigned char byte);

void append_utf8(std::string& out, char32_t code_point);
std::string to_utf8(char32_t code_point);

inline constexpr char32_t kReplacementChar = 0xFFFD;

} // namespace mender::html
