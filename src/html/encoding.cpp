#include <mender/html/encoding.h>
#include <algorithm>
#include <cctype>

namespace mender::html {

namespace {

std::string lowercase_trimmed(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    std::string result(s.substr(begin, end - begin));
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_space_byte(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

bool starts_with_ci(std::string_view s, std::size_t pos, std::string_view prefix) {
    if (pos + prefix.size() > s.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[pos + i])) !=
            static_cast<unsigned char>(prefix[i])) {
            return false;
        }
    }
    return true;
}

// windows-1252 bytes 0x80-0x9F. Undefined positions map to the C1 control.
constexpr char16_t kWindows1252High[32] = {
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F,
    0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178,
};

struct PrescanAttribute {
    std::string name;
    std::string value;
};

// Reads one attribute of a tag in the byte prescan. Returns false at '>'
// or the end of the prefix.
bool next_prescan_attribute(std::string_view s, std::size_t& pos, PrescanAttribute& attr) {
    while (pos < s.size() && (is_space_byte(s[pos]) || s[pos] == '/')) ++pos;
    if (pos >= s.size() || s[pos] == '>') return false;

    attr.name.clear();
    attr.value.clear();
    while (pos < s.size() && !is_space_byte(s[pos]) && s[pos] != '=' &&
           s[pos] != '>' && s[pos] != '/') {
        attr.name += static_cast<char>(std::tolower(static_cast<unsigned char>(s[pos])));
        ++pos;
    }
    while (pos < s.size() && is_space_byte(s[pos])) ++pos;
    if (pos >= s.size() || s[pos] != '=') return true;
    ++pos;
    while (pos < s.size() && is_space_byte(s[pos])) ++pos;
    if (pos >= s.size()) return true;

    if (s[pos] == '"' || s[pos] == '\'') {
        char quote = s[pos++];
        while (pos < s.size() && s[pos] != quote) attr.value += s[pos++];
        if (pos < s.size()) ++pos;
    } else {
        while (pos < s.size() && !is_space_byte(s[pos]) && s[pos] != '>') attr.value += s[pos++];
    }
    return true;
}

std::optional<std::string> xml_declaration_encoding(std::string_view s) {
    if (!starts_with_ci(s, 0, "<?xml")) return std::nullopt;
    auto end = s.find("?>");
    std::string_view decl = s.substr(0, end == std::string_view::npos ? s.size() : end);
    auto pos = decl.find("encoding");
    if (pos == std::string_view::npos) return std::nullopt;
    pos += 8;
    while (pos < decl.size() && is_space_byte(decl[pos])) ++pos;
    if (pos >= decl.size() || decl[pos] != '=') return std::nullopt;
    ++pos;
    while (pos < decl.size() && is_space_byte(decl[pos])) ++pos;
    if (pos >= decl.size() || (decl[pos] != '"' && decl[pos] != '\'')) return std::nullopt;
    char quote = decl[pos++];
    auto close = decl.find(quote, pos);
    if (close == std::string_view::npos) return std::nullopt;
    return std::string(decl.substr(pos, close - pos));
}

} // namespace

std::optional<Encoding> encoding_from_label(std::string_view label) {
    const std::string l = lowercase_trimmed(label);
    if (l == "utf-8" || l == "utf8" || l == "unicode-1-1-utf-8") return Encoding::Utf8;
    if (l == "utf-16le" || l == "utf-16" || l == "unicode" || l == "ucs-2") return Encoding::Utf16Le;
    if (l == "utf-16be" || l == "unicodefffe") return Encoding::Utf16Be;
    if (l == "iso-8859-1" || l == "iso8859-1" || l == "iso_8859-1" || l == "latin1" ||
        l == "l1" || l == "cp819" || l == "ibm819" || l == "iso-ir-100") {
        return Encoding::Latin1;
    }
    if (l == "windows-1252" || l == "cp1252" || l == "x-cp1252") return Encoding::Windows1252;
    if (l == "us-ascii" || l == "ascii" || l == "ansi_x3.4-1968" || l == "iso646-us") {
        return Encoding::Ascii;
    }
    return std::nullopt;
}

const char* encoding_name(Encoding encoding) {
    switch (encoding) {
        case Encoding::Utf8:        return "UTF-8";
        case Encoding::Utf16Le:     return "UTF-16LE";
        case Encoding::Utf16Be:     return "UTF-16BE";
        case Encoding::Latin1:      return "ISO-8859-1";
        case Encoding::Windows1252: return "windows-1252";
        case Encoding::Ascii:       return "US-ASCII";
    }
    return "UTF-8";
}

const char* encoding_source_name(EncodingSource source) {
    switch (source) {
        case EncodingSource::ByteOrderMark:  return "byte-order-mark";
        case EncodingSource::MetaTag:        return "meta";
        case EncodingSource::XmlDeclaration: return "xml-declaration";
        case EncodingSource::Default:        return "default";
    }
    return "default";
}

std::optional<Encoding> detect_bom(std::string_view bytes, std::size_t& bom_length) {
    auto byte = [&](std::size_t i) { return static_cast<unsigned char>(bytes[i]); };
    if (bytes.size() >= 3 && byte(0) == 0xEF && byte(1) == 0xBB && byte(2) == 0xBF) {
        bom_length = 3;
        return Encoding::Utf8;
    }
    if (bytes.size() >= 2 && byte(0) == 0xFF && byte(1) == 0xFE) {
        bom_length = 2;
        return Encoding::Utf16Le;
    }
    if (bytes.size() >= 2 && byte(0) == 0xFE && byte(1) == 0xFF) {
        bom_length = 2;
        return Encoding::Utf16Be;
    }
    bom_length = 0;
    return std::nullopt;
}

std::optional<std::string> charset_from_content_type(std::string_view content) {
    std::string compact;
    for (char c : content) {
        if (!is_space_byte(c)) compact += c;
    }
    std::string lower = lowercase_trimmed(compact);
    auto index = lower.find("charset=");
    if (index == std::string::npos) return std::nullopt;
    auto start = index + 8;
    auto end = compact.find(';', start);
    std::string value = compact.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        value = value.substr(1, value.size() - 2);
    }
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<std::string> prescan_charset(std::string_view prefix, EncodingSource& source) {
    if (auto xml = xml_declaration_encoding(prefix)) {
        source = EncodingSource::XmlDeclaration;
        return xml;
    }

    std::size_t pos = 0;
    while (pos < prefix.size()) {
        if (prefix[pos] != '<') {
            ++pos;
            continue;
        }
        if (prefix.compare(pos, 4, "<!--") == 0) {
            auto end = prefix.find("-->", pos + 4);
            if (end == std::string_view::npos) return std::nullopt;
            pos = end + 3;
            continue;
        }
        if (starts_with_ci(prefix, pos, "<meta") && pos + 5 < prefix.size() &&
            (is_space_byte(prefix[pos + 5]) || prefix[pos + 5] == '/')) {
            pos += 5;
            PrescanAttribute attr;
            std::string http_equiv;
            std::string content;
            std::string charset;
            while (next_prescan_attribute(prefix, pos, attr)) {
                if (attr.name == "http-equiv" && http_equiv.empty()) http_equiv = lowercase_trimmed(attr.value);
                else if (attr.name == "content" && content.empty()) content = attr.value;
                else if (attr.name == "charset" && charset.empty()) charset = attr.value;
            }
            if (!charset.empty()) {
                source = EncodingSource::MetaTag;
                return lowercase_trimmed(charset);
            }
            if (http_equiv == "content-type" && !content.empty()) {
                if (auto label = charset_from_content_type(content)) {
                    source = EncodingSource::MetaTag;
                    return label;
                }
            }
            continue;
        }
        // Skip any other markup up to its end.
        auto end = prefix.find('>', pos + 1);
        if (end == std::string_view::npos) return std::nullopt;
        pos = end + 1;
    }
    return std::nullopt;
}

EncodingDecision determine_encoding(std::string_view prefix, Encoding fallback,
                                    bool ignore_declared) {
    EncodingDecision decision;
    decision.encoding = fallback;

    std::size_t bom_length = 0;
    if (auto bom = detect_bom(prefix, bom_length)) {
        decision.encoding = *bom;
        decision.source = EncodingSource::ByteOrderMark;
        decision.bom_length = bom_length;
        return decision;
    }
    if (ignore_declared) {
        return decision;
    }

    EncodingSource source = EncodingSource::Default;
    auto label = prescan_charset(prefix, source);
    if (!label) {
        return decision;
    }
    decision.declared_label = *label;
    auto declared = encoding_from_label(*label);
    if (!declared) {
        decision.label_recognized = false;
        return decision;
    }
    // A document readable as ASCII cannot really be UTF-16.
    if (*declared == Encoding::Utf16Le || *declared == Encoding::Utf16Be) {
        declared = Encoding::Utf8;
    }
    decision.encoding = *declared;
    decision.source = source;
    return decision;
}

char32_t windows1252_char(unsigned char byte) {
    if (byte >= 0x80 && byte <= 0x9F) return kWindows1252High[byte - 0x80];
    return byte;
}

DecodedChar decode_char(Encoding encoding, std::string_view bytes, std::size_t pos) {
    const std::size_t remaining = bytes.size() - pos;
    auto byte = [&](std::size_t i) { return static_cast<unsigned char>(bytes[pos + i]); };

    switch (encoding) {
        case Encoding::Latin1:
            return {byte(0), 1};

        case Encoding::Windows1252: {
            unsigned char b = byte(0);
            return {windows1252_char(b), 1};
        }

        case Encoding::Ascii: {
            unsigned char b = byte(0);
            return {b < 0x80 ? static_cast<char32_t>(b) : kReplacementChar, 1};
        }

        case Encoding::Utf16Le:
        case Encoding::Utf16Be: {
            if (remaining < 2) return {kReplacementChar, remaining};
            auto unit = [&](std::size_t i) -> char32_t {
                return encoding == Encoding::Utf16Le
                    ? static_cast<char32_t>(byte(i) | (byte(i + 1) << 8))
                    : static_cast<char32_t>((byte(i) << 8) | byte(i + 1));
            };
            char32_t lead = unit(0);
            if (lead >= 0xDC00 && lead <= 0xDFFF) return {kReplacementChar, 2};
            if (lead < 0xD800 || lead > 0xDBFF) return {lead, 2};
            if (remaining < 4) return {kReplacementChar, remaining};
            char32_t trail = unit(2);
            if (trail < 0xDC00 || trail > 0xDFFF) return {kReplacementChar, 2};
            return {0x10000 + ((lead - 0xD800) << 10) + (trail - 0xDC00), 4};
        }

        case Encoding::Utf8: {
            unsigned char b0 = byte(0);
            if (b0 < 0x80) return {b0, 1};

            std::size_t needed = 0;
            char32_t cp = 0;
            char32_t min = 0;
            if ((b0 & 0xE0) == 0xC0) { needed = 1; cp = b0 & 0x1F; min = 0x80; }
            else if ((b0 & 0xF0) == 0xE0) { needed = 2; cp = b0 & 0x0F; min = 0x800; }
            else if ((b0 & 0xF8) == 0xF0) { needed = 3; cp = b0 & 0x07; min = 0x10000; }
            else return {kReplacementChar, 1};

            for (std::size_t i = 1; i <= needed; ++i) {
                if (i >= remaining || (byte(i) & 0xC0) != 0x80) {
                    return {kReplacementChar, i};
                }
                cp = (cp << 6) | (byte(i) & 0x3F);
            }
            if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return {kReplacementChar, needed + 1};
            }
            return {cp, needed + 1};
        }
    }
    return {kReplacementChar, 1};
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string to_utf8(char32_t cp) {
    std::string out;
    append_utf8(out, cp);
    return out;
}

} // namespace mender::html
