#include <mender/html/scanner.h>
#include <mender/html/element_table.h>
#include <mender/html/entity_resolver.h>
#include <algorithm>
#include <cctype>

namespace mender::html {

namespace {

constexpr const char* kModule = "scanner";

CharSourceOptions source_options(const core::ParserConfig& config) {
    CharSourceOptions options;
    options.default_encoding = encoding_from_label(config.default_encoding).value_or(Encoding::Windows1252);
    options.ignore_declared_charset = config.ignore_specified_charset;
    options.normalize_newlines = config.normalize_newlines;
    return options;
}

bool is_space(std::int32_t c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

bool is_ascii_alpha(std::int32_t c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_alnum(std::int32_t c) {
    return is_ascii_alpha(c) || (c >= '0' && c <= '9');
}

std::int32_t ascii_lower(std::int32_t c) {
    return (c >= 'A' && c <= 'Z') ? c + ('a' - 'A') : c;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Pulls name="value" pairs out of an XML declaration body.
std::string pseudo_attribute(std::string_view data, std::string_view name) {
    auto pos = data.find(name);
    while (pos != std::string_view::npos) {
        auto i = pos + name.size();
        while (i < data.size() && is_space(data[i])) ++i;
        if (i < data.size() && data[i] == '=') {
            ++i;
            while (i < data.size() && is_space(data[i])) ++i;
            if (i < data.size() && (data[i] == '"' || data[i] == '\'')) {
                char quote = data[i++];
                auto end = data.find(quote, i);
                if (end != std::string_view::npos) {
                    return std::string(data.substr(i, end - i));
                }
            }
        }
        pos = data.find(name, pos + 1);
    }
    return {};
}

// Removes a start and an end marker enclosing text, surrounding whitespace
// included. Text without both markers is left as it is.
void trim_to_content(std::string& text, std::string_view start, std::string_view end) {
    const std::size_t markers = start.size() + end.size();
    if (markers >= text.size()) return;
    std::size_t first = 0;
    std::size_t last = text.size();
    while (first < last && is_space(static_cast<unsigned char>(text[first]))) ++first;
    while (last > first && is_space(static_cast<unsigned char>(text[last - 1]))) --last;
    if (last - first < markers) return;
    if (text.compare(first, start.size(), start) != 0) return;
    if (text.compare(last - end.size(), end.size(), end) != 0) return;
    text = text.substr(first + start.size(), last - first - markers);
}

} // namespace

Scanner::Scanner(std::string_view input, const core::ParserConfig& config,
                 core::DiagnosticEmitter* diagnostics)
    : config_(config),
      diagnostics_(diagnostics),
      source_(std::string(input), source_options(config)),
      doctype_pending_(config.insert_doctype) {
    report_encoding();
}

Scanner::Scanner(std::istream& in, const core::ParserConfig& config,
                 core::DiagnosticEmitter* diagnostics)
    : config_(config),
      diagnostics_(diagnostics),
      source_(in, source_options(config)),
      doctype_pending_(config.insert_doctype) {
    report_encoding();
}

void Scanner::report_encoding() {
    const auto& decision = source_.encoding();
    if (!decision.label_recognized) {
        warn("encoding", "unsupported charset '" + decision.declared_label + "', using " +
             html::encoding_name(decision.encoding));
    }
    if (config_.report_errors && diagnostics_) {
        diagnostics_->emit(core::Severity::Info, kModule, "encoding",
                           std::string("decoding as ") + html::encoding_name(decision.encoding) +
                           " (" + encoding_source_name(decision.source) + ")");
    }
}

void Scanner::warn(const char* stage, const std::string& message) {
    if (!config_.report_errors || !diagnostics_) {
        return;
    }
    const auto& pos = source_.position();
    diagnostics_->warn(kModule, stage, message, pos.line, pos.column);
}

Token Scanner::make_token(Token::Type type, const SourcePosition& begin) const {
    Token token;
    token.type = type;
    if (config_.augmentations) {
        Location location;
        location.begin_line = begin.line;
        location.begin_column = begin.column;
        location.begin_offset = begin.offset;
        token.augs.location = location;
    }
    return token;
}

void Scanner::finish_token(Token& token) const {
    if (token.augs.location) {
        const auto& end = source_.position();
        token.augs.location->end_line = end.line;
        token.augs.location->end_column = end.column;
        token.augs.location->end_offset = end.offset;
    }
}

Token Scanner::next_token() {
    if (doctype_pending_) {
        doctype_pending_ = false;
        return inserted_doctype();
    }
    while (true) {
        if (auto token = scan_once()) {
            return std::move(*token);
        }
    }
}

std::optional<Token> Scanner::scan_once() {
    switch (mode_) {
        case Mode::Done: {
            Token eof = make_token(Token::EndOfFile, source_.position());
            finish_token(eof);
            return eof;
        }
        case Mode::RawText:
        case Mode::RcData: {
            Token text = scan_raw_text();
            strip_raw_text_delims(text.data);
            mode_ = Mode::Content;
            if (text.data.empty()) return std::nullopt;
            return text;
        }
        case Mode::PlainText: {
            Token text = scan_plain_text();
            mode_ = Mode::Done;
            if (text.data.empty()) return std::nullopt;
            return text;
        }
        case Mode::Content:
            break;
    }

    std::int32_t c = peek();
    if (c == CharSource::kEof) {
        mode_ = Mode::Done;
        return std::nullopt;
    }
    if (c == '<') {
        read();
        std::int32_t next = peek();
        source_.rewind(1);
        if (is_ascii_alpha(next) || next == '/' || next == '!' || next == '?') {
            return scan_markup();
        }
        if (next == CharSource::kEof) {
            warn("markup", "'<' at end of input");
        } else {
            warn("markup", "'<' does not start markup, kept as text");
        }
    }
    return scan_text();
}

// ---------------------------------------------------------------------------
// Character data
// ---------------------------------------------------------------------------

Token Scanner::scan_text() {
    Token token = make_token(Token::Text, source_.position());
    bool first = true;
    while (true) {
        std::int32_t c = read();
        if (c == CharSource::kEof) {
            break;
        }
        if (c == '<' && !first) {
            std::int32_t next = peek();
            if (is_ascii_alpha(next) || next == '/' || next == '!' || next == '?') {
                source_.rewind(1);
                break;
            }
            if (next == CharSource::kEof) {
                warn("markup", "'<' at end of input");
            } else {
                warn("markup", "'<' does not start markup, kept as text");
            }
        }
        first = false;
        if (c == '&') {
            scan_entity(token.data, false);
        } else {
            append(token.data, c);
        }
    }
    finish_token(token);
    return token;
}

Token Scanner::scan_raw_text() {
    Token token = make_token(Token::Text, source_.position());
    const bool decode_entities = mode_ == Mode::RcData;
    while (true) {
        std::int32_t c = read();
        if (c == CharSource::kEof) {
            warn("raw-text", "end of input inside <" + raw_element_ + ">");
            break;
        }
        if (c == '<' && peek() == '/') {
            read();
            std::size_t matched = 0;
            while (matched < raw_element_.size()) {
                std::int32_t n = read();
                if (n == CharSource::kEof) break;
                if (ascii_lower(n) != static_cast<unsigned char>(raw_element_[matched])) {
                    source_.rewind(1);
                    break;
                }
                ++matched;
            }
            if (matched == raw_element_.size()) {
                std::int32_t after = peek();
                if (is_space(after) || after == '/' || after == '>' || after == CharSource::kEof) {
                    source_.rewind(2 + matched);
                    break;
                }
            }
            // Not the closing tag; keep the '<' and rescan what follows.
            source_.rewind(1 + matched);
            token.data += '<';
            continue;
        }
        if (c == '&' && decode_entities) {
            scan_entity(token.data, false);
        } else {
            append(token.data, c);
        }
    }
    finish_token(token);
    return token;
}

Token Scanner::scan_plain_text() {
    Token token = make_token(Token::Text, source_.position());
    for (std::int32_t c = read(); c != CharSource::kEof; c = read()) {
        append(token.data, c);
    }
    finish_token(token);
    return token;
}

// ---------------------------------------------------------------------------
// Character references
// ---------------------------------------------------------------------------

void Scanner::scan_entity(std::string& out, bool in_attribute) {
    std::int32_t c = read();
    if (c == CharSource::kEof) {
        out += '&';
        return;
    }
    if (c == '#') {
        scan_numeric_reference(out);
        return;
    }

    EntityCursor cursor = step(EntityCursor{}, static_cast<char32_t>(c));
    while (cursor.should_continue()) {
        c = read();
        if (c == CharSource::kEof) break;
        cursor = step(cursor, static_cast<char32_t>(c));
    }

    auto match = cursor.current_match();
    if (!match) {
        source_.rewind(cursor.consumed());
        out += '&';
        return;
    }
    source_.rewind(cursor.rewind_count());

    if (!match->ends_with_semicolon) {
        warn("entity", "character reference without terminating ';'");
        if (in_attribute) {
            std::int32_t next = peek();
            if (next == '=' || is_ascii_alnum(next)) {
                // Legacy rule: "&copy=..." in attribute values is not a reference.
                source_.rewind(match->length);
                out += '&';
                return;
            }
        }
    }
    out += match->resolved_value;
}

void Scanner::scan_numeric_reference(std::string& out) {
    NumericReferenceCursor cursor;
    while (cursor.should_continue()) {
        std::int32_t c = read();
        if (c == CharSource::kEof) {
            cursor = cursor.finish();
            break;
        }
        cursor = step(cursor, static_cast<char32_t>(c));
    }

    auto match = cursor.current_match();
    if (!match) {
        warn("entity", "numeric character reference without digits");
        source_.rewind(cursor.consumed() + 1);
        out += '&';
        return;
    }
    source_.rewind(cursor.rewind_count());
    if (!cursor.ends_with_semicolon()) {
        warn("entity", "numeric character reference without terminating ';'");
    }
    out += *match;
}

// ---------------------------------------------------------------------------
// Markup
// ---------------------------------------------------------------------------

bool Scanner::skip(std::string_view s, bool case_sensitive) {
    std::size_t count = 0;
    for (char expected : s) {
        std::int32_t c = read();
        if (c == CharSource::kEof) {
            source_.rewind(count);
            return false;
        }
        ++count;
        bool same = case_sensitive ? c == static_cast<unsigned char>(expected)
                                   : ascii_lower(c) == ascii_lower(static_cast<unsigned char>(expected));
        if (!same) {
            source_.rewind(count);
            return false;
        }
    }
    return true;
}

void Scanner::skip_spaces() {
    while (is_space(peek())) {
        read();
    }
}

std::optional<Token> Scanner::scan_markup() {
    auto begin = source_.position();
    read();  // '<'
    std::int32_t c = read();
    switch (c) {
        case '!': {
            if (skip("--", true)) {
                Token comment = scan_comment();
                comment.augs = make_token(Token::Comment, begin).augs;
                finish_token(comment);
                return comment;
            }
            if (skip("[CDATA[", true)) {
                Token cdata = scan_cdata();
                if (!config_.cdata_sections) {
                    cdata.type = Token::Comment;
                    cdata.data = "[CDATA[" + cdata.data + "]]";
                }
                cdata.augs = make_token(cdata.type, begin).augs;
                finish_token(cdata);
                return cdata;
            }
            if (skip("DOCTYPE", false)) {
                Token doctype = scan_doctype();
                doctype.augs = make_token(Token::Doctype, begin).augs;
                finish_token(doctype);
                return doctype;
            }
            warn("markup", "unrecognized markup declaration, treated as comment");
            Token bogus = scan_bogus_comment({});
            bogus.augs = make_token(Token::Comment, begin).augs;
            finish_token(bogus);
            return bogus;
        }
        case '?': {
            Token pi = scan_processing_instruction();
            pi.augs = make_token(pi.type, begin).augs;
            finish_token(pi);
            return pi;
        }
        case '/': {
            auto end_tag = scan_end_tag();
            if (end_tag) {
                end_tag->augs = make_token(Token::EndTag, begin).augs;
                finish_token(*end_tag);
            }
            return end_tag;
        }
        default: {
            source_.rewind(1);
            Token start = scan_start_tag();
            start.augs = make_token(Token::StartTag, begin).augs;
            finish_token(start);
            return start;
        }
    }
}

Token Scanner::scan_start_tag() {
    Token tag;
    tag.type = Token::StartTag;

    std::string raw_name;
    while (true) {
        std::int32_t c = peek();
        if (c == CharSource::kEof || is_space(c) || c == '/' || c == '>' || c == '<') break;
        append(raw_name, read());
    }
    tag.name = core::apply_name_case(raw_name, config_.element_names);

    while (scan_attribute(tag)) {
    }

    const std::string lower = to_lower(raw_name);
    if (lower == "meta" && !config_.ignore_specified_charset) {
        const Attribute* charset = find_attribute(tag.attributes, core::apply_name_case("charset", config_.attribute_names));
        const Attribute* http_equiv = find_attribute(tag.attributes, core::apply_name_case("http-equiv", config_.attribute_names));
        const Attribute* content = find_attribute(tag.attributes, core::apply_name_case("content", config_.attribute_names));
        if (charset) {
            check_declared_charset(charset->value, "<meta charset>");
        } else if (http_equiv && content && to_lower(http_equiv->value) == "content-type") {
            if (auto label = charset_from_content_type(content->value)) {
                check_declared_charset(*label, "<meta http-equiv>");
            }
        }
    }

    const TextMode text_mode = body_text_mode(element_info(lower), tag.self_closing);
    if (text_mode != TextMode::Normal) {
        raw_element_ = lower;
        switch (text_mode) {
            case TextMode::RawText:   mode_ = Mode::RawText; break;
            case TextMode::RcData:    mode_ = Mode::RcData; break;
            case TextMode::PlainText: mode_ = Mode::PlainText; break;
            case TextMode::Normal:    break;
        }
    }
    return tag;
}

bool Scanner::scan_attribute(Token& tag) {
    skip_spaces();
    std::int32_t c = read();
    if (c == CharSource::kEof) {
        warn("start-tag", "end of input inside <" + tag.name + ">");
        return false;
    }
    if (c == '>') {
        return false;
    }
    if (c == '/') {
        if (peek() == '>') {
            read();
            tag.self_closing = true;
            return false;
        }
        return true;
    }
    if (c == '<') {
        warn("start-tag", "'<' inside <" + tag.name + ">, tag closed");
        source_.rewind(1);
        return false;
    }

    Attribute attr;
    std::string raw_name;
    append(raw_name, c);
    while (true) {
        std::int32_t n = peek();
        if (n == CharSource::kEof || is_space(n) || n == '/' || n == '>' || n == '=' || n == '<') break;
        append(raw_name, read());
    }
    attr.name = core::apply_name_case(raw_name, config_.attribute_names);

    skip_spaces();
    if (peek() == '=') {
        read();
        skip_spaces();
        scan_attribute_value(attr);
    } else {
        attr.specified = false;
    }

    if (find_attribute(tag.attributes, attr.name)) {
        warn("attribute", "duplicate attribute '" + attr.name + "' dropped");
    } else {
        tag.attributes.push_back(std::move(attr));
    }
    return true;
}

void Scanner::scan_attribute_value(Attribute& attr) {
    std::int32_t c = peek();
    if (c == '"' || c == '\'') {
        std::int32_t quote = read();
        while (true) {
            c = read();
            if (c == CharSource::kEof) {
                warn("attribute", "end of input inside value of '" + attr.name + "'");
                return;
            }
            if (c == quote) return;
            if (c == '&') {
                scan_entity(attr.value, true);
            } else {
                append(attr.value, c);
            }
        }
    }
    while (true) {
        c = peek();
        if (c == CharSource::kEof || is_space(c) || c == '>') return;
        read();
        if (c == '&') {
            scan_entity(attr.value, true);
        } else {
            append(attr.value, c);
        }
    }
}

std::optional<Token> Scanner::scan_end_tag() {
    std::int32_t c = peek();
    if (c == '>') {
        read();
        warn("end-tag", "empty end tag '</>' ignored");
        return std::nullopt;
    }
    if (!is_ascii_alpha(c)) {
        warn("end-tag", "malformed end tag, treated as comment");
        return scan_bogus_comment({});
    }

    Token tag;
    tag.type = Token::EndTag;
    std::string raw_name;
    while (true) {
        c = peek();
        if (c == CharSource::kEof || is_space(c) || c == '/' || c == '>' || c == '<') break;
        append(raw_name, read());
    }
    tag.name = core::apply_name_case(raw_name, config_.element_names);

    // Anything else up to '>' is junk for an end tag.
    while (true) {
        c = read();
        if (c == CharSource::kEof) {
            warn("end-tag", "end of input inside </" + tag.name + ">");
            break;
        }
        if (c == '>') break;
        if (c == '<') {
            warn("end-tag", "'<' inside </" + tag.name + ">, tag closed");
            source_.rewind(1);
            break;
        }
        if (!is_space(c) && c != '/') {
            warn("end-tag", "attributes on </" + tag.name + "> ignored");
        }
    }
    return tag;
}

Token Scanner::scan_comment() {
    Token comment;
    comment.type = Token::Comment;
    // "<!-->" and "<!--->" close immediately.
    if (skip(">", true) || skip("->", true)) {
        return comment;
    }
    std::string& data = comment.data;
    while (true) {
        std::int32_t c = read();
        if (c == CharSource::kEof) {
            warn("comment", "unterminated comment");
            return comment;
        }
        append(data, c);
        if (c != '>') continue;
        if (data.size() >= 3 && data.compare(data.size() - 3, 3, "-->") == 0) {
            data.resize(data.size() - 3);
            return comment;
        }
        if (data.size() >= 4 && data.compare(data.size() - 4, 4, "--!>") == 0) {
            data.resize(data.size() - 4);
            return comment;
        }
    }
}

Token Scanner::scan_bogus_comment(std::string prefix) {
    Token comment;
    comment.type = Token::Comment;
    comment.data = std::move(prefix);
    for (std::int32_t c = read(); c != CharSource::kEof && c != '>'; c = read()) {
        append(comment.data, c);
    }
    return comment;
}

Token Scanner::scan_cdata() {
    Token cdata;
    cdata.type = Token::CData;
    std::string& data = cdata.data;
    while (true) {
        std::int32_t c = read();
        if (c == CharSource::kEof) {
            warn("cdata", "unterminated CDATA section");
            return cdata;
        }
        append(data, c);
        if (c == '>' && data.size() >= 3 && data.compare(data.size() - 3, 3, "]]>") == 0) {
            data.resize(data.size() - 3);
            return cdata;
        }
    }
}

std::string Scanner::scan_quoted_literal() {
    std::string value;
    std::int32_t quote = peek();
    if (quote != '"' && quote != '\'') {
        return value;
    }
    read();
    while (true) {
        std::int32_t c = peek();
        if (c == CharSource::kEof || c == '>') {
            warn("doctype", "unterminated identifier in doctype");
            return value;
        }
        read();
        if (c == quote) return value;
        append(value, c);
    }
}

Token Scanner::scan_doctype() {
    Token doctype;
    doctype.type = Token::Doctype;
    skip_spaces();
    std::string raw_name;
    while (true) {
        std::int32_t c = peek();
        if (c == CharSource::kEof || is_space(c) || c == '>') break;
        append(raw_name, read());
    }
    doctype.name = core::apply_name_case(raw_name, config_.element_names);

    skip_spaces();
    if (skip("PUBLIC", false)) {
        skip_spaces();
        doctype.public_id = scan_quoted_literal();
        skip_spaces();
        doctype.system_id = scan_quoted_literal();
    } else if (skip("SYSTEM", false)) {
        skip_spaces();
        doctype.system_id = scan_quoted_literal();
    }

    for (std::int32_t c = read(); c != '>'; c = read()) {
        if (c == CharSource::kEof) {
            warn("doctype", "unterminated doctype");
            break;
        }
    }
    if (config_.override_doctype) {
        doctype.public_id = config_.doctype_public_id;
        doctype.system_id = config_.doctype_system_id;
    }
    return doctype;
}

Token Scanner::inserted_doctype() {
    Token doctype = make_token(Token::Doctype, source_.position());
    doctype.name = core::apply_name_case("html", config_.element_names);
    doctype.public_id = config_.doctype_public_id;
    doctype.system_id = config_.doctype_system_id;
    doctype.augs.synthesized = true;
    finish_token(doctype);
    return doctype;
}

Token Scanner::scan_processing_instruction() {
    Token pi;
    pi.type = Token::ProcessingInstruction;
    while (true) {
        std::int32_t c = peek();
        if (c == CharSource::kEof || is_space(c) || c == '?' || c == '>') break;
        append(pi.name, read());
    }
    skip_spaces();
    while (true) {
        std::int32_t c = read();
        if (c == CharSource::kEof) {
            warn("processing-instruction", "unterminated processing instruction");
            break;
        }
        if (c == '>') {
            if (!pi.data.empty() && pi.data.back() == '?') pi.data.pop_back();
            break;
        }
        append(pi.data, c);
    }
    while (!pi.data.empty() && is_space(static_cast<unsigned char>(pi.data.back()))) {
        pi.data.pop_back();
    }

    if (to_lower(pi.name) == "xml") {
        pi.type = Token::XmlDecl;
        pi.version = pseudo_attribute(pi.data, "version");
        pi.encoding = pseudo_attribute(pi.data, "encoding");
        pi.standalone = pseudo_attribute(pi.data, "standalone");
        if (!pi.encoding.empty() && !config_.ignore_specified_charset) {
            check_declared_charset(pi.encoding, "xml declaration");
        }
    }
    return pi;
}

void Scanner::check_declared_charset(std::string_view label, const char* where) {
    auto declared = encoding_from_label(label);
    if (!declared) {
        warn("encoding", std::string("unsupported charset '") + std::string(label) + "' in " + where);
        return;
    }
    if (*declared == Encoding::Utf16Le || *declared == Encoding::Utf16Be) {
        declared = Encoding::Utf8;
    }
    Encoding committed = source_.encoding().encoding;
    if (committed == Encoding::Utf16Le || committed == Encoding::Utf16Be) {
        return;
    }
    if (*declared != committed) {
        warn("encoding", std::string(where) + " declares " + html::encoding_name(*declared) +
             " but the document is already decoded as " + html::encoding_name(committed));
    }
}

TextMode Scanner::body_text_mode(const ElementInfo& info, bool self_closing) const {
    if (self_closing && config_.allow_selfclosing_tags) {
        return TextMode::Normal;
    }
    switch (info.code) {
        case ElementCode::Iframe:
            return config_.allow_selfclosing_tags || config_.allow_selfclosing_iframe
                ? TextMode::Normal : TextMode::RawText;
        case ElementCode::Noscript:
            return config_.parse_noscript_content ? TextMode::Normal : TextMode::RawText;
        case ElementCode::Noembed:
        case ElementCode::Noframes:
            return TextMode::RawText;
        default:
            break;
    }
    return info.is_special() ? info.text_mode : TextMode::Normal;
}

void Scanner::strip_raw_text_delims(std::string& text) const {
    if (raw_element_ == "script") {
        if (config_.script_strip_comment_delims) {
            const std::size_t before = text.size();
            trim_to_content(text, "<!--", "-->");
            if (text.size() == before) {
                trim_to_content(text, "<!--", "--!>");
            }
        }
        if (config_.script_strip_cdata_delims) {
            trim_to_content(text, "<![CDATA[", "]]>");
        }
    } else if (raw_element_ == "style") {
        if (config_.style_strip_comment_delims) {
            trim_to_content(text, "<!--", "-->");
        }
        if (config_.style_strip_cdata_delims) {
            trim_to_content(text, "<![CDATA[", "]]>");
        }
    }
}

} // namespace mender::html
