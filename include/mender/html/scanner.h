#pragma once
#include <mender/core/config.h>
#include <mender/core/diagnostics.h>
#include <mender/html/char_source.h>
#include <mender/html/element_table.h>
#include <mender/html/token.h>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace mender::html {

// Pull tokenizer over a byte source. Every anomaly is recovered from
// locally; only a failing input stream (IoError) is fatal.
class Scanner {
public:
    Scanner(std::string_view input, const core::ParserConfig& config,
            core::DiagnosticEmitter* diagnostics = nullptr);
    Scanner(std::istream& in, const core::ParserConfig& config,
            core::DiagnosticEmitter* diagnostics = nullptr);

    // Next token; EndOfFile once the input is exhausted, repeatedly.
    Token next_token();

    const EncodingDecision& encoding() const { return source_.encoding(); }
    const char* encoding_name() const { return html::encoding_name(source_.encoding().encoding); }

private:
    enum class Mode { Content, RawText, RcData, PlainText, Done };

    void report_encoding();
    std::optional<Token> scan_once();
    Token inserted_doctype();

    Token scan_text();
    Token scan_raw_text();
    Token scan_plain_text();
    std::optional<Token> scan_markup();
    Token scan_start_tag();
    std::optional<Token> scan_end_tag();
    Token scan_comment();
    Token scan_bogus_comment(std::string prefix);
    Token scan_cdata();
    Token scan_doctype();
    Token scan_processing_instruction();

    bool scan_attribute(Token& tag);
    void scan_attribute_value(Attribute& attr);
    std::string scan_quoted_literal();

    // Called after '&'. Appends the decoded reference, or '&' when the
    // text does not form one.
    void scan_entity(std::string& out, bool in_attribute);
    void scan_numeric_reference(std::string& out);

    bool skip(std::string_view s, bool case_sensitive);
    void skip_spaces();
    void check_declared_charset(std::string_view label, const char* where);
    TextMode body_text_mode(const ElementInfo& info, bool self_closing) const;
    void strip_raw_text_delims(std::string& text) const;

    Token make_token(Token::Type type, const SourcePosition& begin) const;
    void finish_token(Token& token) const;
    void warn(const char* stage, const std::string& message);

    std::int32_t read() { return source_.read(); }
    std::int32_t peek() { return source_.peek(); }
    void append(std::string& out, std::int32_t c) { append_utf8(out, static_cast<char32_t>(c)); }

    core::ParserConfig config_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    CharSource source_;
    Mode mode_ = Mode::Content;
    std::string raw_element_;  // lower-case name whose close ends raw text
    bool doctype_pending_ = false;
};

} // namespace mender::html
