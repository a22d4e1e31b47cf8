#include <mender/filters/html_writer.h>
#include <mender/html/element_table.h>
#include <mender/html/encoding.h>
#include <mender/html/entity_resolver.h>
#include <algorithm>
#include <cctype>
#include <string_view>

namespace mender::filters {

namespace {

constexpr const char* kOutputEncoding = "UTF-8";

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_raw_text(const std::string& name) {
    auto mode = html::element_info(name).text_mode;
    return mode == html::TextMode::RawText || mode == html::TextMode::PlainText;
}

// The output is always UTF-8, so a content-type declaration is rewritten
// to say so.
std::string rewrite_content_type(const std::string& content) {
    std::string lower = to_lower(content);
    auto pos = lower.find("charset=");
    if (pos == std::string::npos) {
        return content + ";charset=" + kOutputEncoding;
    }
    return content.substr(0, pos + 8) + kOutputEncoding;
}

} // namespace

HtmlWriter::HtmlWriter(std::ostream& out, html::EventHandler* next)
    : EventFilter(next), out_(out) {}

std::string HtmlWriter::escape_text(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        auto decoded = html::decode_char(html::Encoding::Utf8, text, pos);
        std::string_view original(text.data() + pos, decoded.length);
        pos += decoded.length;
        char32_t c = decoded.code_point;
        if (c == '&' || c == '<' || c == '>' || c >= 0x80) {
            std::string reference = html::entity_reference_for(html::to_utf8(c));
            if (!reference.empty()) {
                result += reference;
                continue;
            }
        }
        result.append(original);
    }
    return result;
}

std::string HtmlWriter::escape_attribute(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (char c : value) {
        if (c == '"') {
            result += "&quot;";
        } else if (c == '&') {
            result += "&amp;";
        } else {
            result += c;
        }
    }
    return result;
}

void HtmlWriter::start_document(const std::string& encoding, const html::Augmentations& augs) {
    seen_root_ = false;
    depth_ = 0;
    raw_text_ = false;
    in_cdata_ = false;
    EventFilter::start_document(encoding, augs);
}

void HtmlWriter::xml_decl(const std::string& version, const std::string& encoding,
                          const std::string& standalone, const html::Augmentations& augs) {
    out_ << "<?xml version=\"" << (version.empty() ? "1.0" : version) << "\"";
    if (!encoding.empty()) {
        out_ << " encoding=\"" << kOutputEncoding << "\"";
    }
    if (!standalone.empty()) {
        out_ << " standalone=\"" << standalone << "\"";
    }
    out_ << "?>\n";
    EventFilter::xml_decl(version, encoding, standalone, augs);
}

void HtmlWriter::doctype(const std::string& name, const std::string& public_id,
                         const std::string& system_id, const html::Augmentations& augs) {
    out_ << "<!DOCTYPE " << name;
    if (!public_id.empty()) {
        out_ << " PUBLIC \"" << public_id << "\"";
        if (!system_id.empty()) {
            out_ << " \"" << system_id << "\"";
        }
    } else if (!system_id.empty()) {
        out_ << " SYSTEM \"" << system_id << "\"";
    }
    out_ << ">\n";
    EventFilter::doctype(name, public_id, system_id, augs);
}

void HtmlWriter::print_start(const std::string& name, const std::vector<html::Attribute>& attributes) {
    const bool is_meta = to_lower(name) == "meta";
    bool content_type = false;
    if (is_meta) {
        for (const auto& attr : attributes) {
            if (to_lower(attr.name) == "http-equiv" && to_lower(attr.value) == "content-type") {
                content_type = true;
            }
        }
    }

    out_ << '<' << name;
    for (const auto& attr : attributes) {
        out_ << ' ' << attr.name;
        if (!attr.specified && attr.value.empty()) {
            continue;
        }
        std::string value = attr.value;
        const std::string attr_name = to_lower(attr.name);
        if (is_meta && content_type && attr_name == "content") {
            value = rewrite_content_type(value);
        } else if (is_meta && attr_name == "charset") {
            value = kOutputEncoding;
        }
        out_ << "=\"" << escape_attribute(value) << '"';
    }
    out_ << '>';
}

void HtmlWriter::start_element(const std::string& name, const std::vector<html::Attribute>& attributes,
                               const html::Augmentations& augs) {
    seen_root_ = true;
    if (!html::element_info(name).is_empty()) {
        ++depth_;
    }
    raw_text_ = is_raw_text(name);
    print_start(name, attributes);
    EventFilter::start_element(name, attributes, augs);
}

void HtmlWriter::end_element(const std::string& name, const html::Augmentations& augs) {
    raw_text_ = false;
    if (!html::element_info(name).is_empty()) {
        --depth_;
        out_ << "</" << name << '>';
    }
    EventFilter::end_element(name, augs);
}

void HtmlWriter::characters(const std::string& text, const html::Augmentations& augs) {
    if (raw_text_ || in_cdata_) {
        out_ << text;
    } else {
        out_ << escape_text(text);
    }
    EventFilter::characters(text, augs);
}

void HtmlWriter::comment(const std::string& text, const html::Augmentations& augs) {
    if (seen_root_ && depth_ <= 0) {
        out_ << '\n';
    }
    out_ << "<!--" << text << "-->";
    if (!seen_root_) {
        out_ << '\n';
    }
    EventFilter::comment(text, augs);
}

void HtmlWriter::start_cdata(const html::Augmentations& augs) {
    in_cdata_ = true;
    out_ << "<![CDATA[";
    EventFilter::start_cdata(augs);
}

void HtmlWriter::end_cdata(const html::Augmentations& augs) {
    in_cdata_ = false;
    out_ << "]]>";
    EventFilter::end_cdata(augs);
}

void HtmlWriter::processing_instruction(const std::string& target, const std::string& data,
                                        const html::Augmentations& augs) {
    out_ << "<?" << target;
    if (!data.empty()) {
        out_ << ' ' << data;
    }
    out_ << '>';
    EventFilter::processing_instruction(target, data, augs);
}

void HtmlWriter::end_document(const html::Augmentations& augs) {
    out_.flush();
    EventFilter::end_document(augs);
}

} // namespace mender::filters
