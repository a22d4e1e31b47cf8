#include <mender/filters/event_printer.h>
#include <algorithm>

namespace mender::filters {

std::string EventPrinter::escape(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\\': result += "\\\\"; break;
            default:   result += c; break;
        }
    }
    return result;
}

void EventPrinter::flush_text() {
    if (text_.empty()) {
        return;
    }
    out_ << '"' << escape(text_) << '\n';
    text_.clear();
}

void EventPrinter::line(const std::string& text, const html::Augmentations& augs) {
    flush_text();
    out_ << text;
    if (mark_synthesized_ && augs.synthesized) {
        out_ << " *";
    }
    out_ << '\n';
}

void EventPrinter::xml_decl(const std::string& version, const std::string& encoding,
                            const std::string& standalone, const html::Augmentations& augs) {
    line("?xml " + version + " " + encoding + " " + standalone, augs);
    EventFilter::xml_decl(version, encoding, standalone, augs);
}

void EventPrinter::doctype(const std::string& name, const std::string& public_id,
                           const std::string& system_id, const html::Augmentations& augs) {
    line("!" + name + " \"" + public_id + "\" \"" + system_id + "\"", augs);
    EventFilter::doctype(name, public_id, system_id, augs);
}

void EventPrinter::start_element(const std::string& name, const std::vector<html::Attribute>& attributes,
                                 const html::Augmentations& augs) {
    line("(" + name, augs);
    std::vector<const html::Attribute*> sorted;
    for (const auto& attr : attributes) sorted.push_back(&attr);
    std::sort(sorted.begin(), sorted.end(),
        [](const html::Attribute* a, const html::Attribute* b) { return a->name < b->name; });
    for (const auto* attr : sorted) {
        out_ << 'A' << attr->name << ' ' << escape(attr->value) << '\n';
    }
    EventFilter::start_element(name, attributes, augs);
}

void EventPrinter::end_element(const std::string& name, const html::Augmentations& augs) {
    line(")" + name, augs);
    EventFilter::end_element(name, augs);
}

void EventPrinter::characters(const std::string& text, const html::Augmentations& augs) {
    text_ += text;
    EventFilter::characters(text, augs);
}

void EventPrinter::comment(const std::string& text, const html::Augmentations& augs) {
    line("#" + escape(text), augs);
    EventFilter::comment(text, augs);
}

void EventPrinter::start_cdata(const html::Augmentations& augs) {
    line("[", augs);
    EventFilter::start_cdata(augs);
}

void EventPrinter::end_cdata(const html::Augmentations& augs) {
    line("]", augs);
    EventFilter::end_cdata(augs);
}

void EventPrinter::processing_instruction(const std::string& target, const std::string& data,
                                          const html::Augmentations& augs) {
    line("?" + target + " " + escape(data), augs);
    EventFilter::processing_instruction(target, data, augs);
}

void EventPrinter::end_document(const html::Augmentations& augs) {
    flush_text();
    out_.flush();
    EventFilter::end_document(augs);
}

} // namespace mender::filters
