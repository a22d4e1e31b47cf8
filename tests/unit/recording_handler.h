#pragma once
#include <mender/core/config.h>
#include <mender/html/event_handler.h>
#include <mender/html/parser.h>
#include <string>
#include <string_view>
#include <vector>

namespace mender::testing {

struct RecordedEvent {
    enum Kind { StartDocument, XmlDecl, Doctype, StartElement, EndElement, Characters,
                Comment, StartCData, EndCData, ProcessingInstruction, EndDocument };
    Kind kind;
    std::string text;  // compact rendering
    std::string name;
    html::Augmentations augs;
};

// Records every event. str() renders the stream compactly, start and end
// document excluded: <name a="v">, </name>, raw text, <!--c-->,
// <!DOCTYPE n>, <?t d>, <![CDATA[ and ]]>.
class RecordingHandler : public html::EventHandler {
public:
    std::vector<RecordedEvent> events;
    std::string encoding;
    int start_documents = 0;
    int end_documents = 0;

    void start_document(const std::string& enc, const html::Augmentations& augs) override {
        encoding = enc;
        ++start_documents;
        events.push_back({RecordedEvent::StartDocument, "", "", augs});
    }
    void xml_decl(const std::string& version, const std::string& enc,
                  const std::string& standalone, const html::Augmentations& augs) override {
        events.push_back({RecordedEvent::XmlDecl,
                          "<?xml " + version + " " + enc + " " + standalone + "?>", "xml", augs});
    }
    void doctype(const std::string& name, const std::string&, const std::string&,
                 const html::Augmentations& augs) override {
        events.push_back({RecordedEvent::Doctype, "<!DOCTYPE " + name + ">", name, augs});
    }
    void start_element(const std::string& name, const std::vector<html::Attribute>& attributes,
                       const html::Augmentations& augs) override {
        std::string text = "<" + name;
        for (const auto& attr : attributes) {
            text += " " + attr.name + "=\"" + attr.value + "\"";
        }
        text += ">";
        events.push_back({RecordedEvent::StartElement, text, name, augs});
    }
    void end_element(const std::string& name, const html::Augmentations& augs) override {
        events.push_back({RecordedEvent::EndElement, "</" + name + ">", name, augs});
    }
    void characters(const std::string& text, const html::Augmentations& augs) override {
        events.push_back({RecordedEvent::Characters, text, "", augs});
    }
    void comment(const std::string& text, const html::Augmentations& augs) override {
        events.push_back({RecordedEvent::Comment, "<!--" + text + "-->", "", augs});
    }
    void start_cdata(const html::Augmentations& augs) override {
        events.push_back({RecordedEvent::StartCData, "<![CDATA[", "", augs});
    }
    void end_cdata(const html::Augmentations& augs) override {
        events.push_back({RecordedEvent::EndCData, "]]>", "", augs});
    }
    void processing_instruction(const std::string& target, const std::string& data,
                                const html::Augmentations& augs) override {
        events.push_back({RecordedEvent::ProcessingInstruction, "<?" + target + " " + data + ">",
                          target, augs});
    }
    void end_document(const html::Augmentations& augs) override {
        ++end_documents;
        events.push_back({RecordedEvent::EndDocument, "", "", augs});
    }

    std::string str() const {
        std::string out;
        for (const auto& e : events) out += e.text;
        return out;
    }

    // Every start matched by an end of the same name, innermost first.
    bool well_nested() const {
        std::vector<std::string> open;
        for (const auto& e : events) {
            if (e.kind == RecordedEvent::StartElement) {
                open.push_back(e.name);
            } else if (e.kind == RecordedEvent::EndElement) {
                if (open.empty() || open.back() != e.name) return false;
                open.pop_back();
            }
        }
        return open.empty();
    }

    std::vector<const RecordedEvent*> of_kind(RecordedEvent::Kind kind) const {
        std::vector<const RecordedEvent*> result;
        for (const auto& e : events) {
            if (e.kind == kind) result.push_back(&e);
        }
        return result;
    }
};

// Parses input with the given configuration and returns the compact
// rendering of the event stream.
inline std::string parse_to_string(std::string_view input,
                                   const core::ParserConfig& config = core::ParserConfig{}) {
    html::Parser parser{core::Configuration(config)};
    RecordingHandler handler;
    parser.parse(input, handler);
    return handler.str();
}

inline std::string fragment_to_string(std::string_view input) {
    core::ParserConfig config;
    config.document_fragment = true;
    return parse_to_string(input, config);
}

} // namespace mender::testing
