#pragma once
#include <mender/core/config.h>
#include <mender/core/diagnostics.h>
#include <mender/html/element_table.h>
#include <mender/html/event_handler.h>
#include <mender/html/token.h>
#include <cstddef>
#include <string>
#include <vector>

namespace mender::html {

// One entry of the element stack.
struct OpenElement {
    std::string name;                   // name as emitted
    const ElementInfo* info = nullptr;
    std::vector<Attribute> attributes;  // kept for inline elements only
    Augmentations augs;                 // of the opening event
};

// Turns the scanner's token stream into a well nested event stream:
// implies missing parents and end tags, closes and re-opens misnested
// inline elements, drops what cannot be placed.
class TagBalancer {
public:
    TagBalancer(EventHandler& handler, const core::ParserConfig& config,
                core::DiagnosticEmitter* diagnostics = nullptr);

    // Opens the fragment context elements, if configured, without events.
    void start_document(const std::string& encoding, const Augmentations& augs);

    // Feeds one token. EndOfFile finishes the document. Throws
    // core::LimitError once the nesting limit is exceeded, after the
    // stream has been closed.
    void process(const Token& token);

    void end_document(const Augmentations& augs);

    bool finished() const { return finished_; }
    std::size_t depth() const { return stack_.size(); }
    const std::vector<OpenElement>& open_elements() const { return stack_; }

private:
    struct PendingText {
        std::string text;
        Augmentations augs;
    };
    struct PendingEnd {
        std::string name;
        Augmentations augs;
    };

    void start_element(const std::string& name, const std::vector<Attribute>& attributes,
                       const Augmentations& augs, bool forced);
    void empty_element(const std::string& name, const std::vector<Attribute>& attributes,
                       const Augmentations& augs);
    void end_element(const std::string& name, const Augmentations& augs, bool forced);
    void characters(const std::string& text, const Augmentations& augs);
    void comment(const std::string& text, const Augmentations& augs);
    void cdata(const std::string& text, const Augmentations& augs);
    void processing_instruction(const std::string& target, const std::string& data,
                                const Augmentations& augs);
    void doctype(const Token& token);
    void xml_decl(const Token& token);

    bool force_start_element(ElementCode code, const Augmentations& cause,
                             const std::vector<Attribute>& attributes = {});
    bool force_start_element(const OpenElement& element, const Augmentations& cause);
    void force_start_body(const Augmentations& cause);
    void close_head(const Augmentations& cause);
    void consume_buffered_ends();
    void consume_early_text();
    void refeed_lost_text();
    void add_body_if_needed(ElementCode code, const Augmentations& cause);
    void discard_start(const std::string& name, const Augmentations& augs, const char* reason);
    void discard_end(const std::string& name, const Augmentations& augs, const char* reason);

    void push(OpenElement element);
    OpenElement pop();
    void emit_start(const std::string& name, const std::vector<Attribute>& attributes,
                    const Augmentations& augs);
    void emit_end(const std::string& name, const Augmentations& augs);
    [[noreturn]] void overflow(const Augmentations& augs);

    int element_depth(const std::string& name, const ElementInfo& info) const;
    int parent_depth(const ElementInfo& info) const;
    bool inside_table_structure() const;
    std::string element_name(ElementCode code) const;

    void warn(const char* stage, const std::string& message, const Augmentations& augs);

    EventHandler& handler_;
    core::ParserConfig config_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;

    std::vector<OpenElement> stack_;
    std::vector<PendingText> lost_text_;
    std::vector<PendingEnd> buffered_ends_;
    std::vector<std::string> discarded_starts_;  // discarded body and html only
    std::size_t context_size_ = 0;               // fragment context entries at the bottom

    bool ignore_outside_content_ = false;
    bool seen_anything_ = false;
    bool seen_doctype_ = false;
    bool seen_root_ = false;
    bool seen_root_end_ = false;
    bool seen_head_ = false;
    bool seen_body_ = false;
    bool seen_body_end_ = false;
    bool seen_frameset_ = false;
    bool seen_characters_ = false;
    bool opened_form_ = false;
    bool opened_select_ = false;
    bool opened_svg_ = false;
    bool template_fragment_ = false;
    bool finished_ = false;
};

} // namespace mender::html
