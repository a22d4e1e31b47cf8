#pragma once
#include <mender/filters/event_filter.h>
#include <ostream>
#include <string>

namespace mender::filters {

// Writes one line per event in a canonical form:
//   (name  start element, followed by "Aname value" lines sorted by name
//   )name  end element
//   "text  merged character data with \n \t \\ escaped
//   #text  comment
//   ?target data, !name public system, [ and ] around CDATA
// Synthesized events are suffixed with " *" when mark_synthesized is set.
class EventPrinter : public EventFilter {
public:
    explicit EventPrinter(std::ostream& out, html::EventHandler* next = nullptr)
        : EventFilter(next), out_(out) {}

    void set_mark_synthesized(bool mark) { mark_synthesized_ = mark; }

    void xml_decl(const std::string& version, const std::string& encoding,
                  const std::string& standalone, const html::Augmentations& augs) override;
    void doctype(const std::string& name, const std::string& public_id,
                 const std::string& system_id, const html::Augmentations& augs) override;
    void start_element(const std::string& name, const std::vector<html::Attribute>& attributes,
                       const html::Augmentations& augs) override;
    void end_element(const std::string& name, const html::Augmentations& augs) override;
    void characters(const std::string& text, const html::Augmentations& augs) override;
    void comment(const std::string& text, const html::Augmentations& augs) override;
    void start_cdata(const html::Augmentations& augs) override;
    void end_cdata(const html::Augmentations& augs) override;
    void processing_instruction(const std::string& target, const std::string& data,
                                const html::Augmentations& augs) override;
    void end_document(const html::Augmentations& augs) override;

    static std::string escape(const std::string& text);

private:
    void flush_text();
    void line(const std::string& text, const html::Augmentations& augs);

    std::ostream& out_;
    std::string text_;
    bool mark_synthesized_ = false;
};

} // namespace mender::filters
