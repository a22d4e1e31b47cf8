#pragma once
#include <mender/filters/event_filter.h>
#include <ostream>
#include <string>

namespace mender::filters {

// Serializes the event stream back to HTML as UTF-8 and forwards every
// event unchanged. Text is escaped through the named reference table
// except inside raw text elements.
class HtmlWriter : public EventFilter {
public:
    explicit HtmlWriter(std::ostream& out, html::EventHandler* next = nullptr);

    void start_document(const std::string& encoding, const html::Augmentations& augs) override;
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

    static std::string escape_text(const std::string& text);
    static std::string escape_attribute(const std::string& value);

private:
    void print_start(const std::string& name, const std::vector<html::Attribute>& attributes);

    std::ostream& out_;
    bool seen_root_ = false;
    int depth_ = 0;
    bool raw_text_ = false;
    bool in_cdata_ = false;
};

} // namespace mender::filters
