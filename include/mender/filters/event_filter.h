#pragma once
#include <mender/html/event_handler.h>

namespace mender::filters {

// Pass-through stage of an event pipeline. Subclasses override the events
// they care about and call the base to forward. Events are dropped while
// no next handler is set.
class EventFilter : public html::EventHandler {
public:
    explicit EventFilter(html::EventHandler* next = nullptr) : next_(next) {}

    void set_next(html::EventHandler* next) { next_ = next; }
    html::EventHandler* next() const { return next_; }

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

private:
    html::EventHandler* next_ = nullptr;
};

} // namespace mender::filters
