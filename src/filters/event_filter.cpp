#include <mender/filters/event_filter.h>

namespace mender::filters {

void EventFilter::start_document(const std::string& encoding, const html::Augmentations& augs) {
    if (next_) next_->start_document(encoding, augs);
}

void EventFilter::xml_decl(const std::string& version, const std::string& encoding,
                           const std::string& standalone, const html::Augmentations& augs) {
    if (next_) next_->xml_decl(version, encoding, standalone, augs);
}

void EventFilter::doctype(const std::string& name, const std::string& public_id,
                          const std::string& system_id, const html::Augmentations& augs) {
    if (next_) next_->doctype(name, public_id, system_id, augs);
}

void EventFilter::start_element(const std::string& name,
                                const std::vector<html::Attribute>& attributes,
                                const html::Augmentations& augs) {
    if (next_) next_->start_element(name, attributes, augs);
}

void EventFilter::end_element(const std::string& name, const html::Augmentations& augs) {
    if (next_) next_->end_element(name, augs);
}

void EventFilter::characters(const std::string& text, const html::Augmentations& augs) {
    if (next_) next_->characters(text, augs);
}

void EventFilter::comment(const std::string& text, const html::Augmentations& augs) {
    if (next_) next_->comment(text, augs);
}

void EventFilter::start_cdata(const html::Augmentations& augs) {
    if (next_) next_->start_cdata(augs);
}

void EventFilter::end_cdata(const html::Augmentations& augs) {
    if (next_) next_->end_cdata(augs);
}

void EventFilter::processing_instruction(const std::string& target, const std::string& data,
                                         const html::Augmentations& augs) {
    if (next_) next_->processing_instruction(target, data, augs);
}

void EventFilter::end_document(const html::Augmentations& augs) {
    if (next_) next_->end_document(augs);
}

} // namespace mender::filters
