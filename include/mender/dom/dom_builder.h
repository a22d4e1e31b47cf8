#pragma once
#include <mender/dom/simple_node.h>
#include <mender/html/event_handler.h>
#include <memory>

namespace mender::dom {

// Terminal handler that builds a SimpleNode tree. Adjacent character
// events are merged into one text node. Tolerates an unbalanced stream:
// an end event without a matching open element is ignored.
class DomBuilder : public html::EventHandler {
public:
    DomBuilder();

    const SimpleNode& document() const { return *document_; }
    std::unique_ptr<SimpleNode> take_document();
    const std::string& encoding() const { return encoding_; }

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
    std::unique_ptr<SimpleNode> document_;
    SimpleNode* current_ = nullptr;
    std::string encoding_;
};

} // namespace mender::dom
