#include <mender/dom/dom_builder.h>
#include <mender/html/element_table.h>
#include <algorithm>
#include <cctype>

namespace mender::dom {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

DomBuilder::DomBuilder()
    : document_(std::make_unique<SimpleNode>(SimpleNode::Document)),
      current_(document_.get()) {}

std::unique_ptr<SimpleNode> DomBuilder::take_document() {
    auto taken = std::move(document_);
    document_ = std::make_unique<SimpleNode>(SimpleNode::Document);
    current_ = document_.get();
    return taken;
}

void DomBuilder::start_document(const std::string& encoding, const html::Augmentations&) {
    document_ = std::make_unique<SimpleNode>(SimpleNode::Document);
    current_ = document_.get();
    encoding_ = encoding;
}

void DomBuilder::xml_decl(const std::string&, const std::string&, const std::string&,
                          const html::Augmentations&) {}

void DomBuilder::doctype(const std::string& name, const std::string& public_id,
                         const std::string& system_id, const html::Augmentations&) {
    auto node = std::make_unique<SimpleNode>(SimpleNode::DocumentType);
    node->tag_name = name;
    node->public_id = public_id;
    node->system_id = system_id;
    current_->append_child(std::move(node));
}

void DomBuilder::start_element(const std::string& name, const std::vector<html::Attribute>& attributes,
                               const html::Augmentations&) {
    auto node = std::make_unique<SimpleNode>(SimpleNode::Element);
    node->tag_name = name;
    node->attributes = attributes;
    auto* element = current_->append_child(std::move(node));
    // Void elements never hold children, with or without an end event.
    if (!html::element_info(name).is_empty()) {
        current_ = element;
    }
}

void DomBuilder::end_element(const std::string& name, const html::Augmentations&) {
    if (html::element_info(name).is_empty()) {
        return;
    }
    for (SimpleNode* node = current_; node && node->type == SimpleNode::Element; node = node->parent) {
        if (iequals(node->tag_name, name)) {
            current_ = node->parent;
            return;
        }
    }
}

void DomBuilder::characters(const std::string& text, const html::Augmentations&) {
    if (!current_->children.empty() && current_->children.back()->type == SimpleNode::Text) {
        current_->children.back()->data += text;
        return;
    }
    auto node = std::make_unique<SimpleNode>(SimpleNode::Text);
    node->data = text;
    current_->append_child(std::move(node));
}

void DomBuilder::comment(const std::string& text, const html::Augmentations&) {
    auto node = std::make_unique<SimpleNode>(SimpleNode::Comment);
    node->data = text;
    current_->append_child(std::move(node));
}

void DomBuilder::start_cdata(const html::Augmentations&) {}

void DomBuilder::end_cdata(const html::Augmentations&) {}

void DomBuilder::processing_instruction(const std::string& target, const std::string& data,
                                        const html::Augmentations&) {
    auto node = std::make_unique<SimpleNode>(SimpleNode::ProcessingInstruction);
    node->tag_name = target;
    node->data = data;
    current_->append_child(std::move(node));
}

void DomBuilder::end_document(const html::Augmentations&) {
    current_ = document_.get();
}

} // namespace mender::dom
