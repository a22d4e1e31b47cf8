#pragma once
#include <mender/html/token.h>
#include <memory>
#include <string>
#include <vector>

namespace mender::dom {

struct SimpleNode {
    enum Type { Document, DocumentType, Element, Text, Comment, ProcessingInstruction };
    Type type = Document;
    std::string tag_name;  // element name, doctype name or PI target
    std::string data;      // text, comment or PI data
    std::string public_id;
    std::string system_id;
    std::vector<html::Attribute> attributes;
    SimpleNode* parent = nullptr;
    std::vector<std::unique_ptr<SimpleNode>> children;

    SimpleNode() = default;
    explicit SimpleNode(Type node_type) : type(node_type) {}

    SimpleNode* append_child(std::unique_ptr<SimpleNode> child);

    const html::Attribute* attribute(const std::string& name) const;

    // Get text content recursively
    std::string text_content() const;

    // Find element by tag
    SimpleNode* find_element(const std::string& tag) const;
    std::vector<SimpleNode*> find_all_elements(const std::string& tag) const;

    // One line per node, children indented by two spaces, attributes
    // sorted by name below their element.
    std::string serialize() const;
};

} // namespace mender::dom
