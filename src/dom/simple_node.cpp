#include <mender/dom/simple_node.h>
#include <algorithm>

namespace mender::dom {

namespace {

void serialize_node(const SimpleNode& node, int depth, std::string& out) {
    const std::string indent(static_cast<std::size_t>(depth) * 2, ' ');
    switch (node.type) {
        case SimpleNode::Document:
            out += "#document\n";
            break;
        case SimpleNode::DocumentType:
            out += "| " + indent + "<!DOCTYPE " + node.tag_name;
            if (!node.public_id.empty() || !node.system_id.empty()) {
                out += " \"" + node.public_id + "\" \"" + node.system_id + "\"";
            }
            out += ">\n";
            break;
        case SimpleNode::Element: {
            out += "| " + indent + "<" + node.tag_name + ">\n";
            std::vector<const html::Attribute*> sorted;
            for (const auto& attr : node.attributes) sorted.push_back(&attr);
            std::sort(sorted.begin(), sorted.end(),
                [](const html::Attribute* a, const html::Attribute* b) { return a->name < b->name; });
            for (const auto* attr : sorted) {
                out += "| " + indent + "  " + attr->name + "=\"" + attr->value + "\"\n";
            }
            break;
        }
        case SimpleNode::Text:
            out += "| " + indent + "\"" + node.data + "\"\n";
            break;
        case SimpleNode::Comment:
            out += "| " + indent + "<!-- " + node.data + " -->\n";
            break;
        case SimpleNode::ProcessingInstruction:
            out += "| " + indent + "<?" + node.tag_name + " " + node.data + ">\n";
            break;
    }
    const int child_depth = node.type == SimpleNode::Document ? 0 : depth + 1;
    for (const auto& child : node.children) {
        serialize_node(*child, child_depth, out);
    }
}

} // namespace

SimpleNode* SimpleNode::append_child(std::unique_ptr<SimpleNode> child) {
    child->parent = this;
    auto* raw = child.get();
    children.push_back(std::move(child));
    return raw;
}

const html::Attribute* SimpleNode::attribute(const std::string& name) const {
    return html::find_attribute(attributes, name);
}

std::string SimpleNode::text_content() const {
    if (type == Text || type == Comment) {
        return data;
    }
    std::string result;
    for (auto& child : children) {
        if (child->type == Comment) continue;
        result += child->text_content();
    }
    return result;
}

SimpleNode* SimpleNode::find_element(const std::string& tag) const {
    for (auto& child : children) {
        if (child->type == Element && child->tag_name == tag) {
            return child.get();
        }
        auto* found = child->find_element(tag);
        if (found) return found;
    }
    return nullptr;
}

std::vector<SimpleNode*> SimpleNode::find_all_elements(const std::string& tag) const {
    std::vector<SimpleNode*> result;
    for (auto& child : children) {
        if (child->type == Element && child->tag_name == tag) {
            result.push_back(child.get());
        }
        auto sub = child->find_all_elements(tag);
        result.insert(result.end(), sub.begin(), sub.end());
    }
    return result;
}

std::string SimpleNode::serialize() const {
    std::string out;
    serialize_node(*this, 0, out);
    return out;
}

} // namespace mender::dom
