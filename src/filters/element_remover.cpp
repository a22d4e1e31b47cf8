#include <mender/filters/element_remover.h>
#include <mender/html/element_table.h>
#include <algorithm>
#include <cctype>

namespace mender::filters {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Void elements may arrive without an end event, so they never count
// towards the depth.
bool is_void(const std::string& name) {
    return html::element_info(name).is_empty();
}

} // namespace

void ElementRemover::accept_element(const std::string& name, const std::vector<std::string>& attributes) {
    auto& allowed = accepted_[to_lower(name)];
    allowed.clear();
    for (const auto& attr : attributes) {
        allowed.insert(to_lower(attr));
    }
}

void ElementRemover::remove_element(const std::string& name) {
    removed_.insert(to_lower(name));
}

bool ElementRemover::accepted(const std::string& name) const {
    return accepted_.count(to_lower(name)) != 0;
}

bool ElementRemover::removed(const std::string& name) const {
    return removed_.count(to_lower(name)) != 0;
}

std::vector<html::Attribute> ElementRemover::filter_attributes(
        const std::string& key, const std::vector<html::Attribute>& attributes) const {
    const auto& allowed = accepted_.at(key);
    std::vector<html::Attribute> kept;
    for (const auto& attr : attributes) {
        if (allowed.count(to_lower(attr.name))) {
            kept.push_back(attr);
        }
    }
    return kept;
}

void ElementRemover::start_document(const std::string& encoding, const html::Augmentations& augs) {
    depth_ = 0;
    removal_depth_ = kNotRemoving;
    EventFilter::start_document(encoding, augs);
}

void ElementRemover::start_element(const std::string& name,
                                   const std::vector<html::Attribute>& attributes,
                                   const html::Augmentations& augs) {
    const bool void_element = is_void(name);
    if (forwarding()) {
        const std::string key = to_lower(name);
        if (accepted_.count(key)) {
            EventFilter::start_element(name, filter_attributes(key, attributes), augs);
        } else if (removed_.count(key) && !void_element) {
            removal_depth_ = depth_;
        }
    }
    if (!void_element) {
        ++depth_;
    }
}

void ElementRemover::end_element(const std::string& name, const html::Augmentations& augs) {
    if (is_void(name)) {
        if (forwarding() && accepted(name)) {
            EventFilter::end_element(name, augs);
        }
        return;
    }
    if (forwarding() && accepted(name)) {
        EventFilter::end_element(name, augs);
    }
    if (depth_ > 0) {
        --depth_;
    }
    if (depth_ == removal_depth_) {
        removal_depth_ = kNotRemoving;
    }
}

void ElementRemover::characters(const std::string& text, const html::Augmentations& augs) {
    if (forwarding()) EventFilter::characters(text, augs);
}

void ElementRemover::comment(const std::string& text, const html::Augmentations& augs) {
    if (forwarding()) EventFilter::comment(text, augs);
}

void ElementRemover::start_cdata(const html::Augmentations& augs) {
    if (forwarding()) EventFilter::start_cdata(augs);
}

void ElementRemover::end_cdata(const html::Augmentations& augs) {
    if (forwarding()) EventFilter::end_cdata(augs);
}

void ElementRemover::processing_instruction(const std::string& target, const std::string& data,
                                            const html::Augmentations& augs) {
    if (forwarding()) EventFilter::processing_instruction(target, data, augs);
}

} // namespace mender::filters
