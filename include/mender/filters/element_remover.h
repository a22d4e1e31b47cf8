#pragma once
#include <mender/filters/event_filter.h>
#include <cstddef>
#include <limits>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mender::filters {

// Whitelist filter. Accepted elements pass with only their listed
// attributes; removed elements vanish together with their content; the
// tags of every other element are stripped and their content kept.
// Names compare case-insensitively.
class ElementRemover : public EventFilter {
public:
    using EventFilter::EventFilter;

    void accept_element(const std::string& name, const std::vector<std::string>& attributes = {});
    void remove_element(const std::string& name);

    bool accepted(const std::string& name) const;
    bool removed(const std::string& name) const;

    void start_document(const std::string& encoding, const html::Augmentations& augs) override;
    void start_element(const std::string& name, const std::vector<html::Attribute>& attributes,
                       const html::Augmentations& augs) override;
    void end_element(const std::string& name, const html::Augmentations& augs) override;
    void characters(const std::string& text, const html::Augmentations& augs) override;
    void comment(const std::string& text, const html::Augmentations& augs) override;
    void start_cdata(const html::Augmentations& augs) override;
    void end_cdata(const html::Augmentations& augs) override;
    void processing_instruction(const std::string& target, const std::string& data,
                                const html::Augmentations& augs) override;

private:
    static constexpr std::size_t kNotRemoving = std::numeric_limits<std::size_t>::max();

    bool forwarding() const { return depth_ <= removal_depth_; }
    std::vector<html::Attribute> filter_attributes(const std::string& key,
                                                   const std::vector<html::Attribute>& attributes) const;

    std::unordered_map<std::string, std::unordered_set<std::string>> accepted_;
    std::unordered_set<std::string> removed_;
    std::size_t depth_ = 0;
    std::size_t removal_depth_ = kNotRemoving;
};

} // namespace mender::filters
