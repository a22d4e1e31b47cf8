#pragma once
#include <map>
#include <optional>
#include <string>

namespace mender::html {

// Source range of an event. Lines and columns are 1-based, offsets count
// decoded characters from the start of the document.
struct Location {
    int begin_line = 0;
    int begin_column = 0;
    int begin_offset = 0;
    int end_line = 0;
    int end_column = 0;
    int end_offset = 0;

    bool operator==(const Location&) const = default;
};

// Per-event side channel. Every event receives its own copy.
struct Augmentations {
    std::optional<Location> location;
    bool synthesized = false;
    std::map<std::string, std::string> items;

    void set_item(const std::string& key, const std::string& value) { items[key] = value; }
    const std::string* item(const std::string& key) const {
        auto it = items.find(key);
        return it == items.end() ? nullptr : &it->second;
    }

    // Copy of this carrying the same location and items, marked synthesized.
    Augmentations synthesized_copy() const {
        Augmentations copy = *this;
        copy.synthesized = true;
        return copy;
    }
};

} // namespace mender::html
