#pragma once
#include <cstddef>

namespace mender::html::detail {

struct EntityEntry {
    const char* name;   // without the leading '&', may end in ';'
    const char* value;  // UTF-8
};

extern const EntityEntry kEntityTable[];
extern const std::size_t kEntityTableSize;

} // namespace mender::html::detail
