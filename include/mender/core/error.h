#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mender::core {

// Raised by Configuration before a parse starts.
class ConfigError : public std::runtime_error {
public:
    enum class Kind {
        NotRecognized,  // unknown feature or property name
        NotSupported,   // known name, value not accepted
    };

    ConfigError(Kind kind, const std::string& name, const std::string& detail);

    Kind kind() const { return kind_; }
    const std::string& name() const { return name_; }

private:
    Kind kind_;
    std::string name_;
};

// The underlying byte source failed. Aborts the parse.
class IoError : public std::runtime_error {
public:
    explicit IoError(const std::string& what) : std::runtime_error(what) {}
};

// Element nesting exceeded the configured maximum depth. Thrown after
// the event stream has been closed.
class LimitError : public std::runtime_error {
public:
    LimitError(const std::string& what, std::size_t depth)
        : std::runtime_error(what), depth_(depth) {}

    std::size_t depth() const { return depth_; }

private:
    std::size_t depth_;
};

}  // namespace mender::core
