#ifndef MENDER_CORE_CONFIG_H
#define MENDER_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mender::core {

namespace config {

inline constexpr std::size_t kDefaultMaxDepth = 512;
inline constexpr std::size_t kEncodingSniffLimit = 1024;
// Characters the scanner can push back. Covers the longest entity name
// plus its terminator and the longest raw text close sequence.
inline constexpr std::size_t kMaxRewind = 64;
inline constexpr const char kDefaultEncoding[] = "windows-1252";
// Identifiers of the inserted or overriding doctype (HTML 4.01 Transitional).
inline constexpr const char kDefaultDoctypePublicId[] = "-//W3C//DTD HTML 4.01 Transitional//EN";
inline constexpr const char kDefaultDoctypeSystemId[] = "http://www.w3.org/TR/html4/loose.dtd";

}  // namespace config

enum class NameCase {
    Lower,
    Upper,
    NoChange,
};

const char* name_case_label(NameCase name_case);
std::optional<NameCase> parse_name_case(std::string_view label);
std::string apply_name_case(std::string_view name, NameCase name_case);

struct ParserConfig {
    // Features
    bool balance_tags = true;
    bool augmentations = true;
    bool report_errors = false;
    bool document_fragment = false;
    bool ignore_outside_content = false;
    bool void_end_events = true;
    bool trim_outer_whitespace = true;
    bool allow_selfclosing_tags = false;
    bool ignore_specified_charset = false;
    bool normalize_newlines = true;
    bool cdata_sections = true;  // false reports CDATA as a comment
    bool script_strip_comment_delims = false;
    bool script_strip_cdata_delims = false;
    bool style_strip_comment_delims = false;
    bool style_strip_cdata_delims = false;
    bool insert_doctype = false;
    bool override_doctype = false;
    bool parse_noscript_content = true;
    bool allow_selfclosing_iframe = false;

    // Properties
    NameCase element_names = NameCase::Lower;
    NameCase attribute_names = NameCase::Lower;
    std::string default_encoding = config::kDefaultEncoding;
    std::size_t max_depth = config::kDefaultMaxDepth;
    std::string doctype_public_id = config::kDefaultDoctypePublicId;
    std::string doctype_system_id = config::kDefaultDoctypeSystemId;
    // Elements taken as already open when a fragment starts, outermost first.
    std::vector<std::string> fragment_context;
};

// String keyed access to ParserConfig. Names and values are validated
// here so that a parse never starts with a bad configuration.
class Configuration {
public:
    Configuration() = default;
    explicit Configuration(ParserConfig config) : config_(std::move(config)) {}

    void set_feature(std::string_view name, bool state);
    bool feature(std::string_view name) const;

    void set_property(std::string_view name, std::string_view value);
    std::string property(std::string_view name) const;

    static const std::vector<std::string>& recognized_features();
    static const std::vector<std::string>& recognized_properties();

    const ParserConfig& config() const { return config_; }
    ParserConfig& config() { return config_; }

private:
    ParserConfig config_;
};

}  // namespace mender::core

#endif  // MENDER_CORE_CONFIG_H
