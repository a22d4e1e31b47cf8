#include <mender/core/config.h>
#include <mender/core/error.h>
#include <mender/html/encoding.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace mender::core {

ConfigError::ConfigError(Kind kind, const std::string& name, const std::string& detail)
    : std::runtime_error((kind == Kind::NotRecognized ? "not recognized: " : "not supported: ")
                         + name + (detail.empty() ? "" : " (" + detail + ")")),
      kind_(kind),
      name_(name) {}

const char* name_case_label(NameCase name_case) {
    switch (name_case) {
        case NameCase::Lower:    return "lower";
        case NameCase::Upper:    return "upper";
        case NameCase::NoChange: return "no-change";
    }
    return "lower";
}

std::optional<NameCase> parse_name_case(std::string_view label) {
    if (label == "lower") return NameCase::Lower;
    if (label == "upper") return NameCase::Upper;
    if (label == "no-change" || label == "match") return NameCase::NoChange;
    return std::nullopt;
}

std::string apply_name_case(std::string_view name, NameCase name_case) {
    std::string result(name);
    switch (name_case) {
        case NameCase::Lower:
            std::transform(result.begin(), result.end(), result.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            break;
        case NameCase::Upper:
            std::transform(result.begin(), result.end(), result.begin(),
                [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            break;
        case NameCase::NoChange:
            break;
    }
    return result;
}

namespace {

struct FeatureSlot {
    const char* name;
    bool ParserConfig::*member;
};

const FeatureSlot kFeatures[] = {
    {"balance-tags", &ParserConfig::balance_tags},
    {"augmentations", &ParserConfig::augmentations},
    {"report-errors", &ParserConfig::report_errors},
    {"document-fragment", &ParserConfig::document_fragment},
    {"ignore-outside-content", &ParserConfig::ignore_outside_content},
    {"void-end-events", &ParserConfig::void_end_events},
    {"trim-outer-whitespace", &ParserConfig::trim_outer_whitespace},
    {"allow-selfclosing-tags", &ParserConfig::allow_selfclosing_tags},
    {"ignore-specified-charset", &ParserConfig::ignore_specified_charset},
    {"normalize-newlines", &ParserConfig::normalize_newlines},
    {"cdata-sections", &ParserConfig::cdata_sections},
    {"script/strip-comment-delims", &ParserConfig::script_strip_comment_delims},
    {"script/strip-cdata-delims", &ParserConfig::script_strip_cdata_delims},
    {"style/strip-comment-delims", &ParserConfig::style_strip_comment_delims},
    {"style/strip-cdata-delims", &ParserConfig::style_strip_cdata_delims},
    {"insert-doctype", &ParserConfig::insert_doctype},
    {"override-doctype", &ParserConfig::override_doctype},
    {"parse-noscript-content", &ParserConfig::parse_noscript_content},
    {"allow-selfclosing-iframe", &ParserConfig::allow_selfclosing_iframe},
};

// "html body div" or "html,body,div".
std::vector<std::string> split_names(std::string_view value) {
    std::vector<std::string> names;
    std::string current;
    for (char c : value) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) names.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) names.push_back(std::move(current));
    return names;
}

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += ' ';
        joined += name;
    }
    return joined;
}

const FeatureSlot* find_feature(std::string_view name) {
    for (const auto& slot : kFeatures) {
        if (name == slot.name) return &slot;
    }
    return nullptr;
}

} // namespace

void Configuration::set_feature(std::string_view name, bool state) {
    const FeatureSlot* slot = find_feature(name);
    if (!slot) {
        throw ConfigError(ConfigError::Kind::NotRecognized, std::string(name), "feature");
    }
    config_.*(slot->member) = state;
}

bool Configuration::feature(std::string_view name) const {
    const FeatureSlot* slot = find_feature(name);
    if (!slot) {
        throw ConfigError(ConfigError::Kind::NotRecognized, std::string(name), "feature");
    }
    return config_.*(slot->member);
}

void Configuration::set_property(std::string_view name, std::string_view value) {
    const std::string key(name);
    if (name == "names/elems" || name == "names/attrs") {
        auto name_case = parse_name_case(value);
        if (!name_case) {
            throw ConfigError(ConfigError::Kind::NotSupported, key,
                              "expected lower, upper or no-change, got '" + std::string(value) + "'");
        }
        if (name == "names/elems") {
            config_.element_names = *name_case;
        } else {
            config_.attribute_names = *name_case;
        }
        return;
    }
    if (name == "default-encoding") {
        auto encoding = html::encoding_from_label(value);
        if (!encoding) {
            throw ConfigError(ConfigError::Kind::NotSupported, key,
                              "unknown encoding '" + std::string(value) + "'");
        }
        config_.default_encoding = html::encoding_name(*encoding);
        return;
    }
    if (name == "max-depth") {
        std::size_t depth = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), depth);
        if (ec != std::errc() || ptr != value.data() + value.size() || depth == 0) {
            throw ConfigError(ConfigError::Kind::NotSupported, key,
                              "expected a positive integer, got '" + std::string(value) + "'");
        }
        config_.max_depth = depth;
        return;
    }
    if (name == "doctype/pubid") {
        config_.doctype_public_id = std::string(value);
        return;
    }
    if (name == "doctype/sysid") {
        config_.doctype_system_id = std::string(value);
        return;
    }
    if (name == "fragment-context-stack") {
        auto names = split_names(value);
        for (const auto& element : names) {
            if (element.find_first_of("<>/=\"'") != std::string::npos) {
                throw ConfigError(ConfigError::Kind::NotSupported, key,
                                  "invalid element name '" + element + "'");
            }
        }
        config_.fragment_context = std::move(names);
        return;
    }
    throw ConfigError(ConfigError::Kind::NotRecognized, key, "property");
}

std::string Configuration::property(std::string_view name) const {
    if (name == "names/elems") return name_case_label(config_.element_names);
    if (name == "names/attrs") return name_case_label(config_.attribute_names);
    if (name == "default-encoding") return config_.default_encoding;
    if (name == "max-depth") return std::to_string(config_.max_depth);
    if (name == "doctype/pubid") return config_.doctype_public_id;
    if (name == "doctype/sysid") return config_.doctype_system_id;
    if (name == "fragment-context-stack") return join_names(config_.fragment_context);
    throw ConfigError(ConfigError::Kind::NotRecognized, std::string(name), "property");
}

const std::vector<std::string>& Configuration::recognized_features() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v;
        for (const auto& slot : kFeatures) v.emplace_back(slot.name);
        return v;
    }();
    return names;
}

const std::vector<std::string>& Configuration::recognized_properties() {
    static const std::vector<std::string> names = {
        "names/elems", "names/attrs", "default-encoding", "max-depth",
        "doctype/pubid", "doctype/sysid", "fragment-context-stack"
    };
    return names;
}

}  // namespace mender::core
