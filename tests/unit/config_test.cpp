#include <mender/core/config.h>
#include <mender/core/error.h>
#include <gtest/gtest.h>
#include <algorithm>
#include <string>

using namespace mender::core;

// ============================================================================
// Defaults
// ============================================================================

// 1. Feature defaults
TEST(Configuration, FeatureDefaults) {
    Configuration config;
    EXPECT_TRUE(config.feature("balance-tags"));
    EXPECT_TRUE(config.feature("augmentations"));
    EXPECT_FALSE(config.feature("report-errors"));
    EXPECT_FALSE(config.feature("document-fragment"));
    EXPECT_FALSE(config.feature("ignore-outside-content"));
    EXPECT_TRUE(config.feature("void-end-events"));
    EXPECT_TRUE(config.feature("trim-outer-whitespace"));
    EXPECT_FALSE(config.feature("allow-selfclosing-tags"));
    EXPECT_FALSE(config.feature("ignore-specified-charset"));
    EXPECT_TRUE(config.feature("normalize-newlines"));
    EXPECT_TRUE(config.feature("cdata-sections"));
    EXPECT_FALSE(config.feature("script/strip-comment-delims"));
    EXPECT_FALSE(config.feature("script/strip-cdata-delims"));
    EXPECT_FALSE(config.feature("style/strip-comment-delims"));
    EXPECT_FALSE(config.feature("style/strip-cdata-delims"));
    EXPECT_FALSE(config.feature("insert-doctype"));
    EXPECT_FALSE(config.feature("override-doctype"));
    EXPECT_TRUE(config.feature("parse-noscript-content"));
    EXPECT_FALSE(config.feature("allow-selfclosing-iframe"));
}

// 2. Property defaults
TEST(Configuration, PropertyDefaults) {
    Configuration config;
    EXPECT_EQ(config.property("names/elems"), "lower");
    EXPECT_EQ(config.property("names/attrs"), "lower");
    EXPECT_EQ(config.property("default-encoding"), "windows-1252");
    EXPECT_EQ(config.property("max-depth"), std::to_string(config::kDefaultMaxDepth));
    EXPECT_EQ(config.property("doctype/pubid"), "-//W3C//DTD HTML 4.01 Transitional//EN");
    EXPECT_EQ(config.property("doctype/sysid"), "http://www.w3.org/TR/html4/loose.dtd");
    EXPECT_EQ(config.property("fragment-context-stack"), "");
}

// 3. Every recognized name is readable
TEST(Configuration, RecognizedNames) {
    Configuration config;
    EXPECT_EQ(Configuration::recognized_features().size(), 19u);
    for (const auto& name : Configuration::recognized_features()) {
        EXPECT_NO_THROW(config.feature(name)) << name;
    }
    EXPECT_EQ(Configuration::recognized_properties().size(), 7u);
    for (const auto& name : Configuration::recognized_properties()) {
        EXPECT_NO_THROW(config.property(name)) << name;
    }
}

// ============================================================================
// Setting values
// ============================================================================

// 4. Features write through to ParserConfig
TEST(Configuration, SetFeature) {
    Configuration config;
    config.set_feature("balance-tags", false);
    config.set_feature("document-fragment", true);
    EXPECT_FALSE(config.config().balance_tags);
    EXPECT_TRUE(config.config().document_fragment);
    EXPECT_FALSE(config.feature("balance-tags"));
}

// 5. Name case properties
TEST(Configuration, SetNameCase) {
    Configuration config;
    config.set_property("names/elems", "upper");
    config.set_property("names/attrs", "match");
    EXPECT_EQ(config.config().element_names, NameCase::Upper);
    EXPECT_EQ(config.config().attribute_names, NameCase::NoChange);
    EXPECT_EQ(config.property("names/attrs"), "no-change");
}

// 6. Encoding labels are stored canonically
TEST(Configuration, SetDefaultEncoding) {
    Configuration config;
    config.set_property("default-encoding", "latin1");
    EXPECT_EQ(config.property("default-encoding"), "ISO-8859-1");
    config.set_property("default-encoding", " utf8 ");
    EXPECT_EQ(config.config().default_encoding, "UTF-8");
}

// 7. Maximum depth
TEST(Configuration, SetMaxDepth) {
    Configuration config;
    config.set_property("max-depth", "32");
    EXPECT_EQ(config.config().max_depth, 32u);
    EXPECT_EQ(config.property("max-depth"), "32");
}

// 8. Doctype identifiers are taken as given
TEST(Configuration, SetDoctypeIdentifiers) {
    Configuration config;
    config.set_property("doctype/pubid", "-//W3C//DTD HTML 4.01//EN");
    config.set_property("doctype/sysid", "");
    EXPECT_EQ(config.config().doctype_public_id, "-//W3C//DTD HTML 4.01//EN");
    EXPECT_EQ(config.property("doctype/sysid"), "");
}

// 9. Fragment context names split on spaces and commas
TEST(Configuration, SetFragmentContext) {
    Configuration config;
    config.set_property("fragment-context-stack", " html, body  table,tbody ");
    ASSERT_EQ(config.config().fragment_context.size(), 4u);
    EXPECT_EQ(config.config().fragment_context[0], "html");
    EXPECT_EQ(config.config().fragment_context[3], "tbody");
    EXPECT_EQ(config.property("fragment-context-stack"), "html body table tbody");
    config.set_property("fragment-context-stack", "");
    EXPECT_TRUE(config.config().fragment_context.empty());
}

// ============================================================================
// Errors
// ============================================================================

// 10. Unknown names are not recognized
TEST(Configuration, UnknownNames) {
    Configuration config;
    try {
        config.set_feature("namespaces", true);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& error) {
        EXPECT_EQ(error.kind(), ConfigError::Kind::NotRecognized);
        EXPECT_EQ(error.name(), "namespaces");
        EXPECT_NE(std::string(error.what()).find("not recognized"), std::string::npos);
    }
    EXPECT_THROW(config.feature("namespaces"), ConfigError);
    EXPECT_THROW(config.set_property("filters", "x"), ConfigError);
    EXPECT_THROW(config.property("filters"), ConfigError);
}

// 11. Bad values are not supported
TEST(Configuration, BadValues) {
    Configuration config;
    for (auto [name, value] : {std::pair{"names/elems", "title"},
                               std::pair{"default-encoding", "klingon"},
                               std::pair{"max-depth", "0"},
                               std::pair{"max-depth", "-3"},
                               std::pair{"max-depth", "12x"},
                               std::pair{"fragment-context-stack", "html <body>"}}) {
        try {
            config.set_property(name, value);
            FAIL() << name << "=" << value << " accepted";
        } catch (const ConfigError& error) {
            EXPECT_EQ(error.kind(), ConfigError::Kind::NotSupported) << name;
        }
    }
    EXPECT_EQ(config.property("max-depth"), std::to_string(config::kDefaultMaxDepth));
}

// ============================================================================
// Name case helpers
// ============================================================================

// 12. apply_name_case
TEST(NameCase, Apply) {
    EXPECT_EQ(apply_name_case("DiV", NameCase::Lower), "div");
    EXPECT_EQ(apply_name_case("DiV", NameCase::Upper), "DIV");
    EXPECT_EQ(apply_name_case("DiV", NameCase::NoChange), "DiV");
}

// 13. Labels round trip
TEST(NameCase, Labels) {
    for (NameCase name_case : {NameCase::Lower, NameCase::Upper, NameCase::NoChange}) {
        EXPECT_EQ(parse_name_case(name_case_label(name_case)), name_case);
    }
    EXPECT_FALSE(parse_name_case("LOWER").has_value());
}
