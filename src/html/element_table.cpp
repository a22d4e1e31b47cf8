#include <mender/html/element_table.h>
#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

namespace mender::html {

namespace {

using C = ElementCode;

struct ElementDef {
    C code;
    const char* name;
    std::uint8_t flags;
    std::vector<C> parents;
    std::optional<C> bounds;
    std::vector<C> closes;
};

constexpr std::uint8_t kInlineBlock = kInline | kBlock;
constexpr std::uint8_t kBlockContainer = kBlock | kContainer;

const std::vector<C> kHeadings = {C::H1, C::H2, C::H3, C::H4, C::H5, C::H6, C::P};

// Natural parents and closing sets of every known element.
std::vector<ElementDef> element_defs() {
    return {
        {C::A, "a", kContainer, {C::Body}, {}, {C::A}},
        {C::Abbr, "abbr", kInline, {C::Body}, {}, {}},
        {C::Acronym, "acronym", kInline, {C::Body}, {}, {}},
        {C::Address, "address", kBlock, {C::Body}, {}, {C::P}},
        {C::Applet, "applet", kContainer, {C::Body}, {}, {}},
        {C::Area, "area", kEmpty, {C::Body}, {}, {}},
        {C::Article, "article", kBlock, {C::Body}, {}, {C::P}},
        {C::Aside, "aside", kBlock, {C::Body}, {}, {C::P}},
        {C::Audio, "audio", kContainer, {C::Body}, {}, {}},
        {C::B, "b", kInline, {C::Body}, {}, {}},
        {C::Base, "base", kEmpty, {C::Head}, {}, {}},
        {C::Basefont, "basefont", kEmpty, {C::Head}, {}, {}},
        {C::Bdi, "bdi", kInline, {C::Body}, {}, {}},
        {C::Bdo, "bdo", kInline, {C::Body}, {}, {}},
        {C::Bgsound, "bgsound", kEmpty, {C::Head}, {}, {}},
        {C::Big, "big", kInline, {C::Body}, {}, {}},
        {C::Blink, "blink", kInline, {C::Body}, {}, {}},
        {C::Blockquote, "blockquote", kBlock, {C::Body}, {}, {C::P}},
        {C::Body, "body", kContainer, {C::Html}, {}, {C::Head}},
        {C::Br, "br", kEmpty, {C::Body}, {}, {}},
        {C::Button, "button", kInlineBlock, {C::Body}, {}, {C::Button}},
        {C::Canvas, "canvas", kContainer, {C::Body}, {}, {}},
        {C::Caption, "caption", kInline, {C::Table}, {}, {}},
        {C::Center, "center", kContainer, {C::Body}, {}, {C::P}},
        {C::Cite, "cite", kInline, {C::Body}, {}, {}},
        {C::Code, "code", kInline, {C::Body}, {}, {}},
        {C::Col, "col", kEmpty, {C::Colgroup}, {}, {}},
        {C::Colgroup, "colgroup", kContainer, {C::Table}, {}, {C::Col, C::Colgroup}},
        {C::Data, "data", kContainer, {C::Body}, {}, {}},
        {C::Datalist, "datalist", kContainer, {C::Body}, {}, {}},
        {C::Dd, "dd", kBlock, {C::Body}, {}, {C::Dt, C::Dd, C::P}},
        {C::Del, "del", kInline, {C::Body}, {}, {}},
        {C::Details, "details", kBlock, {C::Body}, {}, {C::P}},
        {C::Dfn, "dfn", kInline, {C::Body}, {}, {}},
        {C::Dialog, "dialog", kContainer, {C::Body}, {}, {C::P}},
        {C::Dir, "dir", kContainer, {C::Body}, {}, {C::P}},
        {C::Div, "div", kContainer, {C::Body}, {}, {C::P}},
        {C::Dl, "dl", kBlockContainer, {C::Body}, {}, {C::P}},
        {C::Dt, "dt", kBlock, {C::Body}, {}, {C::Dt, C::Dd, C::P}},
        {C::Em, "em", kInline, {C::Body}, {}, {}},
        {C::Embed, "embed", kEmpty, {C::Body}, {}, {}},
        {C::Fieldset, "fieldset", kContainer, {C::Body}, {}, {C::P}},
        {C::Figcaption, "figcaption", kBlock, {C::Body}, {}, {C::P}},
        {C::Figure, "figure", kBlock, {C::Body}, {}, {C::P}},
        {C::Font, "font", kContainer, {C::Body}, {}, {}},
        {C::Footer, "footer", kBlock, {C::Body}, {}, {C::P}},
        {C::Form, "form", kContainer, {C::Body, C::Td, C::Div}, {}, {C::P}},
        {C::Frame, "frame", kEmpty, {C::Frameset}, {}, {}},
        {C::Frameset, "frameset", kContainer, {C::Html}, {}, {C::Head}},
        {C::H1, "h1", kBlock, {C::Body, C::A}, {}, kHeadings},
        {C::H2, "h2", kBlock, {C::Body, C::A}, {}, kHeadings},
        {C::H3, "h3", kBlock, {C::Body, C::A}, {}, kHeadings},
        {C::H4, "h4", kBlock, {C::Body, C::A}, {}, kHeadings},
        {C::H5, "h5", kBlock, {C::Body, C::A}, {}, kHeadings},
        {C::H6, "h6", kBlock, {C::Body, C::A}, {}, kHeadings},
        {C::Head, "head", 0, {C::Html}, {}, {}},
        {C::Header, "header", kBlock, {C::Body}, {}, {C::P}},
        {C::Hgroup, "hgroup", kBlock, {C::Body}, {}, {C::P}},
        {C::Hr, "hr", kEmpty, {C::Body, C::Select}, {}, {C::P}},
        {C::Html, "html", 0, {}, {}, {}},
        {C::I, "i", kInline, {C::Body}, {}, {}},
        {C::Iframe, "iframe", kBlock, {C::Body}, {}, {}},
        {C::Image, "image", kEmpty, {C::Body}, {}, {}},
        {C::Img, "img", kEmpty, {C::Body}, {}, {}},
        {C::Input, "input", kEmpty, {C::Body}, {}, {}},
        {C::Ins, "ins", kInline, {C::Body}, {}, {}},
        {C::Kbd, "kbd", kInline, {C::Body}, {}, {}},
        {C::Keygen, "keygen", kEmpty, {C::Body}, {}, {}},
        {C::Label, "label", kInline, {C::Body}, {}, {}},
        {C::Legend, "legend", kInline, {C::Body}, {}, {}},
        {C::Li, "li", kContainer, {C::Body, C::Ul, C::Ol, C::Menu}, {}, {C::Li, C::P}},
        {C::Link, "link", kEmpty, {C::Head}, {}, {}},
        {C::Listing, "listing", kBlock, {C::Body}, {}, {C::P}},
        {C::Main, "main", kBlock, {C::Body}, {}, {C::P}},
        {C::Map, "map", kInline, {C::Body}, {}, {}},
        {C::Mark, "mark", kContainer, {C::Body}, {}, {}},
        {C::Marquee, "marquee", kContainer, {C::Body}, {}, {}},
        {C::Menu, "menu", kContainer, {C::Body}, {}, {C::P}},
        {C::Meta, "meta", kEmpty, {C::Head}, {}, {C::Style, C::Title}},
        {C::Meter, "meter", kContainer, {C::Body}, {}, {}},
        {C::Nav, "nav", kBlock, {C::Body}, {}, {C::P}},
        {C::Nobr, "nobr", kInline, {C::Body}, {}, {C::Nobr}},
        {C::Noembed, "noembed", kContainer, {C::Body}, {}, {}},
        {C::Noframes, "noframes", kContainer, {}, {}, {}},
        {C::Noscript, "noscript", kContainer, {C::Head, C::Body}, {}, {}},
        {C::Object, "object", kContainer, {C::Body}, {}, {}},
        {C::Ol, "ol", kBlock, {C::Body}, {}, {C::P}},
        {C::Optgroup, "optgroup", kInline, {C::Body}, {}, {C::Option}},
        {C::Option, "option", kInline, {C::Body}, {}, {C::Option}},
        {C::Output, "output", kContainer, {C::Body}, {}, {}},
        {C::P, "p", kContainer, {C::Body}, {}, {C::P}},
        {C::Param, "param", kEmpty, {C::Body}, {}, {}},
        {C::Picture, "picture", kContainer, {C::Body}, {}, {}},
        {C::Plaintext, "plaintext", kSpecial, {C::Body}, {}, {C::P}},
        {C::Pre, "pre", kBlock, {C::Body}, {}, {C::P}},
        {C::Progress, "progress", kContainer, {C::Body}, {}, {}},
        {C::Q, "q", kInline, {C::Body}, {}, {}},
        {C::Rb, "rb", kInline, {C::Body}, {}, {}},
        {C::Rp, "rp", kInline, {C::Body}, {}, {}},
        {C::Rt, "rt", kInline, {C::Body}, {}, {}},
        {C::Rtc, "rtc", kInline, {C::Body}, {}, {}},
        {C::Ruby, "ruby", kContainer, {C::Body}, {}, {}},
        {C::S, "s", kInline, {C::Body}, {}, {}},
        {C::Samp, "samp", kInline, {C::Body}, {}, {}},
        {C::Script, "script", kSpecial, {C::Head, C::Body}, {}, {}},
        {C::Search, "search", kBlock, {C::Body}, {}, {C::P}},
        {C::Section, "section", kBlock, {C::Body}, {}, {C::Select, C::P}},
        {C::Select, "select", kContainer, {C::Body}, {}, {C::Select}},
        {C::Slot, "slot", kContainer, {C::Body}, {}, {}},
        {C::Small, "small", kInline, {C::Body}, {}, {}},
        {C::Source, "source", kEmpty, {C::Body}, {}, {}},
        {C::Spacer, "spacer", kInline, {C::Body}, {}, {}},
        {C::Span, "span", kContainer, {C::Body}, {}, {}},
        {C::Strike, "strike", kInline, {C::Body}, {}, {}},
        {C::Strong, "strong", kInline, {C::Body}, {}, {}},
        {C::Style, "style", kSpecial, {C::Head, C::Body}, {}, {C::Style, C::Title, C::Meta}},
        {C::Sub, "sub", kInline, {C::Body}, {}, {}},
        {C::Summary, "summary", kBlock, {C::Body}, {}, {C::P}},
        {C::Sup, "sup", kInline, {C::Body}, {}, {}},
        {C::Svg, "svg", kContainer, {C::Body}, {}, {}},
        {C::Table, "table", kBlockContainer, {C::Body}, {}, {}},
        {C::Tbody, "tbody", 0, {C::Table}, {},
            {C::Form, C::Thead, C::Tbody, C::Tfoot, C::Td, C::Th, C::Tr, C::Colgroup}},
        {C::Td, "td", kContainer, {C::Tr}, C::Table, {C::Td, C::Th}},
        {C::Template, "template", kContainer, {C::Head, C::Body}, {}, {}},
        {C::Textarea, "textarea", kSpecial, {C::Body}, {}, {}},
        {C::Tfoot, "tfoot", 0, {C::Table}, {}, {C::Thead, C::Tbody, C::Tfoot, C::Td, C::Th, C::Tr}},
        {C::Th, "th", kContainer, {C::Tr}, C::Table, {C::Td, C::Th}},
        {C::Thead, "thead", 0, {C::Table}, {},
            {C::Thead, C::Tbody, C::Tfoot, C::Td, C::Th, C::Tr, C::Colgroup}},
        {C::Time, "time", kContainer, {C::Body}, {}, {}},
        {C::Title, "title", kSpecial, {C::Head, C::Body}, {}, {}},
        {C::Tr, "tr", kBlock, {C::Tbody, C::Thead, C::Tfoot}, C::Table,
            {C::Form, C::Td, C::Th, C::Tr, C::Colgroup, C::Div}},
        {C::Track, "track", kEmpty, {C::Body}, {}, {}},
        {C::Tt, "tt", kInline, {C::Body}, {}, {}},
        {C::U, "u", kInline, {C::Body}, {}, {}},
        {C::Ul, "ul", kContainer, {C::Body}, {}, {C::P}},
        {C::Var, "var", kInline, {C::Body}, {}, {}},
        {C::Video, "video", kContainer, {C::Body}, {}, {}},
        {C::Wbr, "wbr", kEmpty, {C::Body}, {}, {}},
        {C::Xmp, "xmp", kSpecial, {C::Body}, {}, {C::P}},
        {C::Unknown, "", kContainer, {C::Body}, {}, {}},
    };
}

TextMode text_mode_for(C code) {
    switch (code) {
        case C::Script: case C::Style: case C::Xmp:
        case C::Iframe: case C::Noembed: case C::Noframes:
            return TextMode::RawText;
        case C::Title: case C::Textarea:
            return TextMode::RcData;
        case C::Plaintext:
            return TextMode::PlainText;
        default:
            return TextMode::Normal;
    }
}

ContentClass content_class_for(const ElementInfo& info) {
    switch (info.code) {
        case C::Html: case C::Head: case C::Body:
            return ContentClass::Root;
        case C::A: case C::B: case C::Big: case C::Code: case C::Em: case C::Font:
        case C::I: case C::Nobr: case C::S: case C::Small: case C::Strike:
        case C::Strong: case C::Tt: case C::U:
            return ContentClass::Formatting;
        case C::Table: case C::Caption: case C::Colgroup: case C::Thead:
        case C::Tbody: case C::Tfoot: case C::Tr: case C::Td: case C::Th:
            return ContentClass::TableStructure;
        case C::Li: case C::Dd: case C::Dt:
            return ContentClass::ListItem;
        case C::Select: case C::Option: case C::Optgroup:
            return ContentClass::Select;
        default:
            break;
    }
    if (info.is_empty()) return ContentClass::Void;
    if (info.text_mode != TextMode::Normal) return ContentClass::RawText;
    if (info.is_block()) return ContentClass::Block;
    if (info.is_inline()) return ContentClass::Inline;
    return ContentClass::Container;
}

struct ElementRegistry {
    std::vector<ElementInfo> by_code;
    std::unordered_map<std::string_view, C> by_name;
};

const ElementRegistry& registry() {
    static const ElementRegistry r = [] {
        ElementRegistry reg;
        auto defs = element_defs();
        reg.by_code.resize(defs.size());
        for (auto& def : defs) {
            ElementInfo info;
            info.code = def.code;
            info.name = def.name;
            info.flags = def.flags;
            info.parents = std::move(def.parents);
            info.bounds = def.bounds;
            info.closes = std::move(def.closes);
            info.text_mode = text_mode_for(def.code);
            info.content_class = content_class_for(info);
            auto index = static_cast<std::size_t>(def.code);
            if (def.code != C::Unknown) {
                reg.by_name.emplace(info.name, def.code);
            }
            reg.by_code[index] = std::move(info);
        }
        return reg;
    }();
    return r;
}

} // namespace

bool ElementInfo::closes_element(ElementCode other) const {
    return std::find(closes.begin(), closes.end(), other) != closes.end();
}

bool ElementInfo::is_parent(ElementCode other) const {
    return std::find(parents.begin(), parents.end(), other) != parents.end();
}

const ElementInfo& element_info(std::string_view name) {
    const auto& reg = registry();
    auto it = reg.by_name.find(name);
    if (it == reg.by_name.end()) {
        std::string lower(name);
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        it = reg.by_name.find(lower);
        if (it == reg.by_name.end()) {
            return reg.by_code[static_cast<std::size_t>(ElementCode::Unknown)];
        }
    }
    return reg.by_code[static_cast<std::size_t>(it->second)];
}

const ElementInfo& element_info(ElementCode code) {
    return registry().by_code[static_cast<std::size_t>(code)];
}

const char* content_class_name(ContentClass content_class) {
    switch (content_class) {
        case ContentClass::Root:           return "root";
        case ContentClass::Void:           return "void";
        case ContentClass::RawText:        return "raw-text";
        case ContentClass::Formatting:     return "formatting";
        case ContentClass::TableStructure: return "table-structure";
        case ContentClass::ListItem:       return "list-item";
        case ContentClass::Select:         return "select";
        case ContentClass::Block:          return "block";
        case ContentClass::Inline:         return "inline";
        case ContentClass::Container:      return "container";
    }
    return "container";
}

} // namespace mender::html
