#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace mender::html {

enum class ElementCode : std::uint16_t {
    A, Abbr, Acronym, Address, Applet, Area, Article, Aside, Audio,
    B, Base, Basefont, Bdi, Bdo, Bgsound, Big, Blink, Blockquote, Body, Br, Button,
    Canvas, Caption, Center, Cite, Code, Col, Colgroup,
    Data, Datalist, Dd, Del, Details, Dfn, Dialog, Dir, Div, Dl, Dt,
    Em, Embed,
    Fieldset, Figcaption, Figure, Font, Footer, Form, Frame, Frameset,
    H1, H2, H3, H4, H5, H6, Head, Header, Hgroup, Hr, Html,
    I, Iframe, Image, Img, Input, Ins,
    Kbd, Keygen,
    Label, Legend, Li, Link, Listing,
    Main, Map, Mark, Marquee, Menu, Meta, Meter,
    Nav, Nobr, Noembed, Noframes, Noscript,
    Object, Ol, Optgroup, Option, Output,
    P, Param, Picture, Plaintext, Pre, Progress,
    Q,
    Rb, Rp, Rt, Rtc, Ruby,
    S, Samp, Script, Search, Section, Select, Slot, Small, Source, Spacer, Span,
    Strike, Strong, Style, Sub, Summary, Sup, Svg,
    Table, Tbody, Td, Template, Textarea, Tfoot, Th, Thead, Time, Title, Tr, Track, Tt,
    U, Ul,
    Var, Video,
    Wbr,
    Xmp,
    Unknown,
};

// Informational flags of an element.
enum ElementFlag : std::uint8_t {
    kInline = 0x01,
    kBlock = 0x02,
    kEmpty = 0x04,
    kContainer = 0x08,
    kSpecial = 0x10,  // body is not parsed as markup
};

// Closed set of content-model classes the balancer switches on.
enum class ContentClass {
    Root,            // html, head, body
    Void,            // never pushed, no content
    RawText,         // body scanned as text
    Formatting,      // b, i, a... survive block boundaries
    TableStructure,  // table, tr, td...
    ListItem,        // li, dd, dt
    Select,          // select, option, optgroup
    Block,
    Inline,
    Container,
};

// How the scanner reads the body of an element.
enum class TextMode {
    Normal,
    RawText,    // no entity decoding
    RcData,     // entities decoded
    PlainText,  // everything up to end of input
};

struct ElementInfo {
    ElementCode code = ElementCode::Unknown;
    std::string_view name;  // lower case
    std::uint8_t flags = 0;
    std::vector<ElementCode> parents;      // first entry is the preferred parent
    std::optional<ElementCode> bounds;     // parent search stops here
    std::vector<ElementCode> closes;       // open elements this one closes
    ContentClass content_class = ContentClass::Container;
    TextMode text_mode = TextMode::Normal;

    bool is_inline() const { return (flags & kInline) != 0; }
    bool is_block() const { return (flags & kBlock) != 0; }
    bool is_empty() const { return (flags & kEmpty) != 0; }
    bool is_container() const { return (flags & kContainer) != 0; }
    bool is_special() const { return (flags & kSpecial) != 0; }

    bool closes_element(ElementCode other) const;
    bool is_parent(ElementCode other) const;
};

// Case-insensitive lookup. Names not in the table share one entry with
// code Unknown: a container whose natural parent is body.
const ElementInfo& element_info(std::string_view name);
const ElementInfo& element_info(ElementCode code);

const char* content_class_name(ContentClass content_class);

} // namespace mender::html
