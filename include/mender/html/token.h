#pragma once
#include <mender/html/augmentations.h>
#include <string>
#include <string_view>
#include <vector>

namespace mender::html {

struct Attribute {
    std::string name;
    std::string value;
    bool specified = true;  // false when the attribute had no value
};

const Attribute* find_attribute(const std::vector<Attribute>& attributes, std::string_view name);

struct Token {
    enum Type {
        Doctype,
        StartTag,
        EndTag,
        Text,
        Comment,
        CData,
        ProcessingInstruction,
        XmlDecl,
        EndOfFile,
    };
    Type type = EndOfFile;
    std::string name;       // tag name, doctype root, PI target
    std::vector<Attribute> attributes;
    bool self_closing = false;
    std::string data;       // text, comment, CDATA body, PI data

    // Doctype
    std::string public_id;
    std::string system_id;

    // XML declaration
    std::string version;
    std::string encoding;
    std::string standalone;

    Augmentations augs;
};

const char* token_type_name(Token::Type type);

} // namespace mender::html
