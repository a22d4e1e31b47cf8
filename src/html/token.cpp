#include <mender/html/token.h>

namespace mender::html {

const Attribute* find_attribute(const std::vector<Attribute>& attributes, std::string_view name) {
    for (const auto& attr : attributes) {
        if (attr.name == name) return &attr;
    }
    return nullptr;
}

const char* token_type_name(Token::Type type) {
    switch (type) {
        case Token::Doctype:               return "doctype";
        case Token::StartTag:              return "start-tag";
        case Token::EndTag:                return "end-tag";
        case Token::Text:                  return "text";
        case Token::Comment:               return "comment";
        case Token::CData:                 return "cdata";
        case Token::ProcessingInstruction: return "processing-instruction";
        case Token::XmlDecl:               return "xml-decl";
        case Token::EndOfFile:             return "end-of-file";
    }
    return "unknown";
}

} // namespace mender::html
