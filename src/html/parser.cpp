#include <mender/html/parser.h>
#include <mender/core/error.h>
#include <mender/html/element_table.h>
#include <mender/html/scanner.h>
#include <mender/html/tag_balancer.h>
#include <utility>

namespace mender::html {

namespace {

constexpr const char* kModule = "parser";

Augmentations document_augs(const core::ParserConfig& config) {
    Augmentations augs;
    if (config.augmentations) {
        Location location;
        location.begin_line = 1;
        location.begin_column = 1;
        location.end_line = 1;
        location.end_column = 1;
        augs.location = location;
    }
    return augs;
}

} // namespace

Parser::Parser(core::Configuration configuration)
    : configuration_(std::move(configuration)) {}

void Parser::parse(std::string_view input, EventHandler& handler) {
    diagnostics_.set_correlation_id(core::next_correlation_id());
    Scanner scanner(input, configuration_.config(), &diagnostics_);
    run(scanner, handler);
}

void Parser::parse(std::istream& in, EventHandler& handler) {
    diagnostics_.set_correlation_id(core::next_correlation_id());
    Scanner scanner(in, configuration_.config(), &diagnostics_);
    run(scanner, handler);
}

void Parser::run(Scanner& scanner, EventHandler& handler) {
    const core::ParserConfig& config = configuration_.config();
    last_encoding_ = scanner.encoding();
    if (config.report_errors) {
        diagnostics_.emit(core::Severity::Info, kModule, "start",
                          std::string("parsing as ") + scanner.encoding_name() +
                          (config.balance_tags ? ", balancing tags" : ", raw events"));
    }

    const Augmentations augs = document_augs(config);
    if (config.balance_tags) {
        TagBalancer balancer(handler, config, &diagnostics_);
        balancer.start_document(scanner.encoding_name(), augs);
        try {
            while (!balancer.finished()) {
                balancer.process(scanner.next_token());
            }
        } catch (const core::IoError& error) {
            diagnostics_.emit(core::Severity::Error, kModule, "read", error.what());
            balancer.end_document(augs.synthesized_copy());
            throw;
        }
    } else {
        handler.start_document(scanner.encoding_name(), augs);
        while (true) {
            Token token = scanner.next_token();
            forward_token(token, handler, config);
            if (token.type == Token::EndOfFile) break;
        }
    }

    if (config.report_errors) {
        diagnostics_.emit(core::Severity::Info, kModule, "finish", "parse complete");
    }
}

void forward_token(const Token& token, EventHandler& handler, const core::ParserConfig& config) {
    switch (token.type) {
        case Token::StartTag: {
            handler.start_element(token.name, token.attributes, token.augs);
            const ElementInfo& info = element_info(token.name);
            if (info.is_empty()) {
                if (config.void_end_events) {
                    handler.end_element(token.name, token.augs);
                }
            } else if (token.self_closing &&
                       (config.allow_selfclosing_tags || info.code == ElementCode::Unknown ||
                        (info.code == ElementCode::Iframe && config.allow_selfclosing_iframe))) {
                handler.end_element(token.name, token.augs);
            }
            break;
        }
        case Token::EndTag:
            handler.end_element(token.name, token.augs);
            break;
        case Token::Text:
            handler.characters(token.data, token.augs);
            break;
        case Token::Comment:
            handler.comment(token.data, token.augs);
            break;
        case Token::CData:
            handler.start_cdata(token.augs);
            handler.characters(token.data, token.augs);
            handler.end_cdata(token.augs);
            break;
        case Token::ProcessingInstruction:
            handler.processing_instruction(token.name, token.data, token.augs);
            break;
        case Token::Doctype:
            handler.doctype(token.name, token.public_id, token.system_id, token.augs);
            break;
        case Token::XmlDecl:
            handler.xml_decl(token.version, token.encoding, token.standalone, token.augs);
            break;
        case Token::EndOfFile:
            handler.end_document(token.augs);
            break;
    }
}

} // namespace mender::html
