#pragma once
#include <mender/core/config.h>
#include <mender/core/diagnostics.h>
#include <mender/html/encoding.h>
#include <mender/html/event_handler.h>
#include <mender/html/token.h>
#include <istream>
#include <string_view>

namespace mender::html {

class Scanner;

// Entry point: scans a document and feeds the handler, through the tag
// balancer unless the balance-tags feature is off. A Parser may be reused;
// diagnostics accumulate across parses, each parse tagged with its own
// correlation id.
class Parser {
public:
    Parser() = default;
    explicit Parser(core::Configuration configuration);

    void set_feature(std::string_view name, bool state) { configuration_.set_feature(name, state); }
    void set_property(std::string_view name, std::string_view value) {
        configuration_.set_property(name, value);
    }

    core::Configuration& configuration() { return configuration_; }
    const core::Configuration& configuration() const { return configuration_; }
    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }

    // Throws core::IoError when the stream fails and core::LimitError when
    // nesting exceeds max-depth. With balance-tags on, the handler has seen
    // a closed, balanced stream by then.
    void parse(std::string_view input, EventHandler& handler);
    void parse(std::istream& in, EventHandler& handler);

    // Encoding chosen by the most recent parse.
    const EncodingDecision& last_encoding() const { return last_encoding_; }

private:
    void run(Scanner& scanner, EventHandler& handler);

    core::Configuration configuration_;
    core::DiagnosticEmitter diagnostics_;
    EncodingDecision last_encoding_;
};

// Hands one token to the handler as raw events, without balancing.
void forward_token(const Token& token, EventHandler& handler, const core::ParserConfig& config);

} // namespace mender::html
