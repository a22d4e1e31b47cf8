#include <mender/html/tag_balancer.h>
#include <mender/core/error.h>
#include <algorithm>
#include <cctype>
#include <utility>

namespace mender::html {

namespace {

constexpr const char* kModule = "balancer";

using C = ElementCode;

bool is_whitespace(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
    });
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool is_cell_or_caption(C code) {
    return code == C::Td || code == C::Th || code == C::Caption;
}

} // namespace

TagBalancer::TagBalancer(EventHandler& handler, const core::ParserConfig& config,
                         core::DiagnosticEmitter* diagnostics)
    : handler_(handler),
      config_(config),
      diagnostics_(diagnostics),
      ignore_outside_content_(config.ignore_outside_content) {}

void TagBalancer::start_document(const std::string& encoding, const Augmentations& augs) {
    // The fragment context is open already; it produces no events and
    // is never closed.
    for (const auto& name : config_.fragment_context) {
        OpenElement element;
        element.name = core::apply_name_case(name, config_.element_names);
        element.info = &element_info(name);
        element.augs = augs.synthesized_copy();
        push(std::move(element));
    }
    context_size_ = stack_.size();
    handler_.start_document(encoding, augs);
}

void TagBalancer::process(const Token& token) {
    if (finished_) {
        return;
    }
    switch (token.type) {
        case Token::StartTag:
            if (token.self_closing) {
                empty_element(token.name, token.attributes, token.augs);
            } else {
                start_element(token.name, token.attributes, token.augs, false);
            }
            break;
        case Token::EndTag:
            end_element(token.name, token.augs, false);
            break;
        case Token::Text:
            characters(token.data, token.augs);
            break;
        case Token::Comment:
            comment(token.data, token.augs);
            break;
        case Token::CData:
            cdata(token.data, token.augs);
            break;
        case Token::ProcessingInstruction:
            processing_instruction(token.name, token.data, token.augs);
            break;
        case Token::Doctype:
            doctype(token);
            break;
        case Token::XmlDecl:
            xml_decl(token);
            break;
        case Token::EndOfFile:
            end_document(token.augs);
            break;
    }
}

// ---------------------------------------------------------------------------
// Start tags
// ---------------------------------------------------------------------------

void TagBalancer::start_element(const std::string& name, const std::vector<Attribute>& attributes,
                                 const Augmentations& augs, bool forced) {
    seen_anything_ = true;

    if (seen_root_end_) {
        discard_start(name, augs, "after </html>");
        return;
    }

    const ElementInfo& info = element_info(name);
    const C code = info.code;

    if (code == C::Template) {
        template_fragment_ = true;
    }

    // Tables and selects are never implied.
    if (forced && (code == C::Table || code == C::Select)) {
        return;
    }

    if (seen_root_ && code == C::Html && !opened_svg_) {
        discard_start(name, augs, "duplicate <html>");
        return;
    }
    if (seen_frameset_ && code != C::Frame && code != C::Frameset && code != C::Noframes) {
        discard_start(name, augs, "content inside <frameset>");
        return;
    }

    if (!template_fragment_ && opened_select_) {
        if (code == C::Select) {
            end_element(element_name(C::Select), augs.synthesized_copy(), false);
            discard_start(name, augs, "nested <select>");
            return;
        }
        if (info.content_class != ContentClass::Select && code != C::Script && code != C::Hr) {
            discard_start(name, augs, "not allowed inside <select>");
            return;
        }
    }

    if (code == C::Head) {
        if (seen_head_) {
            discard_start(name, augs, "duplicate <head>");
            return;
        }
        seen_head_ = true;
    } else if (!opened_svg_ && code == C::Frameset) {
        if (seen_body_ && seen_characters_) {
            discard_start(name, augs, "<frameset> after body content");
            return;
        }
        if (!seen_head_) {
            close_head(augs);
        }
        consume_buffered_ends();
        consume_early_text();
        if (seen_body_) {
            discard_start(name, augs, "<frameset> after <body>");
            return;
        }
        seen_frameset_ = true;
    } else if (code == C::Body) {
        if (!seen_head_) {
            close_head(augs);
        }
        consume_buffered_ends();
        if (seen_body_) {
            discard_start(name, augs, "duplicate <body>");
            return;
        }
        seen_body_ = true;
    } else if (code == C::Form) {
        if (opened_form_) {
            discard_start(name, augs, "nested <form>");
            return;
        }
        opened_form_ = true;
        // A form directly inside table structure cannot hold content.
        if (inside_table_structure()) {
            warn("start-tag", "<" + name + "> inside table structure closed immediately", augs);
            emit_start(name, attributes, augs);
            emit_end(name, augs.synthesized_copy());
            opened_form_ = false;
            return;
        }
    } else if (seen_head_ && !seen_frameset_ && !opened_svg_ && code == C::Frame) {
        discard_start(name, augs, "<frame> outside <frameset>");
        return;
    } else if (code == C::Unknown) {
        consume_buffered_ends();
    } else if (code == C::Table && inside_table_structure()) {
        warn("start-tag", "<" + name + "> inside a table closes the open table", augs);
        end_element(element_name(C::Table), augs.synthesized_copy(), false);
    }

    // Natural parent.
    if (!info.parents.empty() && !opened_svg_) {
        const C preferred = info.parents.front();
        const bool in_template = template_fragment_ && !stack_.empty() &&
                                 stack_.back().info->code == C::Template;
        if (config_.document_fragment && (preferred == C::Head || preferred == C::Body)) {
            // A fragment never grows a head or body.
        } else if (in_template) {
            // Direct template children are taken as they are.
        } else if (!seen_root_ && !config_.document_fragment) {
            warn("start-tag", "<" + name + "> implies <" + element_name(preferred) + ">", augs);
            if (!force_start_element(preferred, augs)) {
                if (!forced) {
                    discard_start(name, augs, "parent could not be implied");
                }
                return;
            }
        } else if (preferred != C::Head || (!seen_body_ && !config_.document_fragment)) {
            if (parent_depth(info) == -1) {
                warn("start-tag", "<" + name + "> implies <" + element_name(preferred) + ">", augs);
                if (!force_start_element(preferred, augs)) {
                    if (!forced) {
                        discard_start(name, augs, "parent could not be implied");
                    }
                    return;
                }
            }
        }
    }

    if (code == C::Svg) {
        opened_svg_ = true;
    } else if (!template_fragment_ && code == C::Select) {
        opened_select_ = true;
    }

    // Elements without flags close the inline run above them and
    // re-open it afterwards.
    std::vector<OpenElement> reopen;
    if (info.flags == 0) {
        while (stack_.size() > context_size_ && stack_.back().info->is_inline()) {
            OpenElement top = stack_.back();
            const std::size_t before = stack_.size();
            end_element(top.name, top.augs.synthesized_copy(), false);
            if (stack_.size() >= before) {
                break;
            }
            reopen.push_back(std::move(top));
        }
    }

    // Script takes no children; neither does anything directly in head.
    if (stack_.size() > context_size_ &&
        ((stack_.size() > 1 && stack_.back().info->code == C::Script) ||
         (stack_.size() > 2 && stack_[stack_.size() - 2].info->code == C::Head))) {
        OpenElement top = pop();
        emit_end(top.name, top.augs.synthesized_copy());
    }

    if (code == C::Table) {
        while (stack_.size() > context_size_ &&
               stack_.back().info->content_class == ContentClass::Formatting) {
            OpenElement top = pop();
            warn("start-tag", "<" + name + "> closes <" + top.name + ">", augs);
            emit_end(top.name, top.augs.synthesized_copy());
        }
    }

    if (!info.closes.empty()) {
        for (std::size_t i = stack_.size(); i-- > context_size_;) {
            const ElementInfo* open = stack_[i].info;
            if (opened_svg_ && open->code == C::Title) {
                break;
            }
            if (info.closes_element(open->code)) {
                warn("start-tag", "<" + name + "> closes <" + stack_[i].name + ">", augs);
                while (stack_.size() > i) {
                    OpenElement closed = pop();
                    emit_end(closed.name, closed.augs.synthesized_copy());
                }
                continue;
            }
            if (open->code == C::Template || open->is_block() || info.is_parent(open->code)) {
                break;
            }
        }
    }

    seen_root_ = true;
    if (info.is_empty()) {
        emit_start(name, attributes, augs);
        if (config_.void_end_events) {
            emit_end(name, augs);
        }
    } else {
        if (stack_.size() >= config_.max_depth) {
            overflow(augs);
        }
        OpenElement element;
        element.name = name;
        element.info = &info;
        if (info.is_inline()) {
            element.attributes = attributes;
        }
        element.augs = augs;
        push(std::move(element));
        emit_start(name, attributes, augs);
    }

    for (auto it = reopen.rbegin(); it != reopen.rend(); ++it) {
        force_start_element(*it, augs);
    }

    if (code == C::Body) {
        refeed_lost_text();
    }
}

void TagBalancer::empty_element(const std::string& name, const std::vector<Attribute>& attributes,
                                const Augmentations& augs) {
    start_element(name, attributes, augs, false);
    // "/>" is honoured for unknown elements only, unless configured.
    const ElementInfo& info = element_info(name);
    if (!info.is_empty() &&
        (config_.allow_selfclosing_tags || info.code == C::Unknown ||
         (info.code == C::Iframe && config_.allow_selfclosing_iframe))) {
        end_element(name, augs, false);
    }
}

bool TagBalancer::force_start_element(ElementCode code, const Augmentations& cause,
                                      const std::vector<Attribute>& attributes) {
    const std::string name = element_name(code);
    start_element(name, attributes, cause.synthesized_copy(), true);
    return !stack_.empty() && stack_.back().info->code == code;
}

bool TagBalancer::force_start_element(const OpenElement& element, const Augmentations& cause) {
    warn("start-tag", "re-opening <" + element.name + ">", cause);
    start_element(element.name, element.attributes, cause.synthesized_copy(), true);
    return !stack_.empty() && iequals(stack_.back().name, element.name);
}

void TagBalancer::force_start_body(const Augmentations& cause) {
    warn("start-tag", "implied <" + element_name(C::Body) + ">", cause);
    force_start_element(C::Body, cause);
}

void TagBalancer::close_head(const Augmentations& cause) {
    force_start_element(C::Head, cause);
    end_element(element_name(C::Head), cause.synthesized_copy(), true);
}

// ---------------------------------------------------------------------------
// End tags
// ---------------------------------------------------------------------------

void TagBalancer::end_element(const std::string& name, const Augmentations& augs, bool forced) {
    if (seen_root_end_) {
        discard_end(name, augs, "after </html>");
        return;
    }

    const ElementInfo& info = element_info(name);
    const C code = info.code;

    if (!template_fragment_ && opened_select_) {
        if (code == C::Select) {
            opened_select_ = false;
        } else if (info.content_class != ContentClass::Select && code != C::Script) {
            discard_end(name, augs, "not allowed inside <select>");
            return;
        }
    }

    if (code == C::Template) {
        template_fragment_ = false;
    }

    // </body> and </html> wait for the end of the document so that
    // content after them still lands inside.
    if (!ignore_outside_content_ && (code == C::Body || code == C::Html)) {
        auto it = std::find_if(discarded_starts_.begin(), discarded_starts_.end(),
                               [&](const std::string& discarded) { return discarded == name; });
        if (it != discarded_starts_.end()) {
            discarded_starts_.erase(it);
            return;
        }
        buffered_ends_.push_back({name, augs});
        return;
    }

    if (seen_frameset_ && code != C::Frame && code != C::Frameset) {
        discard_end(name, augs, "content inside <frameset>");
        return;
    }

    if (code == C::Html) {
        seen_root_end_ = true;
    } else if (ignore_outside_content_ && code == C::Body) {
        seen_body_end_ = true;
    } else if (ignore_outside_content_ && seen_body_end_) {
        discard_end(name, augs, "after </body>");
        return;
    } else if (code == C::Form) {
        opened_form_ = false;
    } else if (code == C::Svg) {
        opened_svg_ = false;
    } else if (code == C::Head && !forced) {
        // Held until body content starts.
        buffered_ends_.push_back({name, augs});
        return;
    }

    const int depth = element_depth(name, info);
    if (depth == -1) {
        if (!info.is_empty()) {
            discard_end(name, augs, "no matching open element");
        }
        return;
    }

    std::vector<OpenElement> reopen;
    if (depth > 1 && info.is_inline()) {
        for (int i = 0; i < depth - 1; ++i) {
            const OpenElement& open = stack_[stack_.size() - 1 - static_cast<std::size_t>(i)];
            if (open.info->is_inline() || open.info->code == C::Font) {
                reopen.push_back(open);
            }
        }
    }

    for (int i = 0; i < depth; ++i) {
        OpenElement closed = pop();
        const bool implied = i < depth - 1;
        if (implied) {
            warn("end-tag", "</" + name + "> closes unclosed <" + closed.name + ">", augs);
        }
        add_body_if_needed(closed.info->code, augs);
        emit_end(closed.name, implied ? closed.augs.synthesized_copy() : augs);
    }

    for (auto it = reopen.rbegin(); it != reopen.rend(); ++it) {
        force_start_element(*it, augs);
    }
}

int TagBalancer::element_depth(const std::string& name, const ElementInfo& info) const {
    const bool container = info.is_container();
    const bool closes_table = info.code == C::Table || info.code == C::Body || info.code == C::Html;
    const int size = static_cast<int>(stack_.size());
    const int bottom = static_cast<int>(context_size_);
    for (int i = size - 1; i >= bottom; --i) {
        const OpenElement& open = stack_[static_cast<std::size_t>(i)];
        if (open.info->code == info.code &&
            (info.code != C::Unknown || iequals(open.name, name))) {
            return size - i;
        }
        if (!container && open.info->is_block()) {
            break;
        }
        if (open.info->code == C::Table && !closes_table) {
            return -1;
        }
        if (info.is_parent(open.info->code)) {
            break;
        }
    }
    return -1;
}

int TagBalancer::parent_depth(const ElementInfo& info) const {
    const int size = static_cast<int>(stack_.size());
    for (int i = size - 1; i >= 0; --i) {
        const C open = stack_[static_cast<std::size_t>(i)].info->code;
        if (info.bounds && open == *info.bounds) {
            break;
        }
        if (info.is_parent(open)) {
            return size - i;
        }
    }
    return -1;
}

bool TagBalancer::inside_table_structure() const {
    for (std::size_t i = stack_.size(); i-- > 0;) {
        const ElementInfo* open = stack_[i].info;
        if (open->content_class != ContentClass::TableStructure || open->code == C::Colgroup) {
            continue;
        }
        return !is_cell_or_caption(open->code);
    }
    return false;
}

// ---------------------------------------------------------------------------
// Character data and other events
// ---------------------------------------------------------------------------

void TagBalancer::characters(const std::string& text, const Augmentations& augs) {
    if (seen_root_end_ || seen_body_end_) {
        return;
    }

    const bool whitespace = is_whitespace(text);
    if (stack_.empty() && !config_.document_fragment) {
        // Text before the first element is replayed once body opens.
        if (!lost_text_.empty() || !whitespace) {
            lost_text_.push_back({text, augs});
        }
        return;
    }

    if (!config_.document_fragment) {
        if (!seen_root_) {
            force_start_body(augs);
        }
        if (whitespace) {
            if (config_.trim_outer_whitespace &&
                (stack_.size() < 2 || buffered_ends_.size() == 1)) {
                return;
            }
        } else {
            const C top = stack_.back().info->code;
            if (top == C::Head || top == C::Html) {
                warn("characters", "text in <" + stack_.back().name + "> implies <" +
                     element_name(C::Body) + ">", augs);
                force_start_body(augs);
            }
        }
    }

    seen_characters_ = seen_characters_ || !whitespace;
    handler_.characters(text, augs);
}

void TagBalancer::comment(const std::string& text, const Augmentations& augs) {
    seen_anything_ = true;
    consume_early_text();
    handler_.comment(text, augs);
}

void TagBalancer::cdata(const std::string& text, const Augmentations& augs) {
    seen_anything_ = true;
    consume_early_text();
    if (seen_root_end_) {
        return;
    }
    handler_.start_cdata(augs);
    handler_.characters(text, augs);
    handler_.end_cdata(augs);
}

void TagBalancer::processing_instruction(const std::string& target, const std::string& data,
                                         const Augmentations& augs) {
    seen_anything_ = true;
    consume_early_text();
    handler_.processing_instruction(target, data, augs);
}

void TagBalancer::doctype(const Token& token) {
    seen_anything_ = true;
    if (seen_root_) {
        warn("doctype", "doctype after the root element ignored", token.augs);
        return;
    }
    if (seen_doctype_) {
        warn("doctype", "second doctype ignored", token.augs);
        return;
    }
    seen_doctype_ = true;
    handler_.doctype(token.name, token.public_id, token.system_id, token.augs);
}

void TagBalancer::xml_decl(const Token& token) {
    if (seen_anything_) {
        warn("xml-decl", "XML declaration after content ignored", token.augs);
        return;
    }
    handler_.xml_decl(token.version, token.encoding, token.standalone, token.augs);
}

void TagBalancer::end_document(const Augmentations& augs) {
    if (finished_) {
        return;
    }

    // Buffered </body> and </html> are applied now.
    ignore_outside_content_ = true;
    consume_buffered_ends();

    if (!seen_root_ && !config_.document_fragment) {
        warn("document", "document has no elements", augs);
        seen_root_end_ = false;
        force_start_body(augs);
    }

    while (stack_.size() > context_size_) {
        OpenElement closed = pop();
        warn("document", "<" + closed.name + "> not closed before end of document", augs);
        add_body_if_needed(closed.info->code, augs);
        emit_end(closed.name, closed.augs.synthesized_copy());
    }

    finished_ = true;
    handler_.end_document(augs);
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void TagBalancer::consume_buffered_ends() {
    if (buffered_ends_.empty()) {
        return;
    }
    std::vector<PendingEnd> pending;
    pending.swap(buffered_ends_);
    for (const auto& end : pending) {
        end_element(end.name, end.augs, true);
    }
}

void TagBalancer::consume_early_text() {
    if (lost_text_.empty()) {
        return;
    }
    if (!seen_body_) {
        force_start_body(lost_text_.front().augs);
    }
    refeed_lost_text();
}

void TagBalancer::refeed_lost_text() {
    std::vector<PendingText> pending;
    pending.swap(lost_text_);
    for (const auto& text : pending) {
        characters(text.text, text.augs);
    }
}

void TagBalancer::add_body_if_needed(ElementCode code, const Augmentations& cause) {
    if (config_.document_fragment || seen_frameset_ || code != C::Html) {
        return;
    }
    const Augmentations implied = cause.synthesized_copy();
    if (!seen_head_) {
        const std::string head = element_name(C::Head);
        emit_start(head, {}, implied);
        emit_end(head, implied);
    }
    if (!seen_body_) {
        const std::string body = element_name(C::Body);
        emit_start(body, {}, implied);
        emit_end(body, implied);
    }
}

void TagBalancer::discard_start(const std::string& name, const Augmentations& augs,
                                const char* reason) {
    warn("start-tag", "<" + name + "> discarded: " + reason, augs);
    // Only a discarded body or html can swallow a later end tag.
    const C code = element_info(name).code;
    if (code == C::Body || code == C::Html) {
        discarded_starts_.push_back(name);
    }
}

void TagBalancer::discard_end(const std::string& name, const Augmentations& augs,
                              const char* reason) {
    warn("end-tag", "</" + name + "> discarded: " + reason, augs);
}

void TagBalancer::push(OpenElement element) {
    stack_.push_back(std::move(element));
}

OpenElement TagBalancer::pop() {
    OpenElement top = std::move(stack_.back());
    stack_.pop_back();
    return top;
}

void TagBalancer::emit_start(const std::string& name, const std::vector<Attribute>& attributes,
                             const Augmentations& augs) {
    handler_.start_element(name, attributes, augs);
}

void TagBalancer::emit_end(const std::string& name, const Augmentations& augs) {
    handler_.end_element(name, augs);
}

void TagBalancer::overflow(const Augmentations& augs) {
    const std::size_t limit = config_.max_depth;
    if (diagnostics_ && config_.report_errors) {
        int line = augs.location ? augs.location->begin_line : 0;
        int column = augs.location ? augs.location->begin_column : 0;
        diagnostics_->emit(core::Severity::Error, kModule, "depth",
                           "element nesting exceeds max-depth " + std::to_string(limit),
                           line, column);
    }
    while (stack_.size() > context_size_) {
        OpenElement closed = pop();
        add_body_if_needed(closed.info->code, augs);
        emit_end(closed.name, closed.augs.synthesized_copy());
    }
    finished_ = true;
    handler_.end_document(augs.synthesized_copy());
    throw core::LimitError("element nesting exceeds max-depth " + std::to_string(limit), limit);
}

std::string TagBalancer::element_name(ElementCode code) const {
    return core::apply_name_case(element_info(code).name, config_.element_names);
}

void TagBalancer::warn(const char* stage, const std::string& message, const Augmentations& augs) {
    if (!config_.report_errors || !diagnostics_) {
        return;
    }
    int line = augs.location ? augs.location->begin_line : 0;
    int column = augs.location ? augs.location->begin_column : 0;
    diagnostics_->warn(kModule, stage, message, line, column);
}

} // namespace mender::html
