#pragma once
#include <mender/html/augmentations.h>
#include <mender/html/token.h>
#include <string>
#include <vector>

namespace mender::html {

// Receiver of the structural event stream. When tag balancing is on the
// stream is well nested: every start_element is matched by exactly one
// end_element and end_document comes last.
class EventHandler {
public:
    virtual ~EventHandler() = default;

    virtual void start_document(const std::string& encoding, const Augmentations& augs) = 0;
    virtual void xml_decl(const std::string& version, const std::string& encoding,
                          const std::string& standalone, const Augmentations& augs) = 0;
    virtual void doctype(const std::string& name, const std::string& public_id,
                         const std::string& system_id, const Augmentations& augs) = 0;
    virtual void start_element(const std::string& name, const std::vector<Attribute>& attributes,
                               const Augmentations& augs) = 0;
    virtual void end_element(const std::string& name, const Augmentations& augs) = 0;
    virtual void characters(const std::string& text, const Augmentations& augs) = 0;
    virtual void comment(const std::string& text, const Augmentations& augs) = 0;
    virtual void start_cdata(const Augmentations& augs) = 0;
    virtual void end_cdata(const Augmentations& augs) = 0;
    virtual void processing_instruction(const std::string& target, const std::string& data,
                                        const Augmentations& augs) = 0;
    virtual void end_document(const Augmentations& augs) = 0;
};

} // namespace mender::html
