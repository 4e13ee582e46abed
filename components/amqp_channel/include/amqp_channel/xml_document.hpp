#pragma once

#include "amqp_channel/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <libxml/tree.h>

namespace amqp_channel {

// Read-only view of a parsed XML payload. Copies share the underlying
// libxml2 document.
class XmlDocument {
public:
    XmlDocument() = default;

    // Parses text; never touches the network
    static Result<XmlDocument> parse(const std::string& text);

    bool isNull() const;

    // Root element
    std::string rootName() const;
    std::string text() const;
    std::optional<std::string> attribute(const std::string& name) const;

    // Direct children of the root element
    std::vector<std::string> childNames() const;
    std::optional<std::string> childText(const std::string& name) const;

    // Serialized form of the whole document
    std::string toString() const;

private:
    explicit XmlDocument(xmlDocPtr doc);

    std::shared_ptr<xmlDoc> doc_;

    xmlNodePtr root() const;
};

} // namespace amqp_channel
