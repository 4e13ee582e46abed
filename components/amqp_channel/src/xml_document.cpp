#include "amqp_channel/xml_document.hpp"
#include <mutex>
#include <libxml/parser.h>
#include <libxml/xmlerror.h>
#include <spdlog/spdlog.h>

namespace amqp_channel {

namespace {

std::once_flag parserInitFlag;

std::string toStdString(const xmlChar* value) {
    return value ? std::string(reinterpret_cast<const char*>(value)) : std::string();
}

// Takes ownership of a string allocated by libxml2
std::string takeXmlString(xmlChar* value) {
    std::string result = toStdString(value);
    if (value) {
        xmlFree(value);
    }
    return result;
}

bool nameEquals(xmlNodePtr node, const std::string& name) {
    return node->name && name == reinterpret_cast<const char*>(node->name);
}

} // namespace

XmlDocument::XmlDocument(xmlDocPtr doc) : doc_(doc, xmlFreeDoc) {}

Result<XmlDocument> XmlDocument::parse(const std::string& text) {
    std::call_once(parserInitFlag, [] { xmlInitParser(); });

    if (text.empty()) {
        return Result<XmlDocument>(ErrorType::DecodeFailed, "Payload is empty, not an XML document");
    }

    xmlResetLastError();
    xmlDocPtr doc = xmlReadMemory(text.data(), static_cast<int>(text.size()), "message.xml", "UTF-8",
                                  XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
    if (!doc) {
        std::string reason = "malformed document";
        const xmlError* error = xmlGetLastError();
        if (error && error->message) {
            reason = error->message;
            while (!reason.empty() && (reason.back() == '\n' || reason.back() == ' ')) {
                reason.pop_back();
            }
        }
        spdlog::debug("XML decode failed: {}", reason);
        return Result<XmlDocument>(ErrorType::DecodeFailed, "Payload is not valid XML: " + reason);
    }

    XmlDocument document(doc);
    if (!document.root()) {
        return Result<XmlDocument>(ErrorType::DecodeFailed, "XML document has no root element");
    }
    return Result<XmlDocument>(std::move(document));
}

bool XmlDocument::isNull() const {
    return !doc_;
}

xmlNodePtr XmlDocument::root() const {
    return doc_ ? xmlDocGetRootElement(doc_.get()) : nullptr;
}

std::string XmlDocument::rootName() const {
    xmlNodePtr node = root();
    return node ? toStdString(node->name) : std::string();
}

std::string XmlDocument::text() const {
    xmlNodePtr node = root();
    return node ? takeXmlString(xmlNodeGetContent(node)) : std::string();
}

std::optional<std::string> XmlDocument::attribute(const std::string& name) const {
    xmlNodePtr node = root();
    if (!node) {
        return std::nullopt;
    }

    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name.c_str()));
    if (!value) {
        return std::nullopt;
    }
    return takeXmlString(value);
}

std::vector<std::string> XmlDocument::childNames() const {
    std::vector<std::string> names;
    xmlNodePtr node = root();
    if (!node) {
        return names;
    }

    for (xmlNodePtr child = node->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            names.push_back(toStdString(child->name));
        }
    }
    return names;
}

std::optional<std::string> XmlDocument::childText(const std::string& name) const {
    xmlNodePtr node = root();
    if (!node) {
        return std::nullopt;
    }

    for (xmlNodePtr child = node->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE && nameEquals(child, name)) {
            return takeXmlString(xmlNodeGetContent(child));
        }
    }
    return std::nullopt;
}

std::string XmlDocument::toString() const {
    if (!doc_) {
        return {};
    }

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpMemory(doc_.get(), &buffer, &size);
    if (!buffer) {
        return {};
    }

    std::string result(reinterpret_cast<const char*>(buffer), static_cast<size_t>(size));
    xmlFree(buffer);
    return result;
}

} // namespace amqp_channel
