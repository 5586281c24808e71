/**
 * @file XmlDocument.cpp
 * @brief libxml2 wrapper implementation
 * @author Actuate Team
 * @date 2025
 */

#include "XmlDocument.h"

#include "InputUtils.h"

#include <libxml/parser.h>
#include <libxml/xmlerror.h>

#include <limits>

namespace actuate::input::utils {
    namespace {
        struct XmlCharDeleter {
            void operator()(xmlChar* text) const noexcept {
                xmlFree(text);
            }
        };

        using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

        std::string_view toView(const xmlChar* text) noexcept {
            return text ? std::string_view(reinterpret_cast<const char*>(text)) : std::string_view{};
        }
    } // namespace

    // ============================================================================
    // XmlElement
    // ============================================================================

    std::string XmlElement::getName() const {
        return std::string(toView(node_->name));
    }

    bool XmlElement::nameIs(const std::string_view name) const {
        return iequals(toView(node_->name), name);
    }

    std::optional<std::string> XmlElement::getAttribute(const std::string_view name) const {
        for (const xmlAttr* attr = node_->properties; attr; attr = attr->next) {
            if (!iequals(toView(attr->name), name)) {
                continue;
            }

            const XmlCharPtr value(xmlNodeListGetString(node_->doc, attr->children, 1));
            return std::string(toView(value.get()));
        }
        return std::nullopt;
    }

    std::vector<XmlElement> XmlElement::getChildren() const {
        std::vector<XmlElement> children;
        for (xmlNode* child = node_->children; child; child = child->next) {
            if (child->type == XML_ELEMENT_NODE) {
                children.emplace_back(child);
            }
        }
        return children;
    }

    std::optional<XmlElement> XmlElement::getFirstChild(const std::string_view name) const {
        for (xmlNode* child = node_->children; child; child = child->next) {
            if (child->type == XML_ELEMENT_NODE && iequals(toView(child->name), name)) {
                return XmlElement(child);
            }
        }
        return std::nullopt;
    }

    long XmlElement::getLine() const noexcept {
        return xmlGetLineNo(node_);
    }

    // ============================================================================
    // XmlDocument
    // ============================================================================

    bool XmlDocument::parse(const std::string_view text) {
        doc_.reset();
        lastError_.clear();

        if (text.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
            lastError_ = "Document too large";
            return false;
        }

        xmlResetLastError();
        constexpr int options = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NOBLANKS;
        doc_.reset(xmlReadMemory(text.data(), static_cast<int>(text.size()), nullptr, nullptr, options));

        if (!doc_) {
            if (const xmlError* error = xmlGetLastError(); error && error->message) {
                std::string message(error->message);
                while (!message.empty() && isSpaceChar(message.back())) {
                    message.pop_back();
                }
                lastError_ = "line " + std::to_string(error->line) + ": " + message;
            }
            else {
                lastError_ = "Malformed XML document";
            }
            return false;
        }

        if (!xmlDocGetRootElement(doc_.get())) {
            doc_.reset();
            lastError_ = "Document has no root element";
            return false;
        }

        return true;
    }

    std::optional<XmlElement> XmlDocument::getRoot() const {
        if (!doc_) {
            return std::nullopt;
        }
        xmlNode* root = xmlDocGetRootElement(doc_.get());
        if (!root) {
            return std::nullopt;
        }
        return XmlElement(root);
    }

    // ============================================================================
    // Escaping
    // ============================================================================

    std::string escapeXml(const std::string_view text) {
        std::string result;
        result.reserve(text.size());
        for (const char c : text) {
            switch (c) {
            case '&': result += "&amp;";
                break;
            case '<': result += "&lt;";
                break;
            case '>': result += "&gt;";
                break;
            case '"': result += "&quot;";
                break;
            case '\'': result += "&apos;";
                break;
            default: result += c;
                break;
            }
        }
        return result;
    }
} // namespace actuate::input::utils
