/**
 * @file XmlDocument.h
 * @brief RAII wrapper over libxml2 for reading bindings documents
 * @author Actuate Team
 * @date 2025
 *
 * Element and attribute lookups are case-insensitive. Writing is done by
 * string building with escapeXml.
 */

#pragma once

#include <libxml/tree.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace actuate::input::utils {
    /**
     * @brief Non-owning view of an element inside an XmlDocument
     *
     * Valid only while the owning document is alive.
     */
    class XmlElement {
    public:
        explicit XmlElement(xmlNode* node) noexcept
            : node_(node) {
        }

        [[nodiscard]] std::string getName() const;

        /**
         * @brief Case-insensitive element name test
         */
        [[nodiscard]] bool nameIs(std::string_view name) const;

        /**
         * @brief Attribute value by case-insensitive name
         * @return The value, or nullopt when the attribute is absent
         */
        [[nodiscard]] std::optional<std::string> getAttribute(std::string_view name) const;

        [[nodiscard]] bool hasAttribute(const std::string_view name) const {
            return getAttribute(name).has_value();
        }

        /**
         * @brief Child elements in document order (text and comments skipped)
         */
        [[nodiscard]] std::vector<XmlElement> getChildren() const;

        /**
         * @brief First child element with a case-insensitive name match
         */
        [[nodiscard]] std::optional<XmlElement> getFirstChild(std::string_view name) const;

        [[nodiscard]] long getLine() const noexcept;

    private:
        xmlNode* node_;
    };

    /**
     * @brief Owning parsed XML document
     */
    class XmlDocument {
    public:
        XmlDocument() = default;

        /**
         * @brief Parse a document from memory
         * @return False on malformed input; getLastError() holds the reason
         */
        bool parse(std::string_view text);

        [[nodiscard]] bool isLoaded() const noexcept {
            return doc_ != nullptr;
        }

        /**
         * @brief Root element, nullopt when nothing is loaded
         */
        [[nodiscard]] std::optional<XmlElement> getRoot() const;

        [[nodiscard]] const std::string& getLastError() const noexcept {
            return lastError_;
        }

    private:
        struct DocDeleter {
            void operator()(xmlDoc* doc) const noexcept {
                xmlFreeDoc(doc);
            }
        };

        std::unique_ptr<xmlDoc, DocDeleter> doc_;
        std::string lastError_;
    };

    /**
     * @brief Escape text for use inside a double-quoted attribute or element body
     */
    [[nodiscard]] std::string escapeXml(std::string_view text);
} // namespace actuate::input::utils
