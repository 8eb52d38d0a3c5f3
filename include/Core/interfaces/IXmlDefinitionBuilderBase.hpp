#pragma once

#include <pugixml.hpp>
#include <string>

/**
 * @brief Base class for builders that emit libvirt XML definitions
 *
 * Derived classes fill the document in buildDocument(); build() serializes
 * it. Each call to build() starts from an empty document so a builder can be
 * reused after its setters change.
 */
class IXmlBuilderBase {
protected:
    pugi::xml_document doc;     ///< Document being assembled

    /**
     * @brief Appends the definition to the (empty) document
     */
    virtual void buildDocument() = 0;

public:
    IXmlBuilderBase() = default;

    IXmlBuilderBase(const IXmlBuilderBase&) = delete;
    IXmlBuilderBase& operator=(const IXmlBuilderBase&) = delete;

    IXmlBuilderBase(IXmlBuilderBase&&) noexcept = default;
    IXmlBuilderBase& operator=(IXmlBuilderBase&&) noexcept = default;

    /**
     * @brief Builds and returns the indented XML text, without declaration
     */
    [[nodiscard]] std::string build() {
        doc.reset();
        buildDocument();
        return serialize(doc);
    }

    [[nodiscard]] const pugi::xml_document& getDocument() const noexcept {
        return doc;
    }

    [[nodiscard]] static std::string serialize(const pugi::xml_node& node) {
        struct xml_string_writer : pugi::xml_writer {
            std::string result;
            void write(const void* data, size_t size) override {
                result.append(static_cast<const char*>(data), size);
            }
        };

        xml_string_writer writer;
        node.print(writer, "  ", pugi::format_indent | pugi::format_no_declaration);
        return writer.result;
    }

    virtual ~IXmlBuilderBase() = default;
};
