#pragma once

#include "base_parser.hpp"
#include "core/webbed_integration.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/main/client_context.hpp"
#include <string>

namespace duckdb {

/**
 * Parsers for XML reports. The document is converted to JSON by the webbed
 * extension's xml_to_json and handed to parseJsonContent(), so subclasses
 * only ever walk JSON.
 */
class XmlParserBase : public BaseParser {
public:
    XmlParserBase(std::string format_name, std::string description, ParserConfig config, int priority)
        : BaseParser(std::move(format_name), std::move(description), std::move(config), priority) {
        setRequiredExtension(WebbedIntegration::EXTENSION_NAME);
    }

    bool requiresContext() const override {
        return true;
    }

    std::vector<TestCase> parse(const std::string& content) const override {
        throw InvalidInputException("%s reports can only be parsed inside a DuckDB query. %s",
                                    getFormatName(), WebbedIntegration::MissingExtensionMessage());
    }

    std::vector<TestCase> parseWithContext(ClientContext &context,
                                           const std::string& content) const override {
        return parseJsonContent(WebbedIntegration::XmlToJson(context, content));
    }

    /**
     * Build records from webbed's JSON rendering of the document:
     * attributes are keyed "@name", element text "#text", and an element
     * repeated under one parent becomes an array.
     */
    virtual std::vector<TestCase> parseJsonContent(const std::string& json_content) const = 0;

protected:
    /**
     * Name of the document element, skipping the XML declaration, comments,
     * processing instructions and DOCTYPE. Empty if the content does not
     * start like an XML document.
     */
    static std::string RootElementName(const std::string& content) {
        size_t pos = 0;
        while (true) {
            pos = content.find_first_not_of(" \t\r\n", pos);
            if (pos == std::string::npos || content[pos] != '<') {
                return "";
            }
            if (content.compare(pos, 4, "<!--") == 0) {
                pos = content.find("-->", pos + 4);
                if (pos == std::string::npos) {
                    return "";
                }
                pos += 3;
            } else if (content.compare(pos, 2, "<?") == 0 || content.compare(pos, 2, "<!") == 0) {
                pos = content.find('>', pos + 2);
                if (pos == std::string::npos) {
                    return "";
                }
                pos += 1;
            } else {
                break;
            }
        }

        size_t name_start = pos + 1;
        size_t name_end = content.find_first_of(" \t\r\n/>", name_start);
        if (name_end == std::string::npos) {
            return "";
        }
        return content.substr(name_start, name_end - name_start);
    }
};

} // namespace duckdb
