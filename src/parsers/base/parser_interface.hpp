#pragma once

#include <string>
#include <vector>
#include <memory>
#include "duckdb/common/unique_ptr.hpp"
#include "duckdb/main/client_context.hpp"
#include "include/test_case_types.hpp"
#include "core/line_locator.hpp"

namespace duckdb {

// Separator convention for emitted file paths. NATIVE follows the host.
enum class PathStyle : uint8_t {
    NATIVE = 0,
    UNIX = 1,
    WINDOWS = 2
};

PathStyle StringToPathStyle(const std::string& str);
std::string PathStyleToString(PathStyle style);

// '/' becomes '\' under WINDOWS (or NATIVE on a Windows host)
std::string RenamePath(const std::string& path, PathStyle style);

struct ParserConfig {
    PathStyle path_style = PathStyle::NATIVE;

    // Line lookups for passing tests; when null the calling context's
    // file system is used
    std::shared_ptr<const LineLocator> line_locator;
};

/**
 * A reader for one test report format.
 *
 * Parsing is all-or-nothing: a malformed report throws InvalidInputException
 * and no records are returned. Records come back in report order.
 */
class IParser {
public:
    virtual ~IParser() = default;

    // Cheap sniff used by format auto-detection
    virtual bool canParse(const std::string& content) const = 0;

    virtual std::vector<TestCase> parse(const std::string& content) const = 0;

    // Entry point used by the table functions. Parsers that need database
    // services (the webbed extension, the file system) override this.
    virtual std::vector<TestCase> parseWithContext(ClientContext &context,
                                                   const std::string& content) const {
        return parse(content);
    }

    // True when parse() alone cannot handle a report
    virtual bool requiresContext() const {
        return false;
    }

    virtual std::string getFormatName() const = 0;
    virtual std::string getDescription() const = 0;
    virtual std::string getCategory() const = 0;
    // Detection order, highest first
    virtual int getPriority() const = 0;

    virtual std::vector<std::string> getAliases() const {
        return {};
    }

    // Extension that must be loaded for parsing, empty if none
    virtual std::string getRequiredExtension() const {
        return "";
    }
};

using ParserPtr = unique_ptr<IParser>;

namespace ParserPriority {
    constexpr int VERY_HIGH = 100;  // document formats with a recognizable root
    constexpr int HIGH = 80;        // line protocols with a fixed marker
    constexpr int MEDIUM = 50;
}

namespace ParserCategory {
    constexpr const char* TEST_FRAMEWORK = "test_framework";
}

} // namespace duckdb
