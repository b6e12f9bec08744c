#include "core/parser_registry.hpp"
#include "junit_xml_parser.hpp"
#include "teamcity_parser.hpp"

namespace duckdb {

// Factory for parsers whose constructor takes the per-call config
template <typename T>
static ParserFactory MakeFactory() {
    return [](const ParserConfig& config) -> ParserPtr {
        return make_uniq<T>(config);
    };
}

/**
 * Register all test framework parsers with the registry.
 */
void RegisterTestFrameworksParsers(ParserRegistry& registry) {
    registry.registerParser(MakeFactory<JUnitXmlParser>());
    registry.registerParser(MakeFactory<TeamCityParser>());
}

} // namespace duckdb
