#pragma once

#include <vector>
#include <memory>
#include <string>
#include <unordered_map>
#include <functional>
#include "duckdb/common/unique_ptr.hpp"
#include "parsers/base/parser_interface.hpp"

namespace duckdb {

// One row of verdict_formats()
struct ParserInfo {
    std::string format_name;
    std::string description;
    std::string category;
    std::string required_extension;
    std::vector<std::string> aliases;
    int priority = 0;
};

using ParserFactory = std::function<ParserPtr(const ParserConfig&)>;

/**
 * Known report formats, looked up case-insensitively by name or alias.
 *
 * Registration happens once at load time. Afterwards the registry is only
 * read, so concurrent queries may share it. Every createParser() call builds
 * a new parser from the factory; the default-config instance kept per format
 * serves metadata and detection only.
 */
class ParserRegistry {
public:
    static ParserRegistry& getInstance();

    void registerParser(ParserFactory factory);

    // Throws InvalidInputException naming the supported formats
    ParserPtr createParser(const std::string& format_name, const ParserConfig& config = ParserConfig()) const;

    // Default-config instance, or nullptr
    IParser* getParser(const std::string& format_name) const;

    // First parser, by descending priority, whose canParse() accepts the content
    IParser* findParser(const std::string& content) const;

    bool hasFormat(const std::string& format_name) const;

    // Sorted by category, then format name
    std::vector<ParserInfo> getAllFormats() const;

private:
    ParserRegistry() = default;

    struct Entry {
        ParserFactory factory;
        ParserPtr prototype;
    };

    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> name_index_;
    // Indices into entries_, highest priority first
    std::vector<size_t> detection_order_;

    const Entry* findEntry(const std::string& format_name) const;
    std::string supportedFormats() const;
};

// Defined in parsers/test_frameworks/init.cpp
void RegisterTestFrameworksParsers(ParserRegistry& registry);

// Registers the built-in parsers on first call; later calls do nothing
void InitializeAllParsers();

} // namespace duckdb
