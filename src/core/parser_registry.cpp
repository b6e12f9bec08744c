#include "parser_registry.hpp"
#include "core/trace.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include <algorithm>
#include <mutex>

namespace duckdb {

static std::once_flag builtin_parsers_registered;

void InitializeAllParsers() {
    std::call_once(builtin_parsers_registered, []() {
        RegisterTestFrameworksParsers(ParserRegistry::getInstance());
        VERDICT_TRACE("Built-in parsers registered");
    });
}

ParserRegistry& ParserRegistry::getInstance() {
    static ParserRegistry instance;
    return instance;
}

void ParserRegistry::registerParser(ParserFactory factory) {
    if (!factory) {
        throw InternalException("Cannot register an empty parser factory");
    }
    auto prototype = factory(ParserConfig());
    if (!prototype) {
        throw InternalException("Parser factory produced no parser");
    }

    size_t index = entries_.size();
    std::vector<std::string> keys = prototype->getAliases();
    keys.insert(keys.begin(), prototype->getFormatName());
    for (const auto& key : keys) {
        VERDICT_TRACE("Format key '" << key << "' -> parser #" << index);
        name_index_[StringUtil::Lower(key)] = index;
    }

    // Insert after every entry of equal or higher priority
    int priority = prototype->getPriority();
    auto position = std::find_if(detection_order_.begin(), detection_order_.end(), [&](size_t other) {
        return entries_[other].prototype->getPriority() < priority;
    });
    detection_order_.insert(position, index);

    Entry entry;
    entry.factory = std::move(factory);
    entry.prototype = std::move(prototype);
    entries_.push_back(std::move(entry));
}

const ParserRegistry::Entry* ParserRegistry::findEntry(const std::string& format_name) const {
    InitializeAllParsers();
    auto it = name_index_.find(StringUtil::Lower(format_name));
    if (it == name_index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

std::string ParserRegistry::supportedFormats() const {
    std::vector<std::string> names;
    for (const auto& entry : entries_) {
        names.push_back(entry.prototype->getFormatName());
    }
    return StringUtil::Join(names, ", ");
}

ParserPtr ParserRegistry::createParser(const std::string& format_name, const ParserConfig& config) const {
    auto entry = findEntry(format_name);
    if (!entry) {
        throw InvalidInputException("Unknown test report format '%s'. Supported: %s", format_name,
                                    supportedFormats());
    }
    return entry->factory(config);
}

IParser* ParserRegistry::getParser(const std::string& format_name) const {
    auto entry = findEntry(format_name);
    return entry ? entry->prototype.get() : nullptr;
}

bool ParserRegistry::hasFormat(const std::string& format_name) const {
    return findEntry(format_name) != nullptr;
}

IParser* ParserRegistry::findParser(const std::string& content) const {
    InitializeAllParsers();
    for (size_t index : detection_order_) {
        IParser* candidate = entries_[index].prototype.get();
        if (candidate->canParse(content)) {
            VERDICT_TRACE("Detected format '" << candidate->getFormatName() << "'");
            return candidate;
        }
    }
    return nullptr;
}

std::vector<ParserInfo> ParserRegistry::getAllFormats() const {
    InitializeAllParsers();

    std::vector<ParserInfo> formats;
    for (const auto& entry : entries_) {
        const IParser& parser = *entry.prototype;
        ParserInfo info;
        info.format_name = parser.getFormatName();
        info.description = parser.getDescription();
        info.category = parser.getCategory();
        info.required_extension = parser.getRequiredExtension();
        info.aliases = parser.getAliases();
        info.priority = parser.getPriority();
        formats.push_back(std::move(info));
    }

    std::sort(formats.begin(), formats.end(), [](const ParserInfo& a, const ParserInfo& b) {
        return a.category != b.category ? a.category < b.category : a.format_name < b.format_name;
    });
    return formats;
}

} // namespace duckdb
