#pragma once

#include "parsers/base/parser_interface.hpp"
#include <string>
#include <vector>

namespace duckdb {

/**
 * Holds the metadata and ParserConfig every concrete parser carries.
 * Subclasses pass their identity to the constructor and register aliases
 * from their own constructor body.
 */
class BaseParser : public IParser {
public:
    BaseParser(std::string format_name, std::string description, ParserConfig config,
               int priority = ParserPriority::MEDIUM,
               std::string category = ParserCategory::TEST_FRAMEWORK)
        : format_name_(std::move(format_name))
        , description_(std::move(description))
        , category_(std::move(category))
        , priority_(priority)
        , config_(std::move(config)) {}

    std::string getFormatName() const override { return format_name_; }
    std::string getDescription() const override { return description_; }
    std::string getCategory() const override { return category_; }
    int getPriority() const override { return priority_; }
    std::vector<std::string> getAliases() const override { return aliases_; }
    std::string getRequiredExtension() const override { return required_extension_; }

    const ParserConfig& getConfig() const { return config_; }

protected:
    void addAlias(const std::string& alias) { aliases_.push_back(alias); }
    void setRequiredExtension(const std::string& extension) { required_extension_ = extension; }

    std::string renamePath(const std::string& path) const {
        return RenamePath(path, config_.path_style);
    }

private:
    std::string format_name_;
    std::string description_;
    std::string category_;
    int priority_;
    ParserConfig config_;
    std::vector<std::string> aliases_;
    std::string required_extension_;
};

} // namespace duckdb
