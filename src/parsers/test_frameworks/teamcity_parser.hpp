#pragma once

#include "parsers/base/base_parser.hpp"
#include "include/test_case_types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace duckdb {

/**
 * One decoded service message: the event type plus its key='value' options.
 */
struct ServiceMessage {
    std::string type;
    std::unordered_map<std::string, std::string> options;

    bool Has(const std::string& key) const {
        return options.find(key) != options.end();
    }

    // Empty string when the option is absent
    std::string Get(const std::string& key) const {
        auto it = options.find(key);
        return it == options.end() ? std::string() : it->second;
    }
};

/**
 * Parser for TeamCity service messages (phpunit --teamcity).
 *
 * Format:
 * ##teamcity[testSuiteStarted name='FooTest' locationHint='php_qn://C:\src\FooTest.php::\FooTest']
 * ##teamcity[testStarted name='testFailed' locationHint='php_qn://C:\src\FooTest.php::\FooTest::testFailed']
 * ##teamcity[testFailed name='testFailed' message='Failed asserting that false is true.' details=' C:\src\FooTest.php:22|n ']
 * ##teamcity[testFinished name='testFailed' duration='0']
 * ##teamcity[testSuiteFinished name='FooTest']
 *
 * Events between testStarted and testFinished form one test. A test without
 * a testFailed/testIgnored event passed; its line is looked up in the source
 * file by searching for "function <name>".
 */
class TeamCityParser : public BaseParser {
public:
    explicit TeamCityParser(ParserConfig config = ParserConfig());

    bool canParse(const std::string& content) const override;

    /**
     * Parse using the configured line locator.
     * Throws InvalidInputException if a passing test needs one and none is configured.
     */
    std::vector<TestCase> parse(const std::string& content) const override;

    /**
     * Parse using the configured line locator, or the context's file system.
     */
    std::vector<TestCase> parseWithContext(ClientContext &context, const std::string& content) const override;

    std::vector<TestCase> parseWithLocator(const std::string& content, const LineLocator *locator) const;

    // Decode every ##teamcity line, dropping suite bookkeeping events
    static std::vector<ServiceMessage> ParseServiceMessages(const std::string& content);

    // Split messages into per-test groups of [start, outcome, finish]
    static std::vector<std::vector<ServiceMessage>> GroupByTest(const std::vector<ServiceMessage>& messages);

private:
    TestCase ConvertToTestCase(const std::vector<ServiceMessage>& group) const;
    std::vector<Detail> ConvertToDetails(const std::string& content) const;
};

} // namespace duckdb
