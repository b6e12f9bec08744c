#pragma once

#include "parsers/base/xml_parser_base.hpp"
#include "include/test_case_types.hpp"
#include <string>
#include <vector>

namespace duckdb {

/**
 * Parser for JUnit XML test result format.
 *
 * JUnit XML is the de-facto report format of xUnit style runners
 * (PHPUnit --log-junit, Maven Surefire, pytest --junitxml, ...).
 *
 * Structure:
 * <testsuites>
 *   <testsuite name="...">
 *     <testsuite name="...">                      (suites may nest)
 *       <testcase name="testFailed" class="FooTest" classname="FooTest"
 *                 file="/src/FooTest.php" line="19" time="0.001918">
 *         <failure type="ExpectationFailedException">message
 *           /src/FooTest.php:22</failure>
 *         <error type="..."/> | <warning/> | <skipped/> | <incomplete/>
 *       </testcase>
 *     </testsuite>
 *   </testsuite>
 * </testsuites>
 *
 * Failure text lines of the form file:line become Details; the last one that
 * points into the test's own file replaces the test's reported location.
 */
class JUnitXmlParser : public XmlParserBase {
public:
    explicit JUnitXmlParser(ParserConfig config = ParserConfig());

    bool canParse(const std::string& content) const override;

    std::vector<TestCase> parseJsonContent(const std::string& json_content) const override;
};

} // namespace duckdb
