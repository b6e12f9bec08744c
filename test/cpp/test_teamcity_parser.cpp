#include <catch2/catch.hpp>

#include "parsers/test_frameworks/teamcity_parser.hpp"
#include "duckdb/common/exception.hpp"

#include <atomic>
#include <map>

using namespace duckdb;

// In-memory source files keyed by path
class FakeLineLocator : public LineLocator {
public:
	explicit FakeLineLocator(std::map<std::string, std::vector<std::string>> files) : files_(std::move(files)) {
	}

	int32_t LineNumberContaining(const std::string &path, const std::string &needle) const override {
		lookups_++;
		auto it = files_.find(path);
		if (it == files_.end()) {
			throw IOException("No such file: %s", path);
		}
		for (size_t i = 0; i < it->second.size(); i++) {
			if (it->second[i].find(needle) != std::string::npos) {
				return static_cast<int32_t>(i);
			}
		}
		throw IOException("'%s' not found in %s", needle, path);
	}

	int Lookups() const {
		return lookups_;
	}

private:
	std::map<std::string, std::vector<std::string>> files_;
	mutable std::atomic<int> lookups_ {0};
};

static std::shared_ptr<FakeLineLocator> MakeLocator() {
	std::map<std::string, std::vector<std::string>> files;
	files["/src/FooTest.php"] = {"<?php", "", "class FooTest extends TestCase", "{",
	                             "    public function testPassed()", "    {", "    }", "",
	                             "    public function testAlsoPassed()", "    {", "    }", "}"};
	files["a.php"] = {"<?php", "function testOther()"};
	return std::make_shared<FakeLineLocator>(files);
}

static TeamCityParser MakeParser(std::shared_ptr<const LineLocator> locator,
                                 PathStyle path_style = PathStyle::UNIX) {
	ParserConfig config;
	config.path_style = path_style;
	config.line_locator = std::move(locator);
	return TeamCityParser(config);
}

static const char *FOO_STREAM =
    "PHPUnit 7.5.1 by Sebastian Bergmann and contributors.\n"
    "\n"
    "##teamcity[testCount count='4' flowId='8024']\n"
    "##teamcity[testSuiteStarted name='FooTest' locationHint='php_qn:///src/FooTest.php::\\FooTest' flowId='8024']\n"
    "##teamcity[testStarted name='testPassed' locationHint='php_qn:///src/FooTest.php::\\FooTest::testPassed' flowId='8024']\n"
    "##teamcity[testFinished name='testPassed' duration='10' flowId='8024']\n"
    "##teamcity[testStarted name='testFailed' locationHint='php_qn:///src/FooTest.php::\\FooTest::testFailed' flowId='8024']\n"
    "##teamcity[testFailed name='testFailed' message='Failed asserting that false is true.' details=' /src/FooTest.php:20|n ' flowId='8024']\n"
    "##teamcity[testFinished name='testFailed' duration='0' flowId='8024']\n"
    "##teamcity[testStarted name='testSkipped' locationHint='php_qn:///src/FooTest.php::\\FooTest::testSkipped' flowId='8024']\n"
    "##teamcity[testIgnored name='testSkipped' message='The MySQLi extension is not available.' details=' /src/FooTest.php:25|n ' duration='0' flowId='8024']\n"
    "##teamcity[testFinished name='testSkipped' duration='0' flowId='8024']\n"
    "##teamcity[testStarted name='testAlsoPassed' locationHint='php_qn:///src/FooTest.php::\\FooTest::testAlsoPassed' flowId='8024']\n"
    "##teamcity[testFinished name='testAlsoPassed' duration='0.25' flowId='8024']\n"
    "##teamcity[testSuiteFinished name='FooTest' flowId='8024']\n"
    "\n"
    "Time: 24 ms, Memory: 4.00MB\n";

TEST_CASE("Service messages are decoded and bookkeeping dropped", "[teamcity]") {
	auto messages = TeamCityParser::ParseServiceMessages(FOO_STREAM);
	REQUIRE(messages.size() == 10);
	CHECK(messages[0].type == "testStarted");
	CHECK(messages[0].Get("name") == "testPassed");
	CHECK(messages[0].Get("locationHint") == "php_qn:///src/FooTest.php::/FooTest::testPassed");
	CHECK(messages[3].type == "testFailed");
	CHECK(messages[3].Get("message") == "Failed asserting that false is true.");
	CHECK(messages[3].Has("details"));
	CHECK_FALSE(messages[3].Has("duration"));
}

TEST_CASE("Option values split on the first equals sign", "[teamcity]") {
	auto messages = TeamCityParser::ParseServiceMessages("##teamcity[testFailed message='expected a=b' flag]");
	REQUIRE(messages.size() == 1);
	CHECK(messages[0].Get("message") == "expected a=b");
	CHECK(messages[0].Has("flag"));
	CHECK(messages[0].Get("flag").empty());
}

TEST_CASE("A start and finish with nothing between is a pass", "[teamcity]") {
	auto groups = TeamCityParser::GroupByTest(TeamCityParser::ParseServiceMessages(FOO_STREAM));
	REQUIRE(groups.size() == 4);
	for (const auto &group : groups) {
		REQUIRE(group.size() == 3);
		CHECK(group.front().type == "testStarted");
		CHECK(group.back().type == "testFinished");
	}
	CHECK(groups[0][1].type == "testPassed");
	CHECK(groups[0][1].options.empty());
	CHECK(groups[1][1].type == "testFailed");
	CHECK(groups[2][1].type == "testIgnored");
	CHECK(groups[3][1].type == "testPassed");
}

TEST_CASE("TeamCity stream becomes test cases in order", "[teamcity]") {
	auto locator = MakeLocator();
	auto parser = MakeParser(locator);
	auto test_cases = parser.parse(FOO_STREAM);

	REQUIRE(test_cases.size() == 4);

	const auto &passed = test_cases[0];
	CHECK(passed.name == "testPassed");
	CHECK(passed.class_name == "FooTest");
	CHECK_FALSE(passed.has_classname);
	CHECK(passed.file == "/src/FooTest.php");
	CHECK(passed.line == 4);
	CHECK(passed.time == 10.0);
	CHECK(passed.type == TestCaseType::PASSED);
	CHECK_FALSE(passed.has_fault);

	const auto &failed = test_cases[1];
	CHECK(failed.type == TestCaseType::FAILURE);
	CHECK(failed.file == "/src/FooTest.php");
	CHECK(failed.line == 19);
	CHECK(failed.time == 0.0);
	REQUIRE(failed.has_fault);
	CHECK(failed.fault.message == "Failed asserting that false is true.");
	CHECK_FALSE(failed.fault.has_type);
	CHECK(failed.fault.details.empty());

	const auto &skipped = test_cases[2];
	CHECK(skipped.type == TestCaseType::SKIPPED);
	CHECK(skipped.line == 24);
	CHECK(skipped.fault.message == "The MySQLi extension is not available.");

	const auto &also_passed = test_cases[3];
	CHECK(also_passed.name == "testAlsoPassed");
	CHECK(also_passed.line == 8);
	CHECK(also_passed.time == Approx(0.25));

	CHECK(locator->Lookups() == 2);
}

TEST_CASE("First location in the message overrides the test location", "[teamcity]") {
	auto parser = MakeParser(MakeLocator());
	auto test_cases = parser.parse("##teamcity[testStarted name='testOther' locationHint='php_qn://c.php::C::testOther']\n"
	                               "##teamcity[testFailed name='testOther' message='a.php:5|nb.php:9']\n"
	                               "##teamcity[testFinished name='testOther' duration='1.5']\n");
	REQUIRE(test_cases.size() == 1);
	const auto &test_case = test_cases[0];
	CHECK(test_case.file == "a.php");
	CHECK(test_case.line == 4);
	CHECK(test_case.time == Approx(1.5));
	CHECK(test_case.fault.message == "a.php:5|nb.php:9");
	REQUIRE(test_case.fault.details.size() == 1);
	CHECK(test_case.fault.details[0] == Detail("b.php", 8));
}

TEST_CASE("Windows path style rewrites separators", "[teamcity]") {
	auto parser = MakeParser(MakeLocator(), PathStyle::WINDOWS);
	auto test_cases =
	    parser.parse("##teamcity[testStarted name='testFailed' "
	                 "locationHint='php_qn://C:\\src\\FooTest.php::\\FooTest::testFailed']\n"
	                 "##teamcity[testFailed name='testFailed' message='Failed' details=' C:\\src\\FooTest.php:20|n "
	                 "C:\\vendor\\Assert.php:7|n ']\n"
	                 "##teamcity[testFinished name='testFailed' duration='0']\n");
	REQUIRE(test_cases.size() == 1);
	CHECK(test_cases[0].class_name == "FooTest");
	CHECK(test_cases[0].file == "C:\\src\\FooTest.php");
	CHECK(test_cases[0].line == 19);
	REQUIRE(test_cases[0].fault.details.size() == 1);
	CHECK(test_cases[0].fault.details[0] == Detail("C:\\vendor\\Assert.php", 6));
}

TEST_CASE("Malformed location hints are rejected", "[teamcity]") {
	auto parser = MakeParser(MakeLocator());

	REQUIRE_THROWS_AS(parser.parse("##teamcity[testStarted name='x' locationHint='php_qn://FooTest.php::testX']\n"
	                               "##teamcity[testFailed name='x' message='a.php:1']\n"
	                               "##teamcity[testFinished name='x']\n"),
	                  InvalidInputException);
	REQUIRE_THROWS_AS(parser.parse("##teamcity[testStarted name='x']\n"
	                               "##teamcity[testFailed name='x' message='a.php:1']\n"
	                               "##teamcity[testFinished name='x']\n"),
	                  InvalidInputException);
}

TEST_CASE("Malformed failure locations are rejected", "[teamcity]") {
	auto parser = MakeParser(MakeLocator());
	REQUIRE_THROWS_AS(parser.parse("##teamcity[testStarted name='x' locationHint='php_qn://a.php::A::x']\n"
	                               "##teamcity[testFailed name='x' message='Failed asserting that false is true.']\n"
	                               "##teamcity[testFinished name='x']\n"),
	                  InvalidInputException);
}

TEST_CASE("Structural stream errors are rejected", "[teamcity]") {
	auto parser = MakeParser(MakeLocator());

	// truncated: no testFinished
	REQUIRE_THROWS_AS(parser.parse("##teamcity[testStarted name='x' locationHint='php_qn://a.php::A::x']\n"),
	                  InvalidInputException);
	// unknown outcome event
	REQUIRE_THROWS_AS(parser.parse("##teamcity[testStarted name='x' locationHint='php_qn://a.php::A::x']\n"
	                               "##teamcity[testStdOut name='x' out='hello']\n"
	                               "##teamcity[testFinished name='x']\n"),
	                  InvalidInputException);
	// unbalanced quoting
	REQUIRE_THROWS_AS(parser.parse("##teamcity[testStarted name='x]\n"), InvalidInputException);
}

TEST_CASE("Line lookup failures propagate", "[teamcity]") {
	auto parser = MakeParser(MakeLocator());
	REQUIRE_THROWS_AS(parser.parse("##teamcity[testStarted name='testMissing' locationHint='php_qn://a.php::A::testMissing']\n"
	                               "##teamcity[testFinished name='testMissing']\n"),
	                  IOException);
}

TEST_CASE("Passing tests need a line locator", "[teamcity]") {
	TeamCityParser parser;
	REQUIRE_THROWS_AS(parser.parse("##teamcity[testStarted name='x' locationHint='php_qn://a.php::A::x']\n"
	                               "##teamcity[testFinished name='x']\n"),
	                  InvalidInputException);
	// no passing tests, nothing to look up
	CHECK(parser.parse("##teamcity[testStarted name='x' locationHint='php_qn://a.php::A::x']\n"
	                   "##teamcity[testIgnored name='x' message='a.php:3']\n"
	                   "##teamcity[testFinished name='x']\n")
	          .size() == 1);
}

TEST_CASE("Streams without service messages are empty", "[teamcity]") {
	TeamCityParser parser;
	CHECK(parser.parse("").empty());
	CHECK(parser.parse("PHPUnit 7.5.1\n\nNo tests executed!\n").empty());
}

TEST_CASE("TeamCity detection", "[teamcity]") {
	TeamCityParser parser;
	CHECK(parser.canParse(FOO_STREAM));
	CHECK_FALSE(parser.canParse("<testsuites/>"));
	CHECK_FALSE(parser.requiresContext());
}
