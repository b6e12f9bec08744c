#include <catch2/catch.hpp>

#include "duckdb.hpp"
#include "duckdb/common/string_util.hpp"
#include "verdict_extension.hpp"

using namespace duckdb;

static unique_ptr<MaterializedQueryResult> Run(Connection &con, const std::string &query) {
	auto result = con.Query(query);
	INFO(query);
	if (result->HasError()) {
		FAIL(result->GetError());
	}
	return result;
}

static std::string Quote(const std::string &text) {
	return "'" + StringUtil::Replace(text, "'", "''") + "'";
}

static const char *FAILURES_STREAM =
    "##teamcity[testStarted name='testFailed' locationHint='php_qn://C:\\src\\FooTest.php::\\FooTest::testFailed']\n"
    "##teamcity[testFailed name='testFailed' message='Failed' details=' C:\\src\\FooTest.php:20|n "
    "C:\\vendor\\Assert.php:7|n ']\n"
    "##teamcity[testFinished name='testFailed' duration='3']\n"
    "##teamcity[testStarted name='testSkipped' locationHint='php_qn://C:\\src\\FooTest.php::\\FooTest::testSkipped']\n"
    "##teamcity[testIgnored name='testSkipped' message='C:\\src\\FooTest.php:25']\n"
    "##teamcity[testFinished name='testSkipped' duration='0']\n";

TEST_CASE("parse_test_cases emits one row per test", "[sql]") {
	DuckDB db(nullptr);
	db.LoadStaticExtension<VerdictExtension>();
	Connection con(db);

	auto result = Run(con, "SELECT name, class, classname, file, line, time, type, type_group, fault_type, "
	                       "fault_message, len(fault_details), fault_details[1].file, fault_details[1].line "
	                       "FROM parse_test_cases(" + Quote(FAILURES_STREAM) + ", 'teamcity', path_style := 'windows')");
	REQUIRE(result->RowCount() == 2);

	CHECK(result->GetValue(0, 0).ToString() == "testFailed");
	CHECK(result->GetValue(1, 0).ToString() == "FooTest");
	CHECK(result->GetValue(2, 0).IsNull());
	CHECK(result->GetValue(3, 0).ToString() == "C:\\src\\FooTest.php");
	CHECK(result->GetValue(4, 0).GetValue<int32_t>() == 19);
	CHECK(result->GetValue(5, 0).GetValue<double>() == 3.0);
	CHECK(result->GetValue(6, 0).ToString() == "failure");
	CHECK(result->GetValue(7, 0).ToString() == "error");
	CHECK(result->GetValue(8, 0).IsNull());
	CHECK(result->GetValue(9, 0).ToString() == "Failed");
	CHECK(result->GetValue(10, 0).GetValue<int64_t>() == 1);
	CHECK(result->GetValue(11, 0).ToString() == "C:\\vendor\\Assert.php");
	CHECK(result->GetValue(12, 0).GetValue<int32_t>() == 6);

	CHECK(result->GetValue(6, 1).ToString() == "skipped");
	CHECK(result->GetValue(7, 1).ToString() == "skipped");
	CHECK(result->GetValue(4, 1).GetValue<int32_t>() == 24);
	CHECK(result->GetValue(10, 1).GetValue<int64_t>() == 0);
}

TEST_CASE("read_test_cases resolves passing tests from the source file", "[sql]") {
	DuckDB db(nullptr);
	db.LoadStaticExtension<VerdictExtension>();
	Connection con(db);

	auto result = Run(con, "SELECT name, file, line, time, type, fault_message "
	                       "FROM read_test_cases('test/data/teamcity.txt', path_style := 'unix')");
	REQUIRE(result->RowCount() == 5);

	CHECK(result->GetValue(0, 0).ToString() == "testPassed");
	CHECK(result->GetValue(1, 0).ToString() == "test/data/PHPUnitTest.php");
	CHECK(result->GetValue(2, 0).GetValue<int32_t>() == 6);
	CHECK(result->GetValue(3, 0).GetValue<double>() == 10.0);
	CHECK(result->GetValue(4, 0).ToString() == "passed");
	CHECK(result->GetValue(5, 0).IsNull());

	CHECK(result->GetValue(0, 1).ToString() == "testFailed");
	CHECK(result->GetValue(2, 1).GetValue<int32_t>() == 13);
	CHECK(result->GetValue(5, 1).ToString() == "Failed asserting that false is true.");

	CHECK(result->GetValue(2, 2).GetValue<int32_t>() == 18);
	CHECK(result->GetValue(2, 3).GetValue<int32_t>() == 23);

	CHECK(result->GetValue(0, 4).ToString() == "testNoAssertions");
	CHECK(result->GetValue(2, 4).GetValue<int32_t>() == 26);
	CHECK(result->GetValue(4, 4).ToString() == "passed");
}

TEST_CASE("Format and settings are validated at bind time", "[sql]") {
	DuckDB db(nullptr);
	db.LoadStaticExtension<VerdictExtension>();
	Connection con(db);

	auto unknown = con.Query("SELECT * FROM parse_test_cases('x', 'nunit')");
	REQUIRE(unknown->HasError());
	CHECK(StringUtil::Contains(unknown->GetError(), "Unknown format"));

	auto bad_style = con.Query("SELECT * FROM parse_test_cases('x', 'teamcity', path_style := 'mac')");
	REQUIRE(bad_style->HasError());
	CHECK(StringUtil::Contains(bad_style->GetError(), "path_style"));

	auto undetected = con.Query("SELECT * FROM parse_test_cases('plain build output')");
	REQUIRE(undetected->HasError());
	CHECK(StringUtil::Contains(undetected->GetError(), "detect"));

	auto missing = con.Query("SELECT * FROM read_test_cases('test/data/does_not_exist.txt', 'teamcity')");
	REQUIRE(missing->HasError());
}

TEST_CASE("Malformed streams fail the whole query", "[sql]") {
	DuckDB db(nullptr);
	db.LoadStaticExtension<VerdictExtension>();
	Connection con(db);

	auto truncated = con.Query("SELECT * FROM parse_test_cases(" +
	                           Quote("##teamcity[testStarted name='x' locationHint='php_qn://a.php::A::x']") +
	                           ", 'TeamCity')");
	REQUIRE(truncated->HasError());
	CHECK(StringUtil::Contains(truncated->GetError(), "testFinished"));
}

TEST_CASE("Type helpers", "[sql]") {
	DuckDB db(nullptr);
	db.LoadStaticExtension<VerdictExtension>();
	Connection con(db);

	auto result = Run(con, "SELECT test_type_group('warning'), test_type_group('RISKY'), test_badge('passed'), "
	                       "test_badge('failure'), test_badge('skipped'), test_badge('incomplete')");
	CHECK(result->GetValue(0, 0).ToString() == "skipped");
	CHECK(result->GetValue(1, 0).ToString() == "error");
	CHECK(result->GetValue(2, 0).ToString() == "[ OK ]");
	CHECK(result->GetValue(3, 0).ToString() == "[FAIL]");
	CHECK(result->GetValue(4, 0).ToString() == "[SKIP]");
	CHECK(result->GetValue(5, 0).ToString() == "[INC ]");

	auto nulls = Run(con, "SELECT test_badge(NULL)");
	CHECK(nulls->GetValue(0, 0).IsNull());

	REQUIRE(con.Query("SELECT test_badge('flaky')")->HasError());
}

TEST_CASE("verdict_formats lists the auto mode and both parsers", "[sql]") {
	DuckDB db(nullptr);
	db.LoadStaticExtension<VerdictExtension>();
	Connection con(db);

	auto result = Run(con, "SELECT format, requires_extension, aliases FROM verdict_formats()");
	REQUIRE(result->RowCount() == 3);
	CHECK(result->GetValue(0, 0).ToString() == "auto");
	CHECK(result->GetValue(0, 1).ToString() == "junit");
	CHECK(result->GetValue(1, 1).ToString() == "webbed");
	CHECK(result->GetValue(2, 1).ToString() == "junit_xml");
	CHECK(result->GetValue(0, 2).ToString() == "teamcity");
	CHECK(result->GetValue(1, 2).IsNull());
}
