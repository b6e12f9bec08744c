#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "parsers/base/parser_interface.hpp"
#include "test_case_types.hpp"
#include <vector>
#include <string>

namespace duckdb {

// Where the report text comes from
enum class TestCaseSource : uint8_t {
    PATH = 0,     // read_test_cases: source is a path
    CONTENT = 1   // parse_test_cases: source is the report itself
};

// Bind data structure for read_test_cases / parse_test_cases
struct ReadTestCasesBindData : public TableFunctionData {
    std::string source;
    TestCaseSource source_kind;
    std::string format;               // "auto" or a registered format name
    PathStyle path_style;

    ReadTestCasesBindData() : source_kind(TestCaseSource::PATH), format("auto"), path_style(PathStyle::NATIVE) {}
};

// Global state: the whole report is parsed at init, then emitted in chunks
struct ReadTestCasesGlobalState : public GlobalTableFunctionState {
    std::vector<TestCase> test_cases;
    idx_t current_row;

    ReadTestCasesGlobalState() : current_row(0) {}
};

// read_test_cases(path [, format]) - set with single-arg and two-arg overloads
TableFunctionSet GetReadTestCasesFunction();

// parse_test_cases(content [, format]) - set with single-arg and two-arg overloads
TableFunctionSet GetParseTestCasesFunction();

// Output column types shared by both functions
void GetTestCaseSchema(vector<LogicalType> &return_types, vector<string> &names);

} // namespace duckdb
