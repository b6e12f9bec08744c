#define DUCKDB_EXTENSION_MAIN

#include "verdict_extension.hpp"
#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include "include/read_test_cases_function.hpp"
#include "include/test_badge_function.hpp"
#include "include/verdict_formats_function.hpp"
#include "core/parser_registry.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
	// Register the built-in parsers before any function can bind
	InitializeAllParsers();

	// Test report table functions
	auto read_test_cases_function = GetReadTestCasesFunction();
	loader.RegisterFunction(read_test_cases_function);

	auto parse_test_cases_function = GetParseTestCasesFunction();
	loader.RegisterFunction(parse_test_cases_function);

	// Scalar utility functions
	auto test_badge_function = GetTestBadgeFunction();
	loader.RegisterFunction(test_badge_function);

	auto test_type_group_function = GetTestTypeGroupFunction();
	loader.RegisterFunction(test_type_group_function);

	// Format discovery function
	auto verdict_formats_function = GetVerdictFormatsFunction();
	loader.RegisterFunction(verdict_formats_function);
}

void VerdictExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}
std::string VerdictExtension::Name() {
	return "verdict";
}

std::string VerdictExtension::Version() const {
#ifdef EXT_VERSION_VERDICT
	return EXT_VERSION_VERDICT;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(verdict, loader) {
	duckdb::LoadInternal(loader);
}

DUCKDB_EXTENSION_API const char *verdict_version() {
	return duckdb::DuckDB::LibraryVersion();
}
}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
