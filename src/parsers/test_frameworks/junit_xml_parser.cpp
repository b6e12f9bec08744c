#include "junit_xml_parser.hpp"
#include "core/detail_extractor.hpp"
#include "parsers/base/safe_parsing.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "yyjson.hpp"

namespace duckdb {

using namespace duckdb_yyjson;

// RAII guard for the parsed JSON document
struct YyjsonDocGuard {
	yyjson_doc *doc;
	~YyjsonDocGuard() {
		if (doc) {
			yyjson_doc_free(doc);
		}
	}
};

// Forward declarations for helper functions
static void ParseTestSuiteFromJson(yyjson_val *suite, std::vector<TestCase> &test_cases);
static TestCase ParseTestCaseFromJson(yyjson_val *testcase);

JUnitXmlParser::JUnitXmlParser(ParserConfig config)
    : XmlParserBase("junit", "JUnit XML test reports (PHPUnit --log-junit and compatible)", std::move(config),
                    ParserPriority::VERY_HIGH) {
	addAlias("junit_xml");
}

bool JUnitXmlParser::canParse(const std::string &content) const {
	auto root = RootElementName(content);
	return root == "testsuites" || root == "testsuite";
}

std::vector<TestCase> JUnitXmlParser::parseJsonContent(const std::string &json_content) const {
	std::vector<TestCase> test_cases;

	YyjsonDocGuard guard {yyjson_read(json_content.c_str(), json_content.length(), 0)};
	if (!guard.doc) {
		throw InvalidInputException("Malformed JUnit report: converted XML is not valid JSON");
	}

	yyjson_val *root = yyjson_doc_get_root(guard.doc);
	if (!root || !yyjson_is_obj(root)) {
		throw InvalidInputException("Malformed JUnit report: missing root element");
	}

	// <testsuites> wraps the suites; a bare <testsuite> root is its own container
	yyjson_val *testsuites = yyjson_obj_get(root, "testsuites");
	ParseTestSuiteFromJson(testsuites ? testsuites : root, test_cases);

	return test_cases;
}

// Call fn for a child that is either a single object or an array of objects
template <class FUNC>
static void ForEachChild(yyjson_val *children, FUNC &&fn) {
	if (!children) {
		return;
	}
	if (yyjson_is_arr(children)) {
		size_t idx, max;
		yyjson_val *child;
		yyjson_arr_foreach(children, idx, max, child) {
			fn(child);
		}
	} else {
		fn(children);
	}
}

static void ParseTestSuiteFromJson(yyjson_val *suite, std::vector<TestCase> &test_cases) {
	if (!suite || !yyjson_is_obj(suite)) {
		return;
	}

	yyjson_val *nested = yyjson_obj_get(suite, "testsuite");
	if (nested) {
		ForEachChild(nested, [&](yyjson_val *child) { ParseTestSuiteFromJson(child, test_cases); });
		return;
	}

	yyjson_val *testcases = yyjson_obj_get(suite, "testcase");
	ForEachChild(testcases, [&](yyjson_val *child) { test_cases.push_back(ParseTestCaseFromJson(child)); });
}

// Read a scalar attribute as text. Returns false if it is absent.
static bool GetAttribute(yyjson_val *node, const char *key, std::string &out) {
	if (!node || !yyjson_is_obj(node)) {
		return false;
	}
	yyjson_val *val = yyjson_obj_get(node, key);
	if (!val) {
		return false;
	}
	if (yyjson_is_str(val)) {
		out = yyjson_get_str(val);
	} else if (yyjson_is_int(val)) {
		out = std::to_string(yyjson_get_int(val));
	} else if (yyjson_is_real(val)) {
		out = std::to_string(yyjson_get_real(val));
	} else if (yyjson_is_bool(val)) {
		out = yyjson_get_bool(val) ? "true" : "false";
	} else {
		return false;
	}
	return true;
}

// Element text: "#text" of an element with attributes, or the value itself
static std::string GetElementText(yyjson_val *node) {
	if (!node) {
		return "";
	}
	if (yyjson_is_str(node)) {
		return yyjson_get_str(node);
	}
	std::string text;
	GetAttribute(node, "#text", text);
	return text;
}

// First element of a possibly repeated child
static yyjson_val *FirstChild(yyjson_val *testcase, const char *key) {
	yyjson_val *child = yyjson_obj_get(testcase, key);
	if (child && yyjson_is_arr(child)) {
		return yyjson_arr_get_first(child);
	}
	return child;
}

static TestCaseType ClassifyErrorType(const std::string &declared_type) {
	auto error_type = StringUtil::Lower(declared_type);

	if (StringUtil::Contains(error_type, "skipped")) {
		return TestCaseType::SKIPPED;
	}
	if (StringUtil::Contains(error_type, "incomplete")) {
		return TestCaseType::INCOMPLETE;
	}
	if (StringUtil::Contains(error_type, "failed")) {
		return TestCaseType::FAILED;
	}
	return TestCaseType::ERROR;
}

static TestCase ParseTestCaseFromJson(yyjson_val *testcase) {
	TestCase test_case;

	if (!testcase || !yyjson_is_obj(testcase)) {
		// <testcase/> with neither attributes nor children
		return test_case;
	}

	test_case.has_name = GetAttribute(testcase, "@name", test_case.name) && !test_case.name.empty();
	GetAttribute(testcase, "@class", test_case.class_name);
	test_case.has_classname =
	    GetAttribute(testcase, "@classname", test_case.classname) && !test_case.classname.empty();
	GetAttribute(testcase, "@file", test_case.file);

	std::string line_str;
	int32_t line_number = 1;
	if (GetAttribute(testcase, "@line", line_str) && !SafeParsing::TryStoi(line_str, line_number)) {
		line_number = 1;
	}
	test_case.line = line_number - 1;

	std::string time_str;
	if (GetAttribute(testcase, "@time", time_str)) {
		SafeParsing::TryStod(time_str, test_case.time);
	}

	// Fault node by priority: error > warning > failure > skipped/incomplete
	yyjson_val *fault_node = nullptr;
	if ((fault_node = FirstChild(testcase, "error"))) {
		std::string declared_type;
		GetAttribute(fault_node, "@type", declared_type);
		test_case.type = ClassifyErrorType(declared_type);
	} else if ((fault_node = FirstChild(testcase, "warning"))) {
		test_case.type = TestCaseType::WARNING;
	} else if ((fault_node = FirstChild(testcase, "failure"))) {
		test_case.type = TestCaseType::FAILURE;
	} else if (yyjson_obj_get(testcase, "skipped") || yyjson_obj_get(testcase, "incomplete")) {
		test_case.type = TestCaseType::SKIPPED;
		test_case.has_fault = true;
		test_case.fault.type = "skipped";
		test_case.fault.has_type = true;
		return test_case;
	} else {
		return test_case;
	}

	auto message = SafeParsing::NormalizeCrlf(GetElementText(fault_node));
	auto details = DetailExtractor::Extract(message);

	for (const auto &detail : details) {
		message = SafeParsing::ReplaceFirst(message, DetailExtractor::FormatDetail(detail), "");
		StringUtil::Trim(message);
	}
	StringUtil::Trim(message);

	// The last detail inside the test's own file is the real failure site
	const auto nominal_file = test_case.file;
	for (const auto &detail : details) {
		if (detail.file == nominal_file) {
			test_case.file = detail.file;
			test_case.line = detail.line;
		}
	}

	test_case.has_fault = true;
	test_case.fault.has_type = true;
	GetAttribute(fault_node, "@type", test_case.fault.type);
	test_case.fault.message = message;
	for (auto &detail : details) {
		if (detail.file != nominal_file) {
			test_case.fault.details.push_back(std::move(detail));
		}
	}

	return test_case;
}

} // namespace duckdb
