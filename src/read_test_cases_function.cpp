#include "include/read_test_cases_function.hpp"
#include "core/file_utils.hpp"
#include "core/parser_registry.hpp"
#include "core/trace.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include <algorithm>

namespace duckdb {

static LogicalType DetailStructType() {
	child_list_t<LogicalType> children;
	children.push_back(make_pair("file", LogicalType::VARCHAR));
	children.push_back(make_pair("line", LogicalType::INTEGER));
	return LogicalType::STRUCT(children);
}

void GetTestCaseSchema(vector<LogicalType> &return_types, vector<string> &names) {
	return_types = {
	    LogicalType::VARCHAR,                      // name
	    LogicalType::VARCHAR,                      // class
	    LogicalType::VARCHAR,                      // classname
	    LogicalType::VARCHAR,                      // file
	    LogicalType::INTEGER,                      // line (0-indexed)
	    LogicalType::DOUBLE,                       // time
	    LogicalType::VARCHAR,                      // type
	    LogicalType::VARCHAR,                      // type_group
	    LogicalType::VARCHAR,                      // fault_type
	    LogicalType::VARCHAR,                      // fault_message
	    LogicalType::LIST(DetailStructType())      // fault_details
	};

	names = {"name", "class", "classname", "file", "line", "time",
	         "type", "type_group", "fault_type", "fault_message", "fault_details"};
}

static unique_ptr<FunctionData> TestCasesBind(TestCaseSource source_kind, const char *function_name,
                                              TableFunctionBindInput &input, vector<LogicalType> &return_types,
                                              vector<string> &names) {
	auto bind_data = make_uniq<ReadTestCasesBindData>();
	bind_data->source_kind = source_kind;

	if (input.inputs.empty() || input.inputs[0].IsNull()) {
		throw BinderException("%s requires a non-NULL source parameter", function_name);
	}
	bind_data->source = input.inputs[0].ToString();

	// Optional format argument; NULL keeps auto-detection
	if (input.inputs.size() > 1 && !input.inputs[1].IsNull()) {
		std::string format_str = StringUtil::Lower(input.inputs[1].ToString());
		if (format_str != "auto" && !ParserRegistry::getInstance().hasFormat(format_str)) {
			throw BinderException("Unknown format: '%s'. Use 'auto' for auto-detection or see verdict_formats() "
			                      "for supported formats.",
			                      input.inputs[1].ToString());
		}
		bind_data->format = format_str;
	}

	// Handle path_style named parameter
	auto path_style_param = input.named_parameters.find("path_style");
	if (path_style_param != input.named_parameters.end() && !path_style_param->second.IsNull()) {
		try {
			bind_data->path_style = StringToPathStyle(path_style_param->second.ToString());
		} catch (const InvalidInputException &) {
			throw BinderException("Invalid path_style '%s'. Supported: native, unix, windows",
			                      path_style_param->second.ToString());
		}
	}

	GetTestCaseSchema(return_types, names);

	return std::move(bind_data);
}

static unique_ptr<FunctionData> ReadTestCasesBind(ClientContext &context, TableFunctionBindInput &input,
                                                  vector<LogicalType> &return_types, vector<string> &names) {
	return TestCasesBind(TestCaseSource::PATH, "read_test_cases", input, return_types, names);
}

static unique_ptr<FunctionData> ParseTestCasesBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names) {
	return TestCasesBind(TestCaseSource::CONTENT, "parse_test_cases", input, return_types, names);
}

static unique_ptr<GlobalTableFunctionState> TestCasesInitGlobal(ClientContext &context,
                                                                TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<ReadTestCasesBindData>();
	auto global_state = make_uniq<ReadTestCasesGlobalState>();

	std::string content;
	if (bind_data.source_kind == TestCaseSource::PATH) {
		// Relative paths resolve like any other DuckDB file read
		content = ReadContentFromSource(context, bind_data.source);
	} else {
		content = bind_data.source;
	}

	auto &registry = ParserRegistry::getInstance();
	std::string format = bind_data.format;
	if (format == "auto") {
		auto detected = registry.findParser(content);
		if (!detected) {
			throw InvalidInputException("Could not detect the test report format; pass it explicitly, e.g. "
			                            "'junit' or 'teamcity'");
		}
		format = detected->getFormatName();
	}

	ParserConfig config;
	config.path_style = bind_data.path_style;
	auto parser = registry.createParser(format, config);

	VERDICT_TRACE("Parsing " << content.size() << " bytes as " << parser->getFormatName());
	global_state->test_cases = parser->parseWithContext(context, content);

	return std::move(global_state);
}

static Value DetailsToValue(const std::vector<Detail> &details) {
	vector<Value> entries;
	entries.reserve(details.size());
	for (const auto &detail : details) {
		child_list_t<Value> fields;
		fields.push_back(make_pair("file", Value(detail.file)));
		fields.push_back(make_pair("line", Value::INTEGER(detail.line)));
		entries.push_back(Value::STRUCT(std::move(fields)));
	}
	return Value::LIST(DetailStructType(), std::move(entries));
}

static void TestCasesFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &state = data_p.global_state->Cast<ReadTestCasesGlobalState>();

	idx_t total = state.test_cases.size();
	if (state.current_row >= total) {
		output.SetCardinality(0);
		return;
	}

	idx_t rows_to_output = std::min<idx_t>(STANDARD_VECTOR_SIZE, total - state.current_row);
	output.SetCardinality(rows_to_output);

	for (idx_t i = 0; i < rows_to_output; i++) {
		const TestCase &test_case = state.test_cases[state.current_row + i];

		output.SetValue(0, i, test_case.has_name ? Value(test_case.name) : Value());
		output.SetValue(1, i, Value(test_case.class_name));
		output.SetValue(2, i, test_case.has_classname ? Value(test_case.classname) : Value());
		output.SetValue(3, i, Value(test_case.file));
		output.SetValue(4, i, Value::INTEGER(test_case.line));
		output.SetValue(5, i, Value::DOUBLE(test_case.time));
		output.SetValue(6, i, Value(TestCaseTypeToString(test_case.type)));
		output.SetValue(7, i, Value(TestCaseTypeToString(GetTypeGroup(test_case.type))));

		if (test_case.has_fault) {
			const Fault &fault = test_case.fault;
			output.SetValue(8, i, fault.has_type ? Value(fault.type) : Value());
			output.SetValue(9, i, Value(fault.message));
			output.SetValue(10, i, DetailsToValue(fault.details));
		} else {
			output.SetValue(8, i, Value());
			output.SetValue(9, i, Value());
			output.SetValue(10, i, Value());
		}
	}

	state.current_row += rows_to_output;
}

static TableFunctionSet MakeTestCasesFunctionSet(const std::string &name, table_function_bind_t bind) {
	TableFunctionSet set(name);

	// Single argument version: name(source) - auto-detects format
	TableFunction single_arg(name, {LogicalType::VARCHAR}, TestCasesFunction, bind, TestCasesInitGlobal);
	single_arg.named_parameters["path_style"] = LogicalType::VARCHAR;
	set.AddFunction(single_arg);

	// Two argument version: name(source, format)
	TableFunction two_arg(name, {LogicalType::VARCHAR, LogicalType::VARCHAR}, TestCasesFunction, bind,
	                      TestCasesInitGlobal);
	two_arg.named_parameters["path_style"] = LogicalType::VARCHAR;
	set.AddFunction(two_arg);

	return set;
}

TableFunctionSet GetReadTestCasesFunction() {
	return MakeTestCasesFunctionSet("read_test_cases", ReadTestCasesBind);
}

TableFunctionSet GetParseTestCasesFunction() {
	return MakeTestCasesFunctionSet("parse_test_cases", ParseTestCasesBind);
}

} // namespace duckdb
