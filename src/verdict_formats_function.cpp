#include "include/verdict_formats_function.hpp"
#include "core/parser_registry.hpp"
#include "duckdb/common/string_util.hpp"
#include <algorithm>
#include <vector>

namespace duckdb {

struct VerdictFormatsGlobalState : public GlobalTableFunctionState {
	std::vector<ParserInfo> rows;
	idx_t offset = 0;
};

static ParserInfo AutoDetectRow() {
	ParserInfo info;
	info.format_name = "auto";
	info.description = "Detect the format from the report content";
	info.category = "meta";
	info.priority = 0;
	return info;
}

static unique_ptr<FunctionData> VerdictFormatsBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names) {
	names = {"format", "description", "category", "priority", "requires_extension", "aliases"};
	return_types = {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR,
	                LogicalType::INTEGER, LogicalType::VARCHAR, LogicalType::VARCHAR};
	return make_uniq<TableFunctionData>();
}

static unique_ptr<GlobalTableFunctionState> VerdictFormatsInitGlobal(ClientContext &context,
                                                                     TableFunctionInitInput &input) {
	auto state = make_uniq<VerdictFormatsGlobalState>();
	state->rows.push_back(AutoDetectRow());
	for (auto &info : ParserRegistry::getInstance().getAllFormats()) {
		state->rows.push_back(std::move(info));
	}
	return std::move(state);
}

static Value OptionalText(const std::string &text) {
	return text.empty() ? Value() : Value(text);
}

static void VerdictFormatsFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &state = data_p.global_state->Cast<VerdictFormatsGlobalState>();

	idx_t remaining = state.rows.size() - state.offset;
	idx_t count = std::min<idx_t>(remaining, STANDARD_VECTOR_SIZE);
	for (idx_t row = 0; row < count; row++) {
		const auto &info = state.rows[state.offset + row];
		output.SetValue(0, row, Value(info.format_name));
		output.SetValue(1, row, Value(info.description));
		output.SetValue(2, row, Value(info.category));
		output.SetValue(3, row, Value::INTEGER(info.priority));
		output.SetValue(4, row, OptionalText(info.required_extension));
		output.SetValue(5, row, OptionalText(StringUtil::Join(info.aliases, ", ")));
	}
	state.offset += count;
	output.SetCardinality(count);
}

TableFunction GetVerdictFormatsFunction() {
	return TableFunction("verdict_formats", {}, VerdictFormatsFunction, VerdictFormatsBind, VerdictFormatsInitGlobal);
}

} // namespace duckdb
