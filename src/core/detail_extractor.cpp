#include "detail_extractor.hpp"
#include "parsers/base/safe_parsing.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

bool DetailExtractor::TryParseDetail(const std::string &token, Detail &detail) {
	auto colon = token.rfind(':');
	if (colon == std::string::npos) {
		return false;
	}

	auto line_str = token.substr(colon + 1);
	if (!SafeParsing::IsDigits(line_str)) {
		return false;
	}

	int32_t line_number;
	if (!SafeParsing::TryStoi(line_str, line_number)) {
		return false;
	}

	detail.file = token.substr(0, colon);
	detail.line = line_number - 1;
	return true;
}

Detail DetailExtractor::ParseDetail(const std::string &token) {
	Detail detail;
	if (!TryParseDetail(token, detail)) {
		throw InvalidInputException("Expected a file:line reference, got '%s'", token);
	}
	return detail;
}

std::vector<Detail> DetailExtractor::Extract(const std::string &text) {
	std::vector<Detail> details;

	for (auto line : SafeParsing::SplitOn(text, "\n")) {
		StringUtil::Trim(line);

		Detail detail;
		if (TryParseDetail(line, detail)) {
			details.push_back(std::move(detail));
		}
	}

	return details;
}

std::string DetailExtractor::FormatDetail(const Detail &detail) {
	return detail.file + ":" + std::to_string(detail.line + 1);
}

} // namespace duckdb
