#include "teamcity_parser.hpp"
#include "core/argument_tokenizer.hpp"
#include "core/detail_extractor.hpp"
#include "core/file_utils.hpp"
#include "core/trace.hpp"
#include "parsers/base/safe_parsing.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include <cstring>
#include <future>

namespace duckdb {

static constexpr const char *SERVICE_MESSAGE_MARKER = "##teamcity";
static constexpr const char *SERVICE_MESSAGE_PREFIX = "##teamcity[";
static constexpr const char *LOCATION_HINT_SCHEME = "php_qn://";
static constexpr const char *DETAIL_SEPARATOR = "|n";

static bool IsBookkeepingEvent(const std::string &type) {
	return type == "testCount" || type == "testSuiteStarted" || type == "testSuiteFinished";
}

static TestCaseType OutcomeToType(const std::string &event_type) {
	if (event_type == "testPassed") return TestCaseType::PASSED;
	if (event_type == "testFailed") return TestCaseType::FAILURE;
	if (event_type == "testIgnored") return TestCaseType::SKIPPED;
	throw InvalidInputException("Unexpected TeamCity event '%s' between testStarted and testFinished", event_type);
}

TeamCityParser::TeamCityParser(ParserConfig config)
    : BaseParser("teamcity", "TeamCity service messages (phpunit --teamcity)", std::move(config),
                 ParserPriority::HIGH) {
	addAlias("teamcity_text");
}

bool TeamCityParser::canParse(const std::string &content) const {
	return content.find(SERVICE_MESSAGE_PREFIX) != std::string::npos &&
	       content.find("testStarted") != std::string::npos;
}

std::vector<ServiceMessage> TeamCityParser::ParseServiceMessages(const std::string &content) {
	std::vector<ServiceMessage> messages;

	for (auto line : SafeParsing::SplitLines(content)) {
		if (!StringUtil::StartsWith(line, SERVICE_MESSAGE_MARKER)) {
			continue;
		}

		StringUtil::Trim(line);
		if (StringUtil::StartsWith(line, SERVICE_MESSAGE_PREFIX)) {
			line = line.substr(std::strlen(SERVICE_MESSAGE_PREFIX));
		}
		if (StringUtil::EndsWith(line, "]")) {
			line.pop_back();
		}
		line = StringUtil::Replace(line, "\\", "/");

		auto argv = ArgumentTokenizer::Tokenize(line);
		if (argv.empty()) {
			continue;
		}

		ServiceMessage message;
		message.type = argv[0];
		for (size_t i = 1; i < argv.size(); i++) {
			auto eq = argv[i].find('=');
			if (eq == std::string::npos) {
				message.options[argv[i]] = "";
			} else {
				message.options[argv[i].substr(0, eq)] = argv[i].substr(eq + 1);
			}
		}

		if (IsBookkeepingEvent(message.type)) {
			continue;
		}
		messages.push_back(std::move(message));
	}

	return messages;
}

std::vector<std::vector<ServiceMessage>> TeamCityParser::GroupByTest(const std::vector<ServiceMessage> &messages) {
	std::vector<std::vector<ServiceMessage>> groups;
	std::vector<ServiceMessage> current;

	for (const auto &message : messages) {
		current.push_back(message);

		if (message.type == "testFinished") {
			if (current.size() == 2) {
				ServiceMessage passed;
				passed.type = "testPassed";
				current.insert(current.begin() + 1, std::move(passed));
			}
			groups.push_back(std::move(current));
			current.clear();
		}
	}

	if (!current.empty()) {
		throw InvalidInputException("Truncated TeamCity stream: '%s' event without a matching testFinished",
		                            current.front().type);
	}

	return groups;
}

std::vector<Detail> TeamCityParser::ConvertToDetails(const std::string &content) const {
	std::vector<Detail> details;

	for (auto segment : SafeParsing::SplitOn(content, DETAIL_SEPARATOR)) {
		StringUtil::Trim(segment);
		if (segment.empty()) {
			continue;
		}

		auto detail = DetailExtractor::ParseDetail(segment);
		detail.file = renamePath(detail.file);
		details.push_back(std::move(detail));
	}

	return details;
}

TestCase TeamCityParser::ConvertToTestCase(const std::vector<ServiceMessage> &group) const {
	const auto &start = group.front();
	const auto &outcome = group[1];
	const auto &finish = group.back();

	if (!start.Has("locationHint")) {
		throw InvalidInputException("TeamCity '%s' event has no locationHint", start.type);
	}

	// php_qn://<file>::<class>::<name>
	auto location = start.Get("locationHint");
	StringUtil::Trim(location);
	if (StringUtil::StartsWith(location, LOCATION_HINT_SCHEME)) {
		location = location.substr(std::strlen(LOCATION_HINT_SCHEME));
	}
	location = SafeParsing::ReplaceFirst(location, "::/", "::");

	auto parts = SafeParsing::SplitOn(location, "::");
	if (parts.size() != 3) {
		throw InvalidInputException("Malformed TeamCity locationHint '%s': expected file::class::method",
		                            start.Get("locationHint"));
	}

	TestCase test_case;
	test_case.file = renamePath(parts[0]);
	test_case.class_name = parts[1];
	test_case.name = parts[2];
	test_case.has_name = true;
	test_case.type = OutcomeToType(outcome.type);
	SafeParsing::TryStod(finish.Get("duration"), test_case.time);

	if (test_case.type == TestCaseType::PASSED) {
		// Line is resolved later from the source file
		return test_case;
	}

	// PHPUnit puts the locations in "details"; plain emitters use "message"
	auto details = ConvertToDetails(outcome.Has("details") ? outcome.Get("details") : outcome.Get("message"));
	if (!details.empty()) {
		test_case.file = details[0].file;
		test_case.line = details[0].line;
	}

	test_case.has_fault = true;
	test_case.fault.message = outcome.Get("message");
	for (auto &detail : details) {
		if (detail.file != test_case.file) {
			test_case.fault.details.push_back(std::move(detail));
		}
	}

	return test_case;
}

std::vector<TestCase> TeamCityParser::parse(const std::string &content) const {
	return parseWithLocator(content, getConfig().line_locator.get());
}

std::vector<TestCase> TeamCityParser::parseWithContext(ClientContext &context, const std::string &content) const {
	if (getConfig().line_locator) {
		return parseWithLocator(content, getConfig().line_locator.get());
	}
	FileSystemLineLocator locator(context);
	return parseWithLocator(content, &locator);
}

std::vector<TestCase> TeamCityParser::parseWithLocator(const std::string &content, const LineLocator *locator) const {
	auto messages = ParseServiceMessages(content);
	auto groups = GroupByTest(messages);
	VERDICT_TRACE("teamcity: " << messages.size() << " events in " << groups.size() << " tests");

	std::vector<TestCase> test_cases;
	test_cases.reserve(groups.size());
	for (const auto &group : groups) {
		test_cases.push_back(ConvertToTestCase(group));
	}

	// Line lookups for passing tests are independent; run them concurrently
	// and join in report order
	std::vector<std::pair<size_t, std::future<int32_t>>> lookups;
	for (size_t i = 0; i < test_cases.size(); i++) {
		const auto &test_case = test_cases[i];
		if (test_case.type != TestCaseType::PASSED) {
			continue;
		}
		if (!locator) {
			throw InvalidInputException("Resolving the line of passing test '%s' requires a line locator",
			                            test_case.name);
		}
		auto file = test_case.file;
		auto needle = "function " + test_case.name;
		lookups.emplace_back(i, std::async(std::launch::async, [locator, file, needle]() {
			                     return locator->LineNumberContaining(file, needle);
		                     }));
	}

	for (auto &lookup : lookups) {
		test_cases[lookup.first].line = lookup.second.get();
	}

	return test_cases;
}

} // namespace duckdb
