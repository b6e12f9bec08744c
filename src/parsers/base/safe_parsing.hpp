#pragma once

#include <string>
#include <vector>
#include <cctype>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <cstdint>

namespace duckdb {

/**
 * Small string utilities shared by the test result parsers.
 *
 * Test reports embed source locations in free text, so the parsers do a lot of
 * splitting and number parsing on untrusted input. Everything here works with
 * plain find/substr operations; nothing backtracks, and numeric conversions
 * report failure instead of throwing.
 */
namespace SafeParsing {

/**
 * Convert Windows line endings (CRLF) to LF.
 *
 * Lone CR characters are left untouched: JUnit reports only ever carry CRLF
 * when produced on Windows, and a bare CR inside a failure message is content.
 */
inline std::string NormalizeCrlf(const std::string &content) {
	if (content.find('\r') == std::string::npos) {
		return content;
	}

	std::string result;
	result.reserve(content.size());

	for (size_t i = 0; i < content.size(); ++i) {
		if (content[i] == '\r' && i + 1 < content.size() && content[i + 1] == '\n') {
			continue;
		}
		result += content[i];
	}

	return result;
}

/**
 * Split content on a literal (possibly multi-character) separator.
 * Always returns at least one element; empty segments are kept.
 */
inline std::vector<std::string> SplitOn(const std::string &content, const std::string &separator) {
	std::vector<std::string> parts;
	if (separator.empty()) {
		parts.push_back(content);
		return parts;
	}

	size_t start = 0;
	while (true) {
		size_t pos = content.find(separator, start);
		if (pos == std::string::npos) {
			parts.push_back(content.substr(start));
			break;
		}
		parts.push_back(content.substr(start, pos - start));
		start = pos + separator.size();
	}
	return parts;
}

/**
 * Split content on LF and CR characters, the way a line-oriented stream is
 * read when the producer's platform is unknown.
 */
inline std::vector<std::string> SplitLines(const std::string &content) {
	std::vector<std::string> lines;
	size_t start = 0;
	for (size_t i = 0; i < content.size(); ++i) {
		if (content[i] == '\n' || content[i] == '\r') {
			lines.push_back(content.substr(start, i - start));
			start = i + 1;
		}
	}
	lines.push_back(content.substr(start));
	return lines;
}

/**
 * Replace the first occurrence of `from` in content with `to`.
 */
inline std::string ReplaceFirst(const std::string &content, const std::string &from, const std::string &to) {
	if (from.empty()) {
		return content;
	}
	auto pos = content.find(from);
	if (pos == std::string::npos) {
		return content;
	}
	std::string result = content;
	result.replace(pos, from.size(), to);
	return result;
}

/**
 * Check that str is a non-empty run of ASCII digits.
 */
inline bool IsDigits(const std::string &str) {
	if (str.empty()) {
		return false;
	}
	for (char c : str) {
		if (!std::isdigit(static_cast<unsigned char>(c))) {
			return false;
		}
	}
	return true;
}

/**
 * Parse a base-10 integer that must fill the whole string.
 *
 * @param str The string to parse
 * @param result Output: the parsed integer (unchanged on failure)
 * @return true if parsing succeeded, false otherwise (including overflow)
 */
inline bool TryStoi(const std::string &str, int32_t &result) {
	if (str.empty()) {
		return false;
	}
	errno = 0;
	char *end = nullptr;
	long value = std::strtol(str.c_str(), &end, 10);
	if (errno == ERANGE || end != str.c_str() + str.size() || value > INT32_MAX || value < INT32_MIN) {
		return false;
	}
	result = static_cast<int32_t>(value);
	return true;
}

/**
 * Parse a leading floating point number, the way report attributes such as
 * time="0.006241" or duration='10' are read. Trailing garbage is ignored.
 *
 * @param str The string to parse
 * @param result Output: the parsed double (unchanged on failure)
 * @return true if a number was found at the start of str
 */
inline bool TryStod(const std::string &str, double &result) {
	if (str.empty()) {
		return false;
	}
	errno = 0;
	char *end = nullptr;
	double value = std::strtod(str.c_str(), &end);
	if (end == str.c_str() || errno == ERANGE) {
		return false;
	}
	result = value;
	return true;
}

} // namespace SafeParsing
} // namespace duckdb
