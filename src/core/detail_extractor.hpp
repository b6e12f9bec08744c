#pragma once

#include "include/test_case_types.hpp"
#include <string>
#include <vector>

namespace duckdb {

/**
 * Extracts `file:line` source references from failure messages.
 *
 * A reference is a whole (trimmed) line of the form <file>:<digits>. Only the
 * trailing digits count as the line number, so Windows paths such as
 * C:\src\FooTest.php:20 keep their drive letter in the file part.
 * Line numbers in messages are 1-indexed; Details are 0-indexed.
 */
class DetailExtractor {
public:
	/**
	 * Parse one token. Returns false if it is not a `file:line` reference.
	 */
	static bool TryParseDetail(const std::string &token, Detail &detail);

	/**
	 * Parse one token that must be a `file:line` reference.
	 * Throws InvalidInputException otherwise.
	 */
	static Detail ParseDetail(const std::string &token);

	/**
	 * Scan LF-separated text and return every line that is a reference, in order.
	 */
	static std::vector<Detail> Extract(const std::string &text);

	/**
	 * Render a detail the way it appears in a message (1-indexed line).
	 */
	static std::string FormatDetail(const Detail &detail);
};

} // namespace duckdb
