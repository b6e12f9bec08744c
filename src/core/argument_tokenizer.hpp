#pragma once

#include <string>
#include <vector>

namespace duckdb {

/**
 * Splits one command-like line into arguments using POSIX shell rules.
 *
 * Used to decode the bracketed payload of a TeamCity service message, e.g.
 *   testFailed name='testFailed' message='Failed asserting that false is true.'
 * becomes
 *   ["testFailed", "name=testFailed", "message=Failed asserting that false is true."]
 *
 * Rules:
 * - unquoted whitespace separates arguments
 * - '...' groups literally
 * - "..." groups; backslash escapes only " \ $ ` and newline inside it
 * - \x outside quotes yields x
 * - adjacent segments join into one argument (key='a b' -> key=a b)
 *
 * An unterminated quote or a trailing lone backslash throws InvalidInputException.
 */
class ArgumentTokenizer {
public:
	static std::vector<std::string> Tokenize(const std::string &line);
};

} // namespace duckdb
