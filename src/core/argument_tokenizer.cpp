#include "argument_tokenizer.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {

static bool IsShellWhitespace(char c) {
	return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Characters a backslash may escape inside double quotes
static bool IsDoubleQuoteEscapable(char c) {
	return c == '"' || c == '\\' || c == '$' || c == '`' || c == '\n';
}

std::vector<std::string> ArgumentTokenizer::Tokenize(const std::string &line) {
	enum class State { NORMAL, SINGLE_QUOTED, DOUBLE_QUOTED };

	std::vector<std::string> args;
	std::string current;
	bool in_argument = false;
	State state = State::NORMAL;

	for (size_t i = 0; i < line.size(); ++i) {
		char c = line[i];

		switch (state) {
		case State::NORMAL:
			if (IsShellWhitespace(c)) {
				if (in_argument) {
					args.push_back(current);
					current.clear();
					in_argument = false;
				}
			} else if (c == '\'') {
				state = State::SINGLE_QUOTED;
				in_argument = true;
			} else if (c == '"') {
				state = State::DOUBLE_QUOTED;
				in_argument = true;
			} else if (c == '\\') {
				if (i + 1 >= line.size()) {
					throw InvalidInputException("Trailing backslash in arguments: %s", line);
				}
				// Escaped newline is a line continuation
				if (line[i + 1] != '\n') {
					current += line[i + 1];
					in_argument = true;
				}
				++i;
			} else {
				current += c;
				in_argument = true;
			}
			break;

		case State::SINGLE_QUOTED:
			if (c == '\'') {
				state = State::NORMAL;
			} else {
				current += c;
			}
			break;

		case State::DOUBLE_QUOTED:
			if (c == '"') {
				state = State::NORMAL;
			} else if (c == '\\' && i + 1 < line.size() && IsDoubleQuoteEscapable(line[i + 1])) {
				if (line[i + 1] != '\n') {
					current += line[i + 1];
				}
				++i;
			} else {
				current += c;
			}
			break;
		}
	}

	if (state != State::NORMAL) {
		throw InvalidInputException("Unterminated %s quote in arguments: %s",
		                            state == State::SINGLE_QUOTED ? "single" : "double", line);
	}

	if (in_argument) {
		args.push_back(current);
	}

	return args;
}

} // namespace duckdb
