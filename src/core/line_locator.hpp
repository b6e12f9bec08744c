#pragma once

#include <string>
#include <cstdint>

namespace duckdb {

/**
 * Finds the line of a source file that contains a piece of text.
 *
 * Passing tests in a TeamCity stream carry no line number, so the parser asks
 * a locator for the line declaring the test method. Implementations must be
 * safe to call from several threads at once.
 */
class LineLocator {
public:
	virtual ~LineLocator() = default;

	/**
	 * Return the 0-indexed number of the first line of `path` containing
	 * `needle`. Throws IOException if the file cannot be read or no line matches.
	 */
	virtual int32_t LineNumberContaining(const std::string &path, const std::string &needle) const = 0;
};

} // namespace duckdb
