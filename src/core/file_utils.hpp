#pragma once

#include <string>
#include "duckdb/main/client_context.hpp"
#include "duckdb/common/file_system.hpp"
#include "core/line_locator.hpp"

namespace duckdb {

/**
 * Read a whole report through the DuckDB file system.
 * Compressed inputs (.gz, .zst) are decompressed transparently.
 * Throws InvalidInputException for an invalid path or a report over the size
 * limit; open and read failures surface as IOException.
 */
std::string ReadContentFromSource(ClientContext &context, const std::string &source);

// Sequential line access to one file. Line endings (LF or CRLF) are stripped.
class LineReader {
public:
	LineReader(FileSystem &fs, const std::string &path);

	// Fetch the next line; false once the file is exhausted
	bool ReadLine(std::string &line);

	// 1-based number of the line last returned by ReadLine
	int32_t LineNumber() const {
		return line_number_;
	}

private:
	unique_ptr<FileHandle> handle_;
	std::string pending_;
	int32_t line_number_ = 0;
	bool exhausted_ = false;

	bool Refill();
};

/**
 * LineLocator over the DuckDB file system, so source lookups honor the same
 * paths (and virtual file systems) as the report itself.
 */
class FileSystemLineLocator : public LineLocator {
public:
	explicit FileSystemLineLocator(ClientContext &context);

	int32_t LineNumberContaining(const std::string &path, const std::string &needle) const override;

private:
	FileSystem &fs_;
};

} // namespace duckdb
