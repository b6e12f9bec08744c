#include "file_utils.hpp"
#include "duckdb/common/enums/file_compression_type.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {

// Reports larger than this are refused
static constexpr idx_t MAX_REPORT_BYTES = 100 * 1024 * 1024;
static constexpr idx_t READ_CHUNK_BYTES = 64 * 1024;
static constexpr size_t MAX_PATH_LENGTH = 4096;

static void CheckPath(const std::string &path) {
	if (path.empty()) {
		throw InvalidInputException("Report path must not be empty");
	}
	if (path.size() > MAX_PATH_LENGTH) {
		throw InvalidInputException("Report path exceeds %llu characters", (unsigned long long)MAX_PATH_LENGTH);
	}
	// An embedded NUL would silently truncate the path
	if (path.find('\0') != std::string::npos) {
		throw InvalidInputException("Report path contains a NUL byte");
	}
}

static unique_ptr<FileHandle> OpenForReading(FileSystem &fs, const std::string &path) {
	return fs.OpenFile(path, FileFlags::FILE_FLAGS_READ | FileCompressionType::AUTO_DETECT);
}

std::string ReadContentFromSource(ClientContext &context, const std::string &source) {
	CheckPath(source);

	auto &fs = FileSystem::GetFileSystem(context);
	auto handle = OpenForReading(fs, source);

	// Compressed streams have no usable size, so always read to EOF
	std::string content;
	std::string chunk(READ_CHUNK_BYTES, '\0');
	while (true) {
		auto bytes_read = handle->Read(&chunk[0], READ_CHUNK_BYTES);
		if (bytes_read <= 0) {
			break;
		}
		content.append(chunk.data(), static_cast<size_t>(bytes_read));
		if (content.size() > MAX_REPORT_BYTES) {
			throw InvalidInputException("Report '%s' is larger than the %llu MB limit", source,
			                            (unsigned long long)(MAX_REPORT_BYTES / (1024 * 1024)));
		}
	}

	return content;
}

LineReader::LineReader(FileSystem &fs, const std::string &path) : handle_(OpenForReading(fs, path)) {
}

bool LineReader::Refill() {
	if (exhausted_) {
		return false;
	}
	std::string chunk(READ_CHUNK_BYTES, '\0');
	auto bytes_read = handle_->Read(&chunk[0], READ_CHUNK_BYTES);
	if (bytes_read <= 0) {
		exhausted_ = true;
		return false;
	}
	pending_.append(chunk.data(), static_cast<size_t>(bytes_read));
	return true;
}

bool LineReader::ReadLine(std::string &line) {
	size_t newline;
	while ((newline = pending_.find('\n')) == std::string::npos) {
		if (!Refill()) {
			break;
		}
	}

	if (newline == std::string::npos) {
		// Final line without a terminator
		if (pending_.empty()) {
			return false;
		}
		line.swap(pending_);
		pending_.clear();
	} else {
		line.assign(pending_, 0, newline);
		pending_.erase(0, newline + 1);
	}

	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
	line_number_++;
	return true;
}

FileSystemLineLocator::FileSystemLineLocator(ClientContext &context) : fs_(FileSystem::GetFileSystem(context)) {
}

int32_t FileSystemLineLocator::LineNumberContaining(const std::string &path, const std::string &needle) const {
	if (path.empty() || path.find('\0') != std::string::npos) {
		throw IOException("Cannot look up '%s': invalid source path '%s'", needle, path);
	}

	// A fresh handle per lookup; lookups run concurrently
	LineReader reader(fs_, path);
	std::string line;
	while (reader.ReadLine(line)) {
		if (line.find(needle) != std::string::npos) {
			return reader.LineNumber() - 1;
		}
	}

	throw IOException("No line containing '%s' in '%s'", needle, path);
}

} // namespace duckdb
