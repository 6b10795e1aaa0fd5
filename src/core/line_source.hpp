#pragma once

#include "duckdb.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/common/file_system.hpp"
#include <istream>
#include <string>

namespace duckdb {
namespace go_report {

/**
 * Sequential source of text lines for the report parser.
 *
 * Lines are split on '\n' and handed out without the terminator; a trailing
 * '\r' is dropped. A last line without a newline is still returned.
 * Implementations throw IOException when the underlying read fails.
 */
class LineSource {
public:
	virtual ~LineSource() = default;

	/**
	 * Read the next line.
	 * @param line Output: the next line, without its terminator
	 * @return true if a line was read, false at end of input
	 */
	virtual bool NextLine(std::string &line) = 0;
};

// Lines of an in-memory string (parse_go_test_report, tests)
class StringLineSource : public LineSource {
public:
	explicit StringLineSource(std::string content);

	bool NextLine(std::string &line) override;

private:
	std::string content_;
	size_t position_;
};

// Lines of a std::istream. A stream that goes bad, or fails before reaching EOF, raises IOException.
class StreamLineSource : public LineSource {
public:
	explicit StreamLineSource(std::istream &stream);

	bool NextLine(std::string &line) override;

private:
	std::istream &stream_;
};

/**
 * Buffered line reader over DuckDB's FileSystem.
 * Handles compression transparently (.gz, .zst) and reads pipes such as
 * /dev/stdin until EOF without knowing the size up front.
 */
class FileLineSource : public LineSource {
public:
	FileLineSource(ClientContext &context, const std::string &path);

	bool NextLine(std::string &line) override;

private:
	unique_ptr<FileHandle> file_handle_;
	std::string buffer_;
	size_t buffer_pos_ = 0;
	size_t buffer_end_ = 0;
	bool eof_ = false;

	static constexpr size_t BUFFER_SIZE = 65536; // 64KB buffer

	// Fill the buffer with more data from the file
	void FillBuffer();
};

} // namespace go_report
} // namespace duckdb
