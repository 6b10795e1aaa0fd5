#include "line_source.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/enums/file_compression_type.hpp"
#include <cstring>

namespace duckdb {
namespace go_report {

static void StripCarriageReturn(std::string &line) {
	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
}

// ============================================================================
// StringLineSource
// ============================================================================

StringLineSource::StringLineSource(std::string content) : content_(std::move(content)), position_(0) {
}

bool StringLineSource::NextLine(std::string &line) {
	if (position_ >= content_.size()) {
		return false;
	}
	auto newline = content_.find('\n', position_);
	if (newline == std::string::npos) {
		line.assign(content_, position_, std::string::npos);
		position_ = content_.size();
	} else {
		line.assign(content_, position_, newline - position_);
		position_ = newline + 1;
	}
	StripCarriageReturn(line);
	return true;
}

// ============================================================================
// StreamLineSource
// ============================================================================

StreamLineSource::StreamLineSource(std::istream &stream) : stream_(stream) {
}

bool StreamLineSource::NextLine(std::string &line) {
	if (std::getline(stream_, line)) {
		StripCarriageReturn(line);
		return true;
	}
	if (stream_.bad() || !stream_.eof()) {
		throw IOException("Failed to read test output: stream is in an error state");
	}
	return false;
}

// ============================================================================
// FileLineSource
// ============================================================================

FileLineSource::FileLineSource(ClientContext &context, const std::string &path) {
	auto &fs = FileSystem::GetFileSystem(context);
	auto flags = FileFlags::FILE_FLAGS_READ | FileCompressionType::AUTO_DETECT;
	file_handle_ = fs.OpenFile(path, flags);
	buffer_.resize(BUFFER_SIZE);
}

void FileLineSource::FillBuffer() {
	if (eof_) {
		return;
	}

	// Move any remaining data to the beginning of the buffer
	if (buffer_pos_ < buffer_end_) {
		size_t remaining = buffer_end_ - buffer_pos_;
		std::memmove(&buffer_[0], &buffer_[buffer_pos_], remaining);
		buffer_end_ = remaining;
	} else {
		buffer_end_ = 0;
	}
	buffer_pos_ = 0;

	size_t space_available = buffer_.size() - buffer_end_;
	if (space_available > 0) {
		auto bytes_read = file_handle_->Read(&buffer_[buffer_end_], space_available);
		if (bytes_read <= 0) {
			eof_ = true;
		} else {
			buffer_end_ += static_cast<size_t>(bytes_read);
		}
	}
}

bool FileLineSource::NextLine(std::string &line) {
	line.clear();
	bool read_any = false;

	while (true) {
		for (size_t i = buffer_pos_; i < buffer_end_; ++i) {
			if (buffer_[i] == '\n') {
				line.append(buffer_.data() + buffer_pos_, i - buffer_pos_);
				buffer_pos_ = i + 1;
				StripCarriageReturn(line);
				return true;
			}
		}

		// No newline in the buffer: keep what we have and read more
		if (buffer_pos_ < buffer_end_) {
			line.append(buffer_.data() + buffer_pos_, buffer_end_ - buffer_pos_);
			read_any = true;
		}
		buffer_pos_ = buffer_end_;

		if (eof_) {
			if (read_any) {
				StripCarriageReturn(line);
			}
			return read_any;
		}
		FillBuffer();
	}
}

} // namespace go_report
} // namespace duckdb
