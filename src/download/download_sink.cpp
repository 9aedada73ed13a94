#include <spdlog/spdlog.h>

#include <ostream>
#include <ytpipe/download_sink.hpp>

namespace ytpipe {

FileSink::FileSink(std::filesystem::path path)
	: path_(std::move(path)),
	  out_(path_, std::ios::binary | std::ios::trunc) {
	if (!out_) spdlog::error("Could not open {} for writing", path_.string());
}

Result<void> FileSink::write(std::string_view chunk) {
	if (!out_) return make_error_code(errc::file_write_failed);
	out_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
	if (!out_) return make_error_code(errc::file_write_failed);
	return outcome::success();
}

bool FileSink::discard() {
	out_.close();
	out_.open(path_, std::ios::binary | std::ios::trunc);
	return static_cast<bool>(out_);
}

Result<void> FileSink::close() {
	if (!out_.is_open()) return outcome::success();
	out_.flush();
	bool ok = static_cast<bool>(out_);
	out_.close();
	if (!ok) return make_error_code(errc::file_write_failed);
	return outcome::success();
}

Result<void> OStreamSink::write(std::string_view chunk) {
	out_.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
	if (!out_) return make_error_code(errc::file_write_failed);
	written_ += chunk.size();
	return outcome::success();
}

}  // namespace ytpipe
