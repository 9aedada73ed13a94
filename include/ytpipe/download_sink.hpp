#pragma once

#include <ytpipe/ytpipe_export.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iosfwd>
#include <string>
#include <string_view>
#include <ytpipe/result.hpp>

namespace ytpipe {

/// Receives the payload of a download as it is produced. Every byte written
/// before a failure is valid partial data.
class YTPIPE_EXPORT DownloadSink {
   public:
	virtual ~DownloadSink() = default;

	virtual Result<void> write(std::string_view chunk) = 0;

	/// Drops everything written so far. Returns false when the bytes have
	/// already left the process (e.g. sent to a client) and a fallback
	/// attempt can no longer start from scratch.
	virtual bool discard() = 0;
};

/// Writes to a file, truncating it on discard().
class YTPIPE_EXPORT FileSink : public DownloadSink {
   public:
	explicit FileSink(std::filesystem::path path);

	[[nodiscard]] bool is_open() const { return out_.is_open(); }
	[[nodiscard]] const std::filesystem::path &path() const { return path_; }

	Result<void> write(std::string_view chunk) override;
	bool discard() override;

	/// Flushes and closes. Returns file_write_failed if a buffered write failed.
	Result<void> close();

   private:
	std::filesystem::path path_;
	std::ofstream out_;
};

/// Forwards to an ostream such as std::cout. Cannot take bytes back.
class YTPIPE_EXPORT OStreamSink : public DownloadSink {
   public:
	explicit OStreamSink(std::ostream &out) : out_(out) {}

	Result<void> write(std::string_view chunk) override;
	bool discard() override { return written_ == 0; }

	[[nodiscard]] std::uint64_t written() const { return written_; }

   private:
	std::ostream &out_;
	std::uint64_t written_ = 0;
};

/// Keeps the payload in memory.
class YTPIPE_EXPORT MemorySink : public DownloadSink {
   public:
	Result<void> write(std::string_view chunk) override {
		data_.append(chunk);
		return outcome::success();
	}
	bool discard() override {
		data_.clear();
		return true;
	}

	[[nodiscard]] const std::string &data() const { return data_; }

   private:
	std::string data_;
};

}  // namespace ytpipe
