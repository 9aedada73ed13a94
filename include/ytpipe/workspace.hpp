#pragma once

#include <ytpipe/ytpipe_export.h>

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <vector>
#include <ytpipe/cancellation.hpp>
#include <ytpipe/result.hpp>

namespace ytpipe {

class DownloadSink;

/// Private working directory of one request. Removed with everything in it
/// when the object goes away, whichever way the request ends.
class YTPIPE_EXPORT ScopedWorkspace {
   public:
	ScopedWorkspace(const ScopedWorkspace &) = delete;
	ScopedWorkspace &operator=(const ScopedWorkspace &) = delete;
	ScopedWorkspace(ScopedWorkspace &&other) noexcept;
	ScopedWorkspace &operator=(ScopedWorkspace &&other) noexcept;
	~ScopedWorkspace();

	/// Creates a uniquely named directory `<root>/<prefix><random>`.
	static Result<ScopedWorkspace> create(const std::filesystem::path &root,
										  std::string_view prefix);

	[[nodiscard]] const std::filesystem::path &path() const { return path_; }

	/// Finished regular files, sorted by name. Partial downloads left behind
	/// by the tool (.part, .ytdl) are skipped.
	[[nodiscard]] std::vector<std::filesystem::path> files() const;

   private:
	explicit ScopedWorkspace(std::filesystem::path path);
	void remove();

	std::filesystem::path path_;
};

/// Copies a file into the sink in fixed-size chunks. Stops with
/// errc::cancelled between chunks once `cancel` fires.
YTPIPE_EXPORT Result<std::uint64_t> stream_file(
	const std::filesystem::path &file, DownloadSink &sink,
	const CancelToken &cancel);

}  // namespace ytpipe
