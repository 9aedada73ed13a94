#pragma once

#include <ytpipe/ytpipe_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/spawn.hpp>
#include <filesystem>
#include <memory>
#include <vector>
#include <ytpipe/cancellation.hpp>
#include <ytpipe/config.hpp>
#include <ytpipe/process_runner.hpp>
#include <ytpipe/result.hpp>
#include <ytpipe/types.hpp>

namespace ytpipe {

namespace asio = boost::asio;

/// Persistent downloads under the download dir, one folder per category:
/// VideoWithAudio, VideoOnly, AudioOnly, SubtitlesOnly.
class YTPIPE_EXPORT Library {
   public:
	using CompletionExecutor = asio::any_completion_executor;

	Library(const Library &) = delete;
	Library &operator=(const Library &) = delete;

	Library(asio::any_io_executor ex, std::shared_ptr<ProcessRunner> runner,
			PipelineConfig config);
	~Library();

	[[nodiscard]] asio::any_io_executor get_executor() const { return ex_; }

	[[nodiscard]] std::filesystem::path folder(DownloadCategory category) const;

	Result<void> ensure_category_dirs() const;

	/// Regular files of one category folder, sorted by name. A missing
	/// folder lists as empty.
	[[nodiscard]] Result<std::vector<DownloadedFile>> list_downloaded_files(
		DownloadCategory category) const;

	/// Resolves with the path of the written file (the category folder when
	/// the tool did not announce one).
	Result<std::filesystem::path> download_to_category(
		const CategoryDownloadOptions &options,
		const ProgressCallback &progress, const CancelToken &cancel,
		asio::yield_context yield);

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(
		void(Result<std::filesystem::path>)) CompletionToken>
	auto async_download_to_category(CategoryDownloadOptions options,
									ProgressCallback progress,
									CancelToken cancel,
									CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<std::filesystem::path>)>(
			[this, ex, options = std::move(options),
			 progress = std::move(progress),
			 cancel = std::move(cancel)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler = asio::any_completion_handler<void(
					Result<std::filesystem::path>)>{
					std::forward<decltype(handler)>(handler)};

				download_impl(std::move(options), std::move(progress),
							  std::move(cancel), std::move(any_handler),
							  std::move(handler_ex));
			},
			token);
	}

   private:
	asio::any_io_executor ex_;
	std::shared_ptr<ProcessRunner> runner_;
	PipelineConfig config_;

	void download_impl(
		CategoryDownloadOptions options, ProgressCallback progress,
		CancelToken cancel,
		asio::any_completion_handler<void(Result<std::filesystem::path>)>
			handler,
		CompletionExecutor handler_ex);
};

}  // namespace ytpipe
