#pragma once

#include <ytpipe/ytpipe_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/spawn.hpp>
#include <memory>
#include <ytpipe/cancellation.hpp>
#include <ytpipe/config.hpp>
#include <ytpipe/download_sink.hpp>
#include <ytpipe/process_runner.hpp>
#include <ytpipe/result.hpp>
#include <ytpipe/types.hpp>

namespace ytpipe {

namespace asio = boost::asio;

/// Downloads the members of a collection with one batch call into a private
/// working directory. One resulting file is passed through as is; two or
/// more are bundled into a zip archive first. The working directory and the
/// archive are removed on every exit path.
class YTPIPE_EXPORT PlaylistAggregator {
   public:
	using CompletionExecutor = asio::any_completion_executor;

	PlaylistAggregator(const PlaylistAggregator &) = delete;
	PlaylistAggregator &operator=(const PlaylistAggregator &) = delete;

	PlaylistAggregator(asio::any_io_executor ex,
					   std::shared_ptr<ProcessRunner> runner,
					   PipelineConfig config);
	~PlaylistAggregator();

	[[nodiscard]] asio::any_io_executor get_executor() const { return ex_; }

	Result<DownloadSummary> download(const DownloadRequest &request,
									 DownloadSink &sink,
									 const ProgressCallback &progress,
									 const CancelToken &cancel,
									 asio::yield_context yield);

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<DownloadSummary>))
				  CompletionToken>
	auto async_download(DownloadRequest request,
						std::shared_ptr<DownloadSink> sink,
						ProgressCallback progress, CancelToken cancel,
						CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<DownloadSummary>)>(
			[this, ex, request = std::move(request), sink = std::move(sink),
			 progress = std::move(progress),
			 cancel = std::move(cancel)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<DownloadSummary>)>{
						std::forward<decltype(handler)>(handler)};

				download_impl(std::move(request), std::move(sink),
							  std::move(progress), std::move(cancel),
							  std::move(any_handler), std::move(handler_ex));
			},
			token);
	}

   private:
	asio::any_io_executor ex_;
	std::shared_ptr<ProcessRunner> runner_;
	PipelineConfig config_;

	void download_impl(
		DownloadRequest request, std::shared_ptr<DownloadSink> sink,
		ProgressCallback progress, CancelToken cancel,
		asio::any_completion_handler<void(Result<DownloadSummary>)> handler,
		CompletionExecutor handler_ex);
};

}  // namespace ytpipe
