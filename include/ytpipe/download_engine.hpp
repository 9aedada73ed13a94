#pragma once

#include <ytpipe/ytpipe_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/spawn.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <ytpipe/cancellation.hpp>
#include <ytpipe/config.hpp>
#include <ytpipe/download_sink.hpp>
#include <ytpipe/info_service.hpp>
#include <ytpipe/process_runner.hpp>
#include <ytpipe/result.hpp>
#include <ytpipe/types.hpp>

namespace ytpipe {

namespace asio = boost::asio;

/// Everything one strategy attempt needs. Owned by the engine for the
/// duration of the attempt.
struct YTPIPE_EXPORT AttemptContext {
	const DownloadRequest &request;
	std::string locator;
	DownloadSink &sink;
	ProgressCallback progress;
	CancelToken cancel;
};

/// One way of getting the bytes of a selected format out of the
/// acquisition tool. Returns the number of bytes written to the sink.
class YTPIPE_EXPORT DownloadStrategy {
   public:
	virtual ~DownloadStrategy() = default;

	[[nodiscard]] virtual std::string_view tag() const = 0;

	/// False when this strategy cannot produce the requested format; the
	/// engine then moves on without spawning anything.
	[[nodiscard]] virtual bool accepts(const DownloadRequest &) const {
		return true;
	}

	virtual Result<std::uint64_t> attempt(const AttemptContext &ctx,
										  asio::yield_context yield) = 0;
};

/// Tool writes the format to stdout, piped straight into the sink.
class YTPIPE_EXPORT DirectStreamStrategy : public DownloadStrategy {
   public:
	DirectStreamStrategy(std::shared_ptr<ProcessRunner> runner,
						 PipelineConfig config);

	[[nodiscard]] std::string_view tag() const override { return "direct"; }
	[[nodiscard]] bool accepts(const DownloadRequest &request) const override;

	Result<std::uint64_t> attempt(const AttemptContext &ctx,
								  asio::yield_context yield) override;

   private:
	std::shared_ptr<ProcessRunner> runner_;
	PipelineConfig config_;
};

/// Tool writes into a private working directory; the finished file is then
/// streamed into the sink and the directory removed.
class YTPIPE_EXPORT FileBufferedStrategy : public DownloadStrategy {
   public:
	FileBufferedStrategy(std::shared_ptr<ProcessRunner> runner,
						 PipelineConfig config);

	[[nodiscard]] std::string_view tag() const override { return "file"; }

	Result<std::uint64_t> attempt(const AttemptContext &ctx,
								  asio::yield_context yield) override;

   private:
	std::shared_ptr<ProcessRunner> runner_;
	PipelineConfig config_;
};

/// Checks that need no external process: ids, trim range, caption request,
/// placeholder format ids.
YTPIPE_EXPORT Result<void> validate_request(const DownloadRequest &request);

// =============================================================================
// DOWNLOAD ENGINE
// =============================================================================
// Single-item downloads. Validates the request, checks the format against
// the catalog, then tries the strategies strictly in order, one at a time:
//
//   Idle -> Attempting(i) -> Succeeded
//                         -> AttemptFailed(i) -> Attempting(i + 1) | Failed
//
// Only retryable failures move on to the next strategy. Nothing is retried
// after cancellation.
// =============================================================================

class YTPIPE_EXPORT DownloadEngine {
   public:
	using Strategies = std::vector<std::unique_ptr<DownloadStrategy>>;
	using CompletionExecutor = asio::any_completion_executor;

	DownloadEngine(const DownloadEngine &) = delete;
	DownloadEngine &operator=(const DownloadEngine &) = delete;

	DownloadEngine(asio::any_io_executor ex, std::shared_ptr<InfoService> info,
				   Strategies strategies);
	~DownloadEngine();

	/// Direct stream first, then file-buffered.
	static Strategies default_strategies(std::shared_ptr<ProcessRunner> runner,
										 const PipelineConfig &config);

	[[nodiscard]] asio::any_io_executor get_executor() const { return ex_; }

	/// Runs inside the caller's coroutine.
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
	std::shared_ptr<InfoService> info_;
	Strategies strategies_;

	void download_impl(
		DownloadRequest request, std::shared_ptr<DownloadSink> sink,
		ProgressCallback progress, CancelToken cancel,
		asio::any_completion_handler<void(Result<DownloadSummary>)> handler,
		CompletionExecutor handler_ex);
};

}  // namespace ytpipe
