#pragma once

#include <ytpipe/ytpipe_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <ytpipe/cancellation.hpp>
#include <ytpipe/config.hpp>
#include <ytpipe/download_sink.hpp>
#include <ytpipe/process_runner.hpp>
#include <ytpipe/result.hpp>
#include <ytpipe/types.hpp>

namespace ytpipe {

namespace asio = boost::asio;

/// Entry point for callers: metadata, single and collection downloads,
/// category downloads and the download dir listing.
class YTPIPE_EXPORT Pipeline {
   public:
	Pipeline(const Pipeline &) = delete;
	Pipeline &operator=(const Pipeline &) = delete;
	Pipeline(Pipeline &&) noexcept;
	Pipeline &operator=(Pipeline &&) noexcept;
	~Pipeline();

	using CompletionExecutor = asio::any_completion_executor;

	// Factory method to create an instance bound to an executor. Without a
	// runner, real child processes are spawned.
	static Pipeline create(asio::any_io_executor ex, PipelineConfig config,
						   std::shared_ptr<ProcessRunner> runner = nullptr);

	[[nodiscard]] asio::any_io_executor get_executor() const;
	[[nodiscard]] const PipelineConfig &config() const;

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ResourceInfo>))
				  CompletionToken>
	auto async_fetch_info(std::string ref, CancelToken cancel,
						  CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken, void(Result<ResourceInfo>)>(
			[this, ex, ref = std::move(ref),
			 cancel = std::move(cancel)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);
				fetch_info_impl(
					std::move(ref), std::move(cancel),
					asio::any_completion_handler<void(Result<ResourceInfo>)>(
						std::forward<decltype(handler)>(handler)),
					std::move(handler_ex));
			},
			token);
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ResourceInfo>))
				  CompletionToken>
	auto async_fetch_info(std::string ref, CompletionToken &&token) {
		return async_fetch_info(std::move(ref), CancelToken{},
								std::forward<CompletionToken>(token));
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<CollectionInfo>))
				  CompletionToken>
	auto async_fetch_collection_info(std::string collection_id,
									 CancelToken cancel,
									 CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<CollectionInfo>)>(
			[this, ex, id = std::move(collection_id),
			 cancel = std::move(cancel)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);
				fetch_collection_impl(
					std::move(id), std::move(cancel),
					asio::any_completion_handler<void(Result<CollectionInfo>)>(
						std::forward<decltype(handler)>(handler)),
					std::move(handler_ex));
			},
			token);
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<CollectionInfo>))
				  CompletionToken>
	auto async_fetch_collection_info(std::string collection_id,
									 CompletionToken &&token) {
		return async_fetch_collection_info(
			std::move(collection_id), CancelToken{},
			std::forward<CompletionToken>(token));
	}

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(
		void(Result<std::vector<std::string>>)) CompletionToken>
	auto async_list_formats(std::string ref, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<std::vector<std::string>>)>(
			[this, ex, ref = std::move(ref)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);
				list_formats_impl(
					std::move(ref),
					asio::any_completion_handler<void(
						Result<std::vector<std::string>>)>(
						std::forward<decltype(handler)>(handler)),
					std::move(handler_ex));
			},
			token);
	}

	/// Streams the payload into `sink`. Requests with is_collection set go
	/// through the playlist aggregator, all others through the strategy
	/// engine.
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
				download_impl(
					std::move(request), std::move(sink), std::move(progress),
					std::move(cancel),
					asio::any_completion_handler<void(Result<DownloadSummary>)>(
						std::forward<decltype(handler)>(handler)),
					std::move(handler_ex));
			},
			token);
	}

	/// Category download into the download dir, with progress events.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(
		void(Result<std::filesystem::path>)) CompletionToken>
	auto async_download_with_progress(CategoryDownloadOptions options,
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
				category_download_impl(
					std::move(options), std::move(progress), std::move(cancel),
					asio::any_completion_handler<void(
						Result<std::filesystem::path>)>(
						std::forward<decltype(handler)>(handler)),
					std::move(handler_ex));
			},
			token);
	}

	[[nodiscard]] Result<std::vector<DownloadedFile>> list_downloaded_files(
		DownloadCategory category) const;

	Result<void> ensure_category_dirs() const;

	void clear_caches();

   private:
	struct Impl;
	std::shared_ptr<Impl> pimpl_;

	explicit Pipeline(std::shared_ptr<Impl> impl);

	void fetch_info_impl(
		std::string ref, CancelToken cancel,
		asio::any_completion_handler<void(Result<ResourceInfo>)> handler,
		CompletionExecutor handler_ex);
	void fetch_collection_impl(
		std::string collection_id, CancelToken cancel,
		asio::any_completion_handler<void(Result<CollectionInfo>)> handler,
		CompletionExecutor handler_ex);
	void list_formats_impl(
		std::string ref,
		asio::any_completion_handler<void(Result<std::vector<std::string>>)>
			handler,
		CompletionExecutor handler_ex);
	void download_impl(
		DownloadRequest request, std::shared_ptr<DownloadSink> sink,
		ProgressCallback progress, CancelToken cancel,
		asio::any_completion_handler<void(Result<DownloadSummary>)> handler,
		CompletionExecutor handler_ex);
	void category_download_impl(
		CategoryDownloadOptions options, ProgressCallback progress,
		CancelToken cancel,
		asio::any_completion_handler<void(Result<std::filesystem::path>)>
			handler,
		CompletionExecutor handler_ex);
};

}  // namespace ytpipe
