#include <spdlog/spdlog.h>

#include <boost/asio/bind_executor.hpp>
#include <utility>
#include <ytpipe/download_engine.hpp>
#include <ytpipe/info_service.hpp>
#include <ytpipe/library.hpp>
#include <ytpipe/pipeline.hpp>
#include <ytpipe/playlist_aggregator.hpp>

#include "async_task.hpp"

namespace ytpipe {

struct Pipeline::Impl {
	asio::any_io_executor ex;
	PipelineConfig config;
	std::shared_ptr<ProcessRunner> runner;
	std::shared_ptr<InfoService> info;
	std::unique_ptr<DownloadEngine> engine;
	std::unique_ptr<PlaylistAggregator> aggregator;
	std::unique_ptr<Library> library;

	Impl(asio::any_io_executor ex_, PipelineConfig config_,
		 std::shared_ptr<ProcessRunner> runner_)
		: ex(std::move(ex_)),
		  config(std::move(config_)),
		  runner(std::move(runner_)) {
		if (!runner) runner = std::make_shared<SubprocessRunner>(ex);

		info = std::make_shared<InfoService>(ex, runner, config);
		engine = std::make_unique<DownloadEngine>(
			ex, info, DownloadEngine::default_strategies(runner, config));
		aggregator = std::make_unique<PlaylistAggregator>(ex, runner, config);
		library = std::make_unique<Library>(ex, runner, config);
	}
};

Pipeline::Pipeline(std::shared_ptr<Impl> impl) : pimpl_(std::move(impl)) {}
Pipeline::~Pipeline() = default;
Pipeline::Pipeline(Pipeline &&) noexcept = default;
Pipeline &Pipeline::operator=(Pipeline &&) noexcept = default;

Pipeline Pipeline::create(asio::any_io_executor ex, PipelineConfig config,
						  std::shared_ptr<ProcessRunner> runner) {
	return Pipeline(std::make_shared<Impl>(std::move(ex), std::move(config),
										   std::move(runner)));
}

asio::any_io_executor Pipeline::get_executor() const { return pimpl_->ex; }

const PipelineConfig &Pipeline::config() const { return pimpl_->config; }

Result<std::vector<DownloadedFile>> Pipeline::list_downloaded_files(
	DownloadCategory category) const {
	return pimpl_->library->list_downloaded_files(category);
}

Result<void> Pipeline::ensure_category_dirs() const {
	return pimpl_->library->ensure_category_dirs();
}

void Pipeline::clear_caches() { pimpl_->info->clear_caches(); }

void Pipeline::fetch_info_impl(
	std::string ref, CancelToken cancel,
	asio::any_completion_handler<void(Result<ResourceInfo>)> handler,
	CompletionExecutor handler_ex) {
	pimpl_->info->async_fetch_info(
		std::move(ref), std::move(cancel),
		asio::bind_executor(handler_ex, std::move(handler)));
}

void Pipeline::fetch_collection_impl(
	std::string collection_id, CancelToken cancel,
	asio::any_completion_handler<void(Result<CollectionInfo>)> handler,
	CompletionExecutor handler_ex) {
	pimpl_->info->async_fetch_collection_info(
		std::move(collection_id), std::move(cancel),
		asio::bind_executor(handler_ex, std::move(handler)));
}

void Pipeline::list_formats_impl(
	std::string ref,
	asio::any_completion_handler<void(Result<std::vector<std::string>>)>
		handler,
	CompletionExecutor handler_ex) {
	pimpl_->info->async_list_formats(
		std::move(ref), asio::bind_executor(handler_ex, std::move(handler)));
}

void Pipeline::download_impl(
	DownloadRequest request, std::shared_ptr<DownloadSink> sink,
	ProgressCallback progress, CancelToken cancel,
	asio::any_completion_handler<void(Result<DownloadSummary>)> handler,
	CompletionExecutor handler_ex) {
	detail::spawn_task<DownloadSummary>(
		pimpl_->ex, "download",
		[impl = pimpl_, request = std::move(request), sink = std::move(sink),
		 progress = std::move(progress),
		 cancel = std::move(cancel)](asio::yield_context yield) {
			if (request.is_collection) {
				spdlog::info("Routing {} playlist items to the aggregator",
							 request.member_ids.size());
				return impl->aggregator->download(request, *sink, progress,
												  cancel, yield);
			}
			return impl->engine->download(request, *sink, progress, cancel,
										  yield);
		},
		std::move(handler), std::move(handler_ex));
}

void Pipeline::category_download_impl(
	CategoryDownloadOptions options, ProgressCallback progress,
	CancelToken cancel,
	asio::any_completion_handler<void(Result<std::filesystem::path>)> handler,
	CompletionExecutor handler_ex) {
	detail::spawn_task<std::filesystem::path>(
		pimpl_->ex, "category download",
		[impl = pimpl_, options = std::move(options),
		 progress = std::move(progress),
		 cancel = std::move(cancel)](asio::yield_context yield) {
			return impl->library->download_to_category(options, progress,
													   cancel, yield);
		},
		std::move(handler), std::move(handler_ex));
}

}  // namespace ytpipe
