#include <spdlog/spdlog.h>

#include <ytpipe/download_engine.hpp>
#include <ytpipe/playlist_aggregator.hpp>
#include <ytpipe/progress.hpp>
#include <ytpipe/workspace.hpp>

#include "async_task.hpp"
#include "tool/arguments.hpp"
#include "tool/error_classifier.hpp"

namespace ytpipe {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kArchiveName = "playlist.zip";

}  // namespace

PlaylistAggregator::PlaylistAggregator(asio::any_io_executor ex,
									   std::shared_ptr<ProcessRunner> runner,
									   PipelineConfig config)
	: ex_(std::move(ex)),
	  runner_(std::move(runner)),
	  config_(std::move(config)) {}

PlaylistAggregator::~PlaylistAggregator() = default;

Result<DownloadSummary> PlaylistAggregator::download(
	const DownloadRequest &request, DownloadSink &sink,
	const ProgressCallback &progress, const CancelToken &cancel,
	asio::yield_context yield) {
	DownloadRequest batch = request;
	batch.is_collection = true;
	if (auto valid = validate_request(batch); valid.has_error()) {
		spdlog::error("Rejected playlist download: {}", valid.error().message());
		return valid.error();
	}
	if (cancel.cancelled()) return make_error_code(errc::cancelled);

	auto ws = ScopedWorkspace::create(config_.effective_work_dir(),
									  "ytpipe-playlist-");
	if (ws.has_error()) return ws.error();
	const auto &dir = ws.value().path();

	spdlog::info("Downloading {} playlist items into {}",
				 request.member_ids.size(), dir.string());

	ProgressChannel channel("batch", progress, config_.progress_interval);

	ProcessRequest req;
	req.program = config_.yt_dlp_path;
	req.args = tool::batch_args(config_.tool, request.format_id, dir,
								request.member_ids);
	req.working_dir = dir;
	req.cancel = cancel;
	req.on_line = [&channel](std::string_view line) { channel.feed_line(line); };

	auto res = runner_->async_run(std::move(req), yield);
	if (res.has_error()) return res.error();

	// Per-item errors are ignored by the tool; the files decide the outcome
	if (!res.value().succeeded()) {
		spdlog::warn("Playlist batch exited with code {}: {}",
					 res.value().exit_code,
					 tool::stderr_tail(res.value().captured_stderr));
	}

	auto files = ws.value().files();
	if (files.empty()) {
		spdlog::error("No files were downloaded from the playlist");
		return make_error_code(errc::nothing_downloaded);
	}

	DownloadSummary summary;
	summary.strategy = "batch";

	if (files.size() == 1) {
		spdlog::info("Playlist produced one file, passing it through");
		auto streamed = stream_file(files.front(), sink, cancel);
		if (streamed.has_error()) return streamed.error();

		channel.complete();
		summary.bytes = streamed.value();
		summary.delivery = DeliveryKind::single_file;
		summary.file_name = files.front().filename().string();
		return summary;
	}

	if (cancel.cancelled()) return make_error_code(errc::cancelled);

	auto archive = dir / kArchiveName;
	spdlog::info("Bundling {} files into {}", files.size(), archive.string());

	ProcessRequest zip;
	zip.program = config_.archiver_path;
	zip.args = tool::archive_args(archive, files);
	zip.cancel = cancel;

	auto zipped = runner_->async_run(std::move(zip), yield);
	if (zipped.has_error()) {
		if (zipped.error() == make_error_code(errc::cancelled)) {
			return zipped.error();
		}
		spdlog::error("Archiver could not run: {}", zipped.error().message());
		return make_error_code(errc::archive_failed);
	}
	if (!zipped.value().succeeded()) {
		spdlog::error("Archiver exited with code {}: {}",
					  zipped.value().exit_code,
					  tool::stderr_tail(zipped.value().captured_stderr));
		return make_error_code(errc::archive_failed);
	}

	std::error_code ec;
	if (!fs::is_regular_file(archive, ec)) {
		spdlog::error("Archiver reported success but wrote no archive");
		return make_error_code(errc::archive_failed);
	}

	auto streamed = stream_file(archive, sink, cancel);
	if (streamed.has_error()) return streamed.error();

	channel.complete();
	summary.bytes = streamed.value();
	summary.delivery = DeliveryKind::archive;
	summary.file_name = std::string(kArchiveName);
	return summary;
}

void PlaylistAggregator::download_impl(
	DownloadRequest request, std::shared_ptr<DownloadSink> sink,
	ProgressCallback progress, CancelToken cancel,
	asio::any_completion_handler<void(Result<DownloadSummary>)> handler,
	CompletionExecutor handler_ex) {
	detail::spawn_task<DownloadSummary>(
		ex_, "playlist download",
		[this, request = std::move(request), sink = std::move(sink),
		 progress = std::move(progress),
		 cancel = std::move(cancel)](asio::yield_context yield) {
			return download(request, *sink, progress, cancel, yield);
		},
		std::move(handler), std::move(handler_ex));
}

}  // namespace ytpipe
