#include <spdlog/spdlog.h>

#include <boost/scope_exit.hpp>
#include <optional>
#include <ytpipe/download_engine.hpp>
#include <ytpipe/format_normalizer.hpp>
#include <ytpipe/progress.hpp>
#include <ytpipe/workspace.hpp>

#include "tool/arguments.hpp"
#include "tool/error_classifier.hpp"

namespace ytpipe {

namespace fs = std::filesystem;

namespace {

std::error_code tool_failure(std::string_view tag, const ProcessResult &res) {
	auto reason = tool::classify_tool_error(res.captured_stderr);
	spdlog::error("{} download exited with code {}: {}", tag, res.exit_code,
				  tool::stderr_tail(res.captured_stderr));
	return make_error_code(reason);
}

}  // namespace

DirectStreamStrategy::DirectStreamStrategy(
	std::shared_ptr<ProcessRunner> runner, PipelineConfig config)
	: runner_(std::move(runner)), config_(std::move(config)) {}

// mp3 variants are transcoded after the download, which stdout cannot carry
bool DirectStreamStrategy::accepts(const DownloadRequest &request) const {
	return !mp3_bitrate_of(request.format_id).has_value();
}

Result<std::uint64_t> DirectStreamStrategy::attempt(const AttemptContext &ctx,
													 asio::yield_context yield) {
	const auto &request = ctx.request;
	ProgressChannel channel(std::string(tag()), ctx.progress,
							config_.progress_interval);

	// Caption files are written next to the tool, not to stdout
	std::optional<ScopedWorkspace> scratch;
	if (request.captions) {
		auto ws = ScopedWorkspace::create(config_.effective_work_dir(),
										  "ytpipe-direct-");
		if (ws.has_error()) return ws.error();
		scratch.emplace(std::move(ws).value());
	}

	// Cancelled by the caller, or by us when the sink stops accepting data
	CancelToken attempt_cancel;
	CancelToken caller_cancel = ctx.cancel;
	auto reg = caller_cancel.on_cancel(
		[attempt_cancel]() mutable { attempt_cancel.cancel(); });
	BOOST_SCOPE_EXIT_ALL(&) { caller_cancel.remove(reg); };

	std::uint64_t written = 0;
	std::optional<std::error_code> write_error;

	ProcessRequest req;
	req.program = config_.yt_dlp_path;
	req.args = tool::direct_stream_args(config_.tool, ctx.locator,
										request.format_id, request.trim,
										request.captions);
	if (scratch) req.working_dir = scratch->path();
	req.cancel = attempt_cancel;
	req.on_line = [&channel](std::string_view line) { channel.feed_line(line); };
	req.stdout_sink = [&](std::string_view chunk) {
		if (write_error) return;
		auto res = ctx.sink.write(chunk);
		if (res.has_error()) {
			write_error = res.error();
			attempt_cancel.cancel();
			return;
		}
		written += chunk.size();
	};

	auto res = runner_->async_run(std::move(req), yield);
	if (write_error) {
		spdlog::error("Writing download output failed: {}",
					  write_error->message());
		return *write_error;
	}
	if (res.has_error()) return res.error();
	if (!res.value().succeeded()) return tool_failure(tag(), res.value());

	if (written == 0) {
		spdlog::warn("Direct download produced no data");
		return make_error_code(errc::empty_result);
	}

	channel.complete();
	return written;
}

FileBufferedStrategy::FileBufferedStrategy(
	std::shared_ptr<ProcessRunner> runner, PipelineConfig config)
	: runner_(std::move(runner)), config_(std::move(config)) {}

Result<std::uint64_t> FileBufferedStrategy::attempt(const AttemptContext &ctx,
													 asio::yield_context yield) {
	const auto &request = ctx.request;
	ProgressChannel channel(std::string(tag()), ctx.progress,
							config_.progress_interval);

	auto ws =
		ScopedWorkspace::create(config_.effective_work_dir(), "ytpipe-file-");
	if (ws.has_error()) return ws.error();
	const auto &dir = ws.value().path();

	ProcessRequest req;
	req.program = config_.yt_dlp_path;
	req.args = tool::file_buffered_args(config_.tool, ctx.locator,
										request.format_id,
										dir / "download.%(ext)s", request.trim,
										request.captions);
	req.working_dir = dir;
	req.cancel = ctx.cancel;
	req.on_line = [&channel](std::string_view line) { channel.feed_line(line); };

	auto res = runner_->async_run(std::move(req), yield);
	if (res.has_error()) return res.error();
	if (!res.value().succeeded()) return tool_failure(tag(), res.value());

	// Caption files sit next to the media file; the media file is the largest
	std::optional<fs::path> media;
	std::uintmax_t media_size = 0;
	for (const auto &file : ws.value().files()) {
		std::error_code ec;
		auto size = fs::file_size(file, ec);
		if (!ec && (!media || size > media_size)) {
			media = file;
			media_size = size;
		}
	}

	if (!media || media_size == 0) {
		spdlog::warn("No data downloaded to temporary file");
		return make_error_code(errc::empty_result);
	}

	spdlog::debug("Streaming {} ({} bytes)", media->string(), media_size);
	auto streamed = stream_file(*media, ctx.sink, ctx.cancel);
	if (streamed.has_error()) return streamed.error();

	channel.complete();
	return streamed.value();
}

}  // namespace ytpipe
