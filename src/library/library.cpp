#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <ytpipe/library.hpp>
#include <ytpipe/progress.hpp>
#include <ytpipe/resource_ref.hpp>

#include "async_task.hpp"
#include "tool/arguments.hpp"
#include "tool/error_classifier.hpp"

namespace ytpipe {

namespace fs = std::filesystem;

namespace {

constexpr std::array<DownloadCategory, 4> kCategories{
	DownloadCategory::video_with_audio, DownloadCategory::video_only,
	DownloadCategory::audio_only, DownloadCategory::captions_only};

bool is_digits(std::string_view s) {
	return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
		return c >= '0' && c <= '9';
	});
}

}  // namespace

std::string_view category_folder(DownloadCategory category) {
	switch (category) {
		case DownloadCategory::video_with_audio: return "VideoWithAudio";
		case DownloadCategory::video_only: return "VideoOnly";
		case DownloadCategory::audio_only: return "AudioOnly";
		case DownloadCategory::captions_only: return "SubtitlesOnly";
	}
	return "VideoWithAudio";
}

std::optional<DownloadCategory> parse_category(std::string_view name) {
	if (name == "video-with-audio" || name == "VideoWithAudio" ||
		name == "video") {
		return DownloadCategory::video_with_audio;
	}
	if (name == "video-only" || name == "VideoOnly") {
		return DownloadCategory::video_only;
	}
	if (name == "audio-only" || name == "AudioOnly" || name == "audio") {
		return DownloadCategory::audio_only;
	}
	if (name == "captions-only" || name == "SubtitlesOnly" ||
		name == "subtitles") {
		return DownloadCategory::captions_only;
	}
	return std::nullopt;
}

Library::Library(asio::any_io_executor ex,
				 std::shared_ptr<ProcessRunner> runner, PipelineConfig config)
	: ex_(std::move(ex)),
	  runner_(std::move(runner)),
	  config_(std::move(config)) {}

Library::~Library() = default;

fs::path Library::folder(DownloadCategory category) const {
	return config_.download_dir / category_folder(category);
}

Result<void> Library::ensure_category_dirs() const {
	for (auto category : kCategories) {
		std::error_code ec;
		fs::create_directories(folder(category), ec);
		if (ec) {
			spdlog::error("Cannot create {}: {}", folder(category).string(),
						  ec.message());
			return make_error_code(errc::file_open_failed);
		}
	}
	return outcome::success();
}

Result<std::vector<DownloadedFile>> Library::list_downloaded_files(
	DownloadCategory category) const {
	std::vector<DownloadedFile> files;
	auto dir = folder(category);

	std::error_code ec;
	if (!fs::exists(dir, ec)) return files;

	for (const auto &entry : fs::directory_iterator(dir, ec)) {
		if (!entry.is_regular_file(ec)) continue;
		auto name = entry.path().filename().string();
		files.push_back(
			{name, (fs::path(category_folder(category)) / name).generic_string()});
	}
	if (ec) {
		spdlog::error("Cannot list {}: {}", dir.string(), ec.message());
		return make_error_code(errc::file_open_failed);
	}

	std::sort(files.begin(), files.end(),
			  [](const DownloadedFile &a, const DownloadedFile &b) {
				  return a.name < b.name;
			  });
	return files;
}

Result<fs::path> Library::download_to_category(
	const CategoryDownloadOptions &options, const ProgressCallback &progress,
	const CancelToken &cancel, asio::yield_context yield) {
	if (!is_supported_locator(options.url)) {
		spdlog::error("Invalid YouTube URL: {}", options.url);
		return make_error_code(errc::invalid_resource_ref);
	}
	if (options.resolution && !is_digits(*options.resolution)) {
		return make_error_code(errc::invalid_format);
	}
	if (options.audio_quality) {
		const auto &q = *options.audio_quality;
		if (q != "128" && q != "192" && q != "256" && q != "320") {
			return make_error_code(errc::invalid_format);
		}
	}

	if (auto dirs = ensure_category_dirs(); dirs.has_error()) {
		return dirs.error();
	}
	if (cancel.cancelled()) return make_error_code(errc::cancelled);

	auto target = folder(options.category);
	spdlog::info("Downloading {} into {}", options.url, target.string());

	ProgressChannel channel(std::string(category_folder(options.category)),
							progress, config_.progress_interval);
	std::optional<std::string> destination;

	ProcessRequest req;
	req.program = config_.yt_dlp_path;
	req.args = tool::category_args(config_, options, target);
	req.cancel = cancel;
	req.on_line = [&](std::string_view line) {
		if (channel.feed_line(line)) return;
		if (auto dest = parse_destination_line(line)) {
			destination = std::move(dest);
		}
	};

	auto res = runner_->async_run(std::move(req), yield);
	if (res.has_error()) return res.error();
	if (!res.value().succeeded()) {
		auto reason = tool::classify_tool_error(res.value().captured_stderr);
		spdlog::error("Download failed with code {}: {}", res.value().exit_code,
					  tool::stderr_tail(res.value().captured_stderr));
		return make_error_code(reason);
	}

	channel.complete();

	if (!destination) return target;
	fs::path out(*destination);
	spdlog::info("Download complete: {}", out.string());
	return out;
}

void Library::download_impl(
	CategoryDownloadOptions options, ProgressCallback progress,
	CancelToken cancel,
	asio::any_completion_handler<void(Result<fs::path>)> handler,
	CompletionExecutor handler_ex) {
	detail::spawn_task<fs::path>(
		ex_, "category download",
		[this, options = std::move(options), progress = std::move(progress),
		 cancel = std::move(cancel)](asio::yield_context yield) {
			return download_to_category(options, progress, cancel, yield);
		},
		std::move(handler), std::move(handler_ex));
}

}  // namespace ytpipe
