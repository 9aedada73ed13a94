#include <fmt/format.h>

#include <ytpipe/format_normalizer.hpp>
#include <ytpipe/resource_ref.hpp>

#include "tool/arguments.hpp"

namespace ytpipe::tool {

namespace {

void append(Args &args, std::initializer_list<std::string_view> items) {
	for (auto item : items) args.emplace_back(item);
}

void add_network_flags(Args &args, const ToolOptions &opts) {
	if (opts.force_ipv4) args.emplace_back("--force-ipv4");
	if (opts.geo_bypass) args.emplace_back("--geo-bypass");
	if (opts.no_check_certificates) {
		args.emplace_back("--no-check-certificates");
	}
}

void add_identity_flags(Args &args, const ToolOptions &opts) {
	for (const auto &[key, value] : opts.headers) {
		args.emplace_back("--add-header");
		args.emplace_back(fmt::format("{}:{}", key, value));
	}
	append(args, {"--user-agent", opts.user_agent});
	if (!opts.extractor_args.empty()) {
		append(args, {"--extractor-args", opts.extractor_args});
	}
}

// Flags shared by the metadata dumps
void add_dump_flags(Args &args, const ToolOptions &opts) {
	add_network_flags(args, opts);
	append(args, {"--extractor-retries", std::to_string(opts.retries),
				  "--ignore-errors", "--no-warnings"});
}

void add_retry_flags(Args &args, const ToolOptions &opts) {
	append(args, {"--extractor-retries", std::to_string(opts.retries),
				  "--fragment-retries", std::to_string(opts.fragment_retries),
				  "--retry-sleep", std::to_string(opts.retry_sleep)});
}

void add_request_options(Args &args, const std::optional<TrimRange> &trim,
						 const std::optional<CaptionRequest> &captions) {
	if (trim) {
		append(args, {"--download-sections",
					  fmt::format("*{}-{}", trim->start, trim->end)});
	}
	if (captions) {
		append(args, {"--write-subs", "--sub-langs", captions->lang,
					  "--sub-format", captions->format});
	}
}

// mp3 variants have no tool id: extract the best audio at their bitrate
void add_format_selection(Args &args, std::string_view format_id,
						  bool merge_mp4) {
	if (auto kbps = mp3_bitrate_of(format_id)) {
		append(args, {"-f", "bestaudio", "-x", "--audio-format", "mp3",
					  "--audio-quality", fmt::format("{}K", *kbps)});
		return;
	}
	append(args, {"-f", format_id});
	if (merge_mp4) append(args, {"--merge-output-format", "mp4"});
}

}  // namespace

Args info_args(const ToolOptions &opts, std::string_view locator) {
	Args args{"--dump-json", "--no-playlist"};
	add_dump_flags(args, opts);
	append(args, {"--skip-download", "--write-subs", "--write-auto-subs",
				  "--sub-langs", "all", "--prefer-free-formats"});
	add_identity_flags(args, opts);
	args.emplace_back(locator);
	return args;
}

Args audio_estimate_args(const ToolOptions &opts, std::string_view locator,
					  int bitrate) {
	Args args{"--dump-json", "--no-playlist"};
	add_dump_flags(args, opts);
	append(args, {"--skip-download", "--extract-audio", "--audio-format",
				  "mp3", "--audio-quality", fmt::format("{}K", bitrate)});
	add_identity_flags(args, opts);
	args.emplace_back(locator);
	return args;
}

Args collection_args(const ToolOptions &opts, std::string_view collection_id) {
	Args args{"--dump-json", "--flat-playlist"};
	add_dump_flags(args, opts);
	add_identity_flags(args, opts);
	args.emplace_back(collection_url(collection_id));
	return args;
}

Args list_formats_args(const ToolOptions &opts, std::string_view locator) {
	Args args{"--list-formats", "--no-playlist"};
	add_network_flags(args, opts);
	append(args, {"--no-warnings"});
	add_identity_flags(args, opts);
	args.emplace_back(locator);
	return args;
}

Args direct_stream_args(const ToolOptions &opts, std::string_view locator,
						std::string_view format_id,
						const std::optional<TrimRange> &trim,
						const std::optional<CaptionRequest> &captions) {
	Args args{"--no-playlist", "-f", std::string(format_id), "-o", "-"};
	add_network_flags(args, opts);
	args.emplace_back("--no-warnings");
	add_retry_flags(args, opts);
	append(args, {"--throttled-rate", opts.throttled_rate, "--buffer-size",
				  opts.buffer_size, "--socket-timeout",
				  std::to_string(opts.socket_timeout),
				  "--concurrent-fragments",
				  std::to_string(opts.concurrent_fragments)});
	add_identity_flags(args, opts);
	args.emplace_back(locator);
	add_request_options(args, trim, captions);
	return args;
}

Args file_buffered_args(const ToolOptions &opts, std::string_view locator,
						std::string_view format_id,
						const std::filesystem::path &output,
						const std::optional<TrimRange> &trim,
						const std::optional<CaptionRequest> &captions) {
	Args args{"--no-playlist"};
	add_format_selection(args, format_id, true);
	append(args, {"-o", output.string(), "--newline"});
	add_network_flags(args, opts);
	append(args, {"--ignore-errors", "--no-warnings"});
	add_retry_flags(args, opts);
	append(args, {"--throttled-rate", opts.file_throttled_rate,
				  "--buffer-size", opts.file_buffer_size, "--socket-timeout",
				  std::to_string(opts.socket_timeout)});
	args.emplace_back(locator);
	add_request_options(args, trim, captions);
	return args;
}

Args batch_args(const ToolOptions &opts, std::string_view format_id,
				const std::filesystem::path &dir,
				const std::vector<std::string> &member_ids) {
	Args args;
	add_format_selection(args, format_id, false);
	add_network_flags(args, opts);
	append(args, {"--ignore-errors", "--newline", "--output",
				  (dir / "%(title)s.%(ext)s").string()});
	for (const auto &id : member_ids) args.push_back(watch_url(id));
	return args;
}

std::string audio_quality_scale(std::string_view kbps) {
	if (kbps == "320") return "0";
	if (kbps == "256") return "1";
	if (kbps == "192") return "2";
	if (kbps == "128") return "3";
	return "2";
}

Args category_args(const PipelineConfig &config,
				   const CategoryDownloadOptions &options,
				   const std::filesystem::path &folder) {
	const auto &defaults = config.defaults;
	auto resolution = options.resolution.value_or(defaults.resolution);
	auto audio_quality = options.audio_quality.value_or(defaults.audio_quality);
	auto caption_lang =
		options.caption_language.value_or(defaults.caption_language);

	Args args;
	add_network_flags(args, config.tool);
	args.emplace_back("--no-warnings");
	if (config.ffmpeg_location) {
		append(args, {"--ffmpeg-location", *config.ffmpeg_location});
	}
	append(args,
		   {"--concurrent-fragments",
			std::to_string(defaults.max_concurrent_fragments), "--retries",
			std::to_string(config.tool.fragment_retries), "--fragment-retries",
			std::to_string(config.tool.fragment_retries), "--continue",
			"--newline",
			options.collection ? "--yes-playlist" : "--no-playlist"});

	switch (options.category) {
		case DownloadCategory::video_with_audio:
			append(args,
				   {"-f",
					fmt::format("best[ext=mp4][height<={0}]/"
								"bestvideo[ext=mp4][height<={0}]+"
								"bestaudio[ext=m4a]",
								resolution),
					"--merge-output-format", "mp4", "--write-sub",
					"--write-auto-sub", "--sub-lang", caption_lang,
					"--convert-subs", "srt", "-o",
					(folder / fmt::format("%(title)s_{}p_%(id)s.%(ext)s",
										  resolution))
						.string()});
			break;
		case DownloadCategory::video_only:
			append(args,
				   {"-f",
					fmt::format("bestvideo[ext=mp4][height<={}]", resolution),
					"-o",
					(folder / fmt::format("%(title)s_{}p_video_%(id)s.%(ext)s",
										  resolution))
						.string()});
			break;
		case DownloadCategory::audio_only:
			append(args,
				   {"-x", "--audio-format", "mp3", "--audio-quality",
					audio_quality_scale(audio_quality), "-o",
					(folder / fmt::format("%(title)s_{}kbps_%(id)s.%(ext)s",
										  audio_quality))
						.string()});
			break;
		case DownloadCategory::captions_only:
			append(args,
				   {"--skip-download", "--write-sub", "--write-auto-sub",
					"--sub-lang", caption_lang, "--convert-subs", "srt", "-o",
					(folder / "%(title)s_%(id)s.%(ext)s").string()});
			break;
	}

	args.push_back(options.url);
	return args;
}

Args archive_args(const std::filesystem::path &archive,
				  const std::vector<std::filesystem::path> &files) {
	Args args{"-j", archive.string()};
	for (const auto &f : files) args.push_back(f.string());
	return args;
}

}  // namespace ytpipe::tool
