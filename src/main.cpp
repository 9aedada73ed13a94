#include <fmt/color.h>
#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <ytpipe/config.hpp>
#include <ytpipe/download_sink.hpp>
#include <ytpipe/info_service.hpp>
#include <ytpipe/pipeline.hpp>
#include <ytpipe/resource_ref.hpp>

#include "utils.hpp"

namespace po = boost::program_options;
namespace asio = boost::asio;
namespace fs = std::filesystem;

// =============================================================================
// Format Table Printing
// =============================================================================

void print_formats_table(const std::vector<ytpipe::FormatVariant> &formats) {
	constexpr double MIB = 1024.0 * 1024.0;

	fmt::println("{:<22} {:<5} {:<8} {:<5} {:<5} {:>10}  {}", "ID", "EXT",
				 "QUALITY", "AUDIO", "VIDEO", "FILESIZE", "LABEL");

	for (const auto &f : formats) {
		auto size = f.filesize > 0
						? fmt::format("~{:.2f}MiB",
									  static_cast<double>(f.filesize) / MIB)
						: std::string("~");
		auto quality = f.has_video ? fmt::format("{}p", f.height)
								   : fmt::format("{}k", f.audio_bitrate);
		auto row = fmt::format("{:<22} {:<5} {:<8} {:<5} {:<5} {:>10}  {}",
							   f.format_id, f.extension, quality,
							   f.has_audio ? "yes" : "no",
							   f.has_video ? "yes" : "no", size, f.quality_label);

		// Placeholders are listed but cannot be downloaded
		if (f.is_placeholder()) {
			fmt::print(fg(fmt::color::dim_gray), "{}\n", row);
		} else {
			fmt::println("{}", row);
		}
	}
}

// =============================================================================
// CLI Application using Coroutines
// =============================================================================

struct CliOptions {
	std::string url;
	std::optional<std::string> format;

	std::optional<long long> start;
	std::optional<long long> end;
	std::optional<std::string> sub_lang;
	std::string sub_format = "srt";

	bool collection = false;
	std::vector<std::string> items;

	std::optional<std::string> output;	// "-" for stdout

	std::optional<ytpipe::DownloadCategory> category;
	std::optional<std::string> resolution;
	std::optional<std::string> audio_quality;

	bool dump_json = false;
	bool list_formats = false;
	bool raw_formats = false;
};

void print_progress(const ytpipe::ProgressEvent &event) {
	fmt::print(stderr, "\r[download] {:5.1f}% at {:>12} ETA {:<8} ({})",
			   event.percent, event.rate, event.eta, event.strategy);
	if (event.percent >= 100.0) fmt::print(stderr, "\n");
}

std::vector<std::string> split_items(const std::string &text) {
	std::vector<std::string> items;
	std::size_t pos = 0;
	while (pos <= text.size()) {
		auto comma = text.find(',', pos);
		if (comma == std::string::npos) comma = text.size();
		auto item = ytpipe::utils::trim(
			std::string_view(text).substr(pos, comma - pos));
		if (!item.empty()) items.emplace_back(item);
		pos = comma + 1;
	}
	return items;
}

// First downloadable variant carrying both streams, else the first real one
std::optional<std::string> default_format(
	const std::vector<ytpipe::FormatVariant> &formats) {
	for (const auto &f : formats) {
		if (!f.is_placeholder() && f.has_audio && f.has_video) {
			return f.format_id;
		}
	}
	for (const auto &f : formats) {
		if (!f.is_placeholder()) return f.format_id;
	}
	return std::nullopt;
}

int run_category_download(ytpipe::Pipeline &pipeline, const CliOptions &opts,
						  const ytpipe::CancelToken &cancel,
						  asio::yield_context yield) {
	ytpipe::CategoryDownloadOptions options;
	options.url = opts.url;
	options.category = *opts.category;
	options.resolution = opts.resolution;
	options.audio_quality = opts.audio_quality;
	options.caption_language = opts.sub_lang;
	options.collection = opts.collection;

	auto res = pipeline.async_download_with_progress(
		std::move(options), print_progress, cancel, yield);
	if (res.has_error()) {
		spdlog::error("{}", res.error().message());
		return 1;
	}
	fmt::println("{}", res.value().string());
	return 0;
}

int run_download(ytpipe::Pipeline &pipeline, const CliOptions &opts,
				 const ytpipe::ResourceRef &ref,
				 const ytpipe::CancelToken &cancel, asio::yield_context yield) {
	ytpipe::DownloadRequest request;

	if (opts.collection) {
		request.is_collection = true;
		request.member_ids = opts.items;
		if (request.member_ids.empty()) {
			if (!ref.has_collection()) {
				spdlog::error("--collection needs a list= locator or --items");
				return 1;
			}
			auto info = pipeline.async_fetch_collection_info(ref.collection_id,
															 cancel, yield);
			if (info.has_error()) {
				spdlog::error("{}", info.error().message());
				return 1;
			}
			for (const auto &member : info.value().members) {
				request.member_ids.push_back(member.id);
			}
		}
		request.format_id = opts.format.value_or("best");
	} else {
		request.resource_id = ref.video_id;
		if (opts.format) {
			request.format_id = *opts.format;
		} else {
			auto info = pipeline.async_fetch_info(ref.video_id, cancel, yield);
			if (info.has_error()) {
				spdlog::error("{}", info.error().message());
				return 1;
			}
			auto picked = default_format(info.value().formats);
			if (!picked) {
				spdlog::error("No downloadable format found");
				return 1;
			}
			spdlog::info("Selected format {}", *picked);
			request.format_id = *picked;
		}
	}

	if (opts.start || opts.end) {
		request.trim = ytpipe::TrimRange{opts.start.value_or(0),
										 opts.end.value_or(0)};
	}
	if (opts.sub_lang) {
		request.captions = ytpipe::CaptionRequest{*opts.sub_lang, opts.sub_format};
	}

	// Without -o the payload lands in a partial file, renamed once the
	// summary names it
	const bool to_stdout = opts.output && *opts.output == "-";
	fs::path target = opts.output && !to_stdout
						  ? fs::path(*opts.output)
						  : fs::path(ref.video_id.empty() ? ref.collection_id
														  : ref.video_id)
								.concat(".part");

	std::shared_ptr<ytpipe::DownloadSink> sink;
	std::shared_ptr<ytpipe::FileSink> file_sink;
	if (to_stdout) {
		sink = std::make_shared<ytpipe::OStreamSink>(std::cout);
	} else {
		file_sink = std::make_shared<ytpipe::FileSink>(target);
		if (!file_sink->is_open()) {
			spdlog::error("Cannot open {} for writing", target.string());
			return 1;
		}
		sink = file_sink;
	}

	auto res = pipeline.async_download(std::move(request), sink, print_progress,
									   cancel, yield);

	if (to_stdout) {
		std::cout.flush();
	} else if (auto closed = file_sink->close();
			   closed.has_error() && res.has_value()) {
		res = closed.error();
	}

	if (res.has_error()) {
		spdlog::error("{}", res.error().message());
		if (file_sink) {
			std::error_code ec;
			fs::remove(target, ec);
		}
		return 1;
	}

	const auto &summary = res.value();
	if (file_sink && !opts.output) {
		auto final_path = target.parent_path() / summary.file_name;
		std::error_code ec;
		fs::rename(target, final_path, ec);
		if (ec) {
			spdlog::warn("Could not rename {} to {}: {}", target.string(),
						 final_path.string(), ec.message());
		} else {
			target = final_path;
		}
	}

	spdlog::info("Delivered {} bytes via {}{}", summary.bytes, summary.strategy,
				 file_sink ? fmt::format(" to {}", target.string()) : "");
	return 0;
}

// Main application logic using yield_context for clean async
int run_app(ytpipe::Pipeline &pipeline, const CliOptions &opts,
			const ytpipe::CancelToken &cancel, asio::yield_context yield) {
	if (opts.category) {
		return run_category_download(pipeline, opts, cancel, yield);
	}

	auto ref = ytpipe::parse_resource_ref(opts.url);
	if (ref.has_error()) {
		spdlog::error("{}: {}", ref.error().message(), opts.url);
		return 1;
	}

	if (opts.dump_json) {
		if (ref.value().video_id.empty()) {
			auto info =
				pipeline.async_fetch_collection_info(ref.value().collection_id,
													 yield);
			if (info.has_error()) {
				spdlog::error("{}", info.error().message());
				return 1;
			}
			fmt::println("{}", nlohmann::json(info.value()).dump(2));
			return 0;
		}
		auto info = pipeline.async_fetch_info(opts.url, yield);
		if (info.has_error()) {
			spdlog::error("{}", info.error().message());
			return 1;
		}
		fmt::println("{}", nlohmann::json(info.value()).dump(2));
		return 0;
	}

	if (opts.raw_formats) {
		auto rows = pipeline.async_list_formats(opts.url, yield);
		if (rows.has_error()) {
			spdlog::error("{}", rows.error().message());
			return 1;
		}
		for (const auto &row : rows.value()) fmt::println("{}", row);
		return 0;
	}

	if (opts.list_formats) {
		auto info = pipeline.async_fetch_info(opts.url, yield);
		if (info.has_error()) {
			spdlog::error("{}", info.error().message());
			return 1;
		}
		fmt::println("[info] Available formats for {}:", info.value().id);
		print_formats_table(info.value().formats);
		return 0;
	}

	return run_download(pipeline, opts, ref.value(), cancel, yield);
}

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char *argv[]) {
	try {
		// Setup logging
		auto stderr_logger = spdlog::stderr_color_mt("stderr");
		spdlog::set_default_logger(stderr_logger);
		spdlog::set_pattern("[ytpipe] %^%l%$: %v");

		// Parse command line
		po::options_description desc("Options");
		// clang-format off
		desc.add_options()
			("help,h", "Print help message")
			("url", po::value<std::string>(), "Video id or YouTube URL")
			// Metadata
			("info,j", "Print resource metadata as JSON")
			("list-formats,F", "List the normalized format catalog")
			("raw-formats", "List the tool's own format table")
			// Download selection
			("format,f", po::value<std::string>(),
			 "Format id from the catalog (default: best with audio)")
			("start", po::value<long long>(), "Trim start in seconds")
			("end", po::value<long long>(), "Trim end in seconds")
			("sub-lang", po::value<std::string>(),
			 "Also fetch captions in this language (e.g., en)")
			("sub-format", po::value<std::string>()->default_value("srt"),
			 "Caption format (srt, vtt)")
			("collection", "Download playlist items as one payload")
			("items", po::value<std::string>(),
			 "Comma-separated video ids for --collection")
			("output,o", po::value<std::string>(),
			 "Output file, - for stdout")
			// Category downloads
			("category", po::value<std::string>(),
			 "Save into the download dir: video-with-audio, video-only, "
			 "audio-only, captions-only")
			("resolution", po::value<std::string>(),
			 "Maximum height for --category video downloads")
			("audio-quality", po::value<std::string>(),
			 "Bitrate for --category audio-only (128, 192, 256, 320)")
			("list-files", po::value<std::string>(),
			 "List files saved under a category")
			// Other
			("config", po::value<std::string>(), "JSON configuration file")
			("log-file", po::value<std::string>(), "Also write logs to a file")
			("verbose,v", "Enable verbose logging");
		// clang-format on

		po::positional_options_description p;
		p.add("url", 1);

		po::variables_map vm;
		po::store(po::command_line_parser(argc, argv)
					  .options(desc)
					  .positional(p)
					  .run(),
				  vm);
		po::notify(vm);

		if (vm.count("help")) {
			std::cout << "Usage: ytpipe [options] <url>\n" << desc << "\n";
			return 0;
		}

		if (vm.count("log-file")) {
			auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
				vm["log-file"].as<std::string>());
			stderr_logger->sinks().push_back(file_sink);
		}

		if (vm.count("verbose")) {
			spdlog::set_level(spdlog::level::debug);
		} else {
			spdlog::set_level(spdlog::level::info);
		}

		ytpipe::PipelineConfig config;
		if (vm.count("config")) {
			auto loaded = ytpipe::load_config(vm["config"].as<std::string>());
			if (loaded.has_error()) {
				spdlog::error("Invalid configuration: {}",
							  loaded.error().message());
				return 1;
			}
			config = std::move(loaded).value();
		}

		asio::io_context ioc;
		auto pipeline = ytpipe::Pipeline::create(ioc.get_executor(), config);

		// Listing is synchronous, no need for the event loop
		if (vm.count("list-files")) {
			auto name = vm["list-files"].as<std::string>();
			auto category = ytpipe::parse_category(name);
			if (!category) {
				spdlog::error("Unknown category: {}", name);
				return 1;
			}
			auto files = pipeline.list_downloaded_files(*category);
			if (files.has_error()) {
				spdlog::error("{}", files.error().message());
				return 1;
			}
			for (const auto &f : files.value()) {
				fmt::println("{}", f.relative_path);
			}
			return 0;
		}

		if (!vm.count("url")) {
			std::cout << "Usage: ytpipe [options] <url>\n" << desc << "\n";
			return 1;
		}

		// Build CLI options
		CliOptions opts;
		opts.url = vm["url"].as<std::string>();
		if (vm.count("format")) opts.format = vm["format"].as<std::string>();
		if (vm.count("start")) opts.start = vm["start"].as<long long>();
		if (vm.count("end")) opts.end = vm["end"].as<long long>();
		if (vm.count("sub-lang")) {
			opts.sub_lang = vm["sub-lang"].as<std::string>();
		}
		opts.sub_format = vm["sub-format"].as<std::string>();
		opts.collection = vm.count("collection") > 0;
		if (vm.count("items")) {
			opts.items = split_items(vm["items"].as<std::string>());
		}
		if (vm.count("output")) opts.output = vm["output"].as<std::string>();
		if (vm.count("category")) {
			auto name = vm["category"].as<std::string>();
			opts.category = ytpipe::parse_category(name);
			if (!opts.category) {
				spdlog::error("Unknown category: {}", name);
				return 1;
			}
		}
		if (vm.count("resolution")) {
			opts.resolution = vm["resolution"].as<std::string>();
		}
		if (vm.count("audio-quality")) {
			opts.audio_quality = vm["audio-quality"].as<std::string>();
		}
		opts.dump_json = vm.count("info") > 0;
		opts.list_formats = vm.count("list-formats") > 0;
		opts.raw_formats = vm.count("raw-formats") > 0;

		// A signal cancels the active request, which then unwinds normally
		ytpipe::CancelToken cancel;
		asio::signal_set signals(ioc, SIGINT, SIGTERM);
		signals.async_wait([&](const boost::system::error_code &ec, int sig) {
			if (!ec) {
				fmt::println(stderr, "\nCancelling, received signal {}.", sig);
				cancel.cancel();
			}
		});

		int exit_code = 1;
		asio::spawn(
			ioc,
			[&](asio::yield_context yield) {
				try {
					exit_code = run_app(pipeline, opts, cancel, yield);
				} catch (const std::exception &e) {
					spdlog::error("{}", e.what());
				}
				// Cancel signal wait so io_context can exit normally
				signals.cancel();
			},
			asio::detached);

		ioc.run();

		return exit_code;

	} catch (const std::exception &e) {
		fmt::println(stderr, "ERROR: {}", e.what());
		return 1;
	}
}
