#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <boost/asio.hpp>
#include <iomanip>
#include <iostream>
#include <ytpipe/pipeline.hpp>

using namespace ytpipe;

int main() {
	// Initialize logger
	auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
	auto logger = std::make_shared<spdlog::logger>("ytpipe", console_sink);
	spdlog::set_default_logger(logger);
	spdlog::set_level(spdlog::level::debug);

	boost::asio::io_context ioc;
	auto work_guard = boost::asio::make_work_guard(ioc);

	auto pipeline = Pipeline::create(ioc.get_executor(), PipelineConfig{});

	std::string url =
		"https://www.youtube.com/watch?v=F0tYP4OQ0-k";	// Example URL

	std::cout << "Fetching info for " << url << "...\n";

	pipeline.async_fetch_info(url, [&](Result<ResourceInfo> res) {
		if (!res) {
			std::cerr << "Metadata failed: " << res.error().message() << "\n";
			work_guard.reset();
			return;
		}

		const auto &info = res.value();
		std::cout << "Title: " << info.title << "\n";
		std::cout << "Channel: " << info.channel << "\n";
		std::cout << "Duration: " << info.duration << "s\n";

		// First variant with both streams; placeholders are not downloadable
		const FormatVariant *pick = nullptr;
		for (const auto &f : info.formats) {
			if (!f.is_placeholder() && f.has_video && f.has_audio) {
				pick = &f;
				break;
			}
		}
		if (!pick) {
			std::cerr << "No combined format available\n";
			work_guard.reset();
			return;
		}

		auto sink = std::make_shared<FileSink>(info.id + "." + pick->extension);

		DownloadRequest request;
		request.resource_id = info.id;
		request.format_id = pick->format_id;

		std::cout << "Starting download of " << pick->quality_label << "...\n";
		pipeline.async_download(
			std::move(request), sink,
			[](const ProgressEvent &ev) {
				std::cout << "\r" << ev.strategy << ": " << std::fixed
						  << std::setprecision(1) << ev.percent << "% "
						  << "Speed: " << ev.rate << " ETA: " << ev.eta
						  << "   " << std::flush;
			},
			CancelToken{},
			[&, sink](Result<DownloadSummary> done) {
				auto closed = sink->close();
				if (done.has_error()) {
					spdlog::error("Download failed: {}", done.error().message());
				} else if (closed.has_error()) {
					spdlog::error("Write failed: {}", closed.error().message());
				} else {
					std::cout << "\nOperation complete.\n"
							  << "Downloaded " << done.value().bytes
							  << " bytes to " << sink->path() << " via "
							  << done.value().strategy << "\n";
				}
				work_guard.reset();
			});
	});

	ioc.run();
	return 0;
}
