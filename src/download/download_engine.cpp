#include <spdlog/spdlog.h>

#include <algorithm>
#include <ytpipe/download_engine.hpp>
#include <ytpipe/resource_ref.hpp>

#include "async_task.hpp"
#include "utils.hpp"

namespace ytpipe {

namespace {

bool has_prefix(std::string_view s, std::string_view prefix) {
	return s.substr(0, prefix.size()) == prefix;
}

// Tracks whether bytes reached the caller, so the engine knows if a
// fallback attempt can still start from a clean slate.
class CountingSink : public DownloadSink {
   public:
	explicit CountingSink(DownloadSink &inner) : inner_(inner) {}

	Result<void> write(std::string_view chunk) override {
		auto res = inner_.write(chunk);
		if (res) written_ += chunk.size();
		return res;
	}

	bool discard() override {
		if (written_ == 0) return true;
		if (!inner_.discard()) return false;
		written_ = 0;
		return true;
	}

	[[nodiscard]] std::uint64_t written() const { return written_; }

   private:
	DownloadSink &inner_;
	std::uint64_t written_ = 0;
};

}  // namespace

Result<void> validate_request(const DownloadRequest &request) {
	if (request.is_collection) {
		if (request.member_ids.empty()) {
			return make_error_code(errc::empty_collection);
		}
		for (const auto &id : request.member_ids) {
			if (!is_video_id(id)) {
				return make_error_code(errc::invalid_resource_ref);
			}
		}
	} else {
		auto ref = parse_resource_ref(request.resource_id);
		if (ref.has_error() || ref.value().video_id.empty()) {
			return make_error_code(errc::invalid_resource_ref);
		}
	}

	const auto &format_id = request.format_id;
	if (format_id.empty() || has_prefix(format_id, kPlaceholderPrefix) ||
		has_prefix(format_id, kFallbackPrefix)) {
		return make_error_code(errc::invalid_format);
	}

	if (request.trim) {
		if (request.trim->start < 0 || request.trim->end <= request.trim->start) {
			return make_error_code(errc::invalid_trim_range);
		}
	}

	if (request.captions) {
		if (request.captions->lang.empty() || request.captions->format.empty()) {
			return make_error_code(errc::invalid_caption_request);
		}
	}

	return outcome::success();
}

DownloadEngine::DownloadEngine(asio::any_io_executor ex,
							   std::shared_ptr<InfoService> info,
							   Strategies strategies)
	: ex_(std::move(ex)),
	  info_(std::move(info)),
	  strategies_(std::move(strategies)) {}

DownloadEngine::~DownloadEngine() = default;

DownloadEngine::Strategies DownloadEngine::default_strategies(
	std::shared_ptr<ProcessRunner> runner, const PipelineConfig &config) {
	Strategies s;
	s.push_back(std::make_unique<DirectStreamStrategy>(runner, config));
	s.push_back(std::make_unique<FileBufferedStrategy>(runner, config));
	return s;
}

Result<DownloadSummary> DownloadEngine::download(
	const DownloadRequest &request, DownloadSink &sink,
	const ProgressCallback &progress, const CancelToken &cancel,
	asio::yield_context yield) {
	if (request.is_collection) {
		spdlog::error("Rejected download of '{}': collections go through the "
					  "playlist aggregator",
					  request.resource_id);
		return make_error_code(errc::invalid_resource_ref);
	}
	if (auto valid = validate_request(request); valid.has_error()) {
		spdlog::error("Rejected download of '{}' format '{}': {}",
					  request.resource_id, request.format_id,
					  valid.error().message());
		return valid.error();
	}

	auto video_id = parse_resource_ref(request.resource_id).value().video_id;
	if (cancel.cancelled()) return make_error_code(errc::cancelled);

	auto info = info_->async_fetch_info(video_id, cancel, yield);
	if (info.has_error()) return info.error();

	const auto &formats = info.value().formats;
	auto it = std::find_if(formats.begin(), formats.end(),
						   [&](const FormatVariant &f) {
							   return f.format_id == request.format_id;
						   });
	if (it == formats.end() || it->is_placeholder()) {
		spdlog::error("{}: Format {} is not in the catalog", video_id,
					  request.format_id);
		return make_error_code(errc::invalid_format);
	}

	CountingSink counting(sink);
	AttemptContext ctx{request, watch_url(video_id), counting, progress,
					   cancel};

	std::error_code last = make_error_code(errc::download_failed);
	for (std::size_t i = 0; i < strategies_.size(); ++i) {
		auto &strategy = *strategies_[i];
		if (cancel.cancelled()) {
			spdlog::info("{}: Cancelled before {} download", video_id,
						 strategy.tag());
			return make_error_code(errc::cancelled);
		}

		if (!strategy.accepts(request)) {
			spdlog::debug("{}: {} download cannot serve format {}, skipping",
						  video_id, strategy.tag(), request.format_id);
			continue;
		}

		spdlog::info("{}: Attempting {} download ({}/{})", video_id,
					 strategy.tag(), i + 1, strategies_.size());
		auto res = strategy.attempt(ctx, yield);

		if (res) {
			spdlog::info("{}: {} download finished, {} bytes", video_id,
						 strategy.tag(), res.value());
			DownloadSummary summary;
			summary.strategy = std::string(strategy.tag());
			summary.bytes = res.value();
			summary.delivery = DeliveryKind::stream;
			summary.file_name = utils::sanitize_filename(info.value().title) +
								"." + it->extension;
			return summary;
		}

		auto ec = res.error();
		if (ec == make_error_code(errc::cancelled) || cancel.cancelled()) {
			spdlog::info("{}: Download cancelled", video_id);
			return make_error_code(errc::cancelled);
		}

		spdlog::warn("{}: {} download failed: {}", video_id, strategy.tag(),
					 ec.message());
		if (!is_retryable(ec)) return ec;

		if (i + 1 < strategies_.size() && !counting.discard()) {
			spdlog::error(
				"{}: {} bytes already delivered, cannot fall back",
				video_id, counting.written());
			return make_error_code(errc::stream_interrupted);
		}
		last = ec;
	}

	spdlog::error("{}: All download strategies failed", video_id);
	return last;
}

void DownloadEngine::download_impl(
	DownloadRequest request, std::shared_ptr<DownloadSink> sink,
	ProgressCallback progress, CancelToken cancel,
	asio::any_completion_handler<void(Result<DownloadSummary>)> handler,
	CompletionExecutor handler_ex) {
	detail::spawn_task<DownloadSummary>(
		ex_, "download",
		[this, request = std::move(request), sink = std::move(sink),
		 progress = std::move(progress),
		 cancel = std::move(cancel)](asio::yield_context yield) {
			return download(request, *sink, progress, cancel, yield);
		},
		std::move(handler), std::move(handler_ex));
}

}  // namespace ytpipe
