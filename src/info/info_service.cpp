#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <array>
#include <boost/asio/spawn.hpp>
#include <boost/regex.hpp>
#include <nlohmann/json.hpp>
#include <unordered_map>
#include <ytpipe/format_normalizer.hpp>
#include <ytpipe/info_service.hpp>
#include <ytpipe/resource_ref.hpp>

#include "async_task.hpp"
#include "tool/arguments.hpp"
#include "tool/error_classifier.hpp"
#include "utils.hpp"

namespace ytpipe {

namespace {

// mp3 bitrates estimated separately; the main dump rarely lists them
constexpr std::array<int, 4> kMp3Bitrates{320, 256, 192, 128};

Result<nlohmann::json> parse_last_json_line(const std::string &output) {
	auto lines = utils::split_lines(output);
	if (lines.empty()) return make_error_code(errc::json_parse_error);

	auto j = nlohmann::json::parse(lines.back(), nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		return make_error_code(errc::json_parse_error);
	}
	return j;
}

errc failure_reason(std::string_view what, const ProcessResult &res) {
	auto reason = tool::classify_tool_error(res.captured_stderr);
	spdlog::error("{} failed with exit code {}: {}", what, res.exit_code,
				  tool::stderr_tail(res.captured_stderr));
	return reason;
}

}  // namespace

std::string caption_language_name(std::string_view code) {
	static const std::unordered_map<std::string_view, std::string_view> names{
		{"en", "English"},	{"es", "Spanish"},	  {"fr", "French"},
		{"de", "German"},	{"it", "Italian"},	  {"pt", "Portuguese"},
		{"ru", "Russian"},	{"ja", "Japanese"},	  {"ko", "Korean"},
		{"zh", "Chinese"},	{"ar", "Arabic"},
	};
	auto it = names.find(code);
	return std::string(it != names.end() ? it->second : code);
}

ResourceInfo parse_resource_dump(const nlohmann::json &dump) {
	using utils::traverse_obj;
	using utils::traverse_obj_default;

	ResourceInfo info;
	info.id = traverse_obj_default<std::string>(dump, {"id"}, "");
	info.title = traverse_obj<std::string>(dump, {"title"})
					 .value_or("Unknown Title");
	info.description =
		traverse_obj_default<std::string>(dump, {"description"}, "");
	info.thumbnail = traverse_obj_default<std::string>(dump, {"thumbnail"}, "");
	info.duration = static_cast<long long>(
		utils::traverse_number(dump, {"duration"}).value_or(0));
	info.channel = traverse_obj<std::string>(dump, {"uploader"})
					   .value_or(traverse_obj_default<std::string>(
						   dump, {"channel"}, "Unknown Channel"));

	if (auto subs = utils::traverse_json(dump, {"subtitles"});
		subs && subs->is_object()) {
		for (const auto &[lang, tracks] : subs->items()) {
			auto name = traverse_obj<std::string>(tracks, {0, "name"});
			info.captions.push_back(
				{lang, name.value_or(caption_language_name(lang))});
		}
	}

	return info;
}

struct InfoService::Impl {
	asio::any_io_executor ex;
	std::shared_ptr<ProcessRunner> runner;
	PipelineConfig config;
	MetadataCache metadata;
	FormatListCache format_lines;

	Impl(asio::any_io_executor ex_, std::shared_ptr<ProcessRunner> runner_,
		 PipelineConfig config_)
		: ex(std::move(ex_)),
		  runner(std::move(runner_)),
		  config(std::move(config_)),
		  metadata(config.metadata_cache),
		  format_lines(config.format_cache) {}

	Result<ProcessResult> run(tool::Args args, const CancelToken &cancel,
							  asio::yield_context yield) {
		if (cancel.cancelled()) return make_error_code(errc::cancelled);
		ProcessRequest req;
		req.program = config.yt_dlp_path;
		req.args = std::move(args);
		req.cancel = cancel;
		return runner->async_run(std::move(req), yield);
	}

	Result<std::vector<RawFormat>> estimate_audio_formats(
		const std::string &locator, long long duration,
		const CancelToken &cancel, asio::yield_context yield) {
		std::vector<RawFormat> out;
		for (int bitrate : kMp3Bitrates) {
			auto res = run(tool::audio_estimate_args(config.tool, locator, bitrate),
						   cancel, yield);
			if (cancel.cancelled()) return make_error_code(errc::cancelled);
			if (!res || !res.value().succeeded()) {
				spdlog::warn("Failed to generate audio format at {}kbps: {}",
							 bitrate,
							 res ? std::string(tool::stderr_tail(
									   res.value().captured_stderr, 1))
								 : res.error().message());
				continue;
			}

			auto estimate = parse_last_json_line(res.value().captured_stdout);
			if (!estimate) {
				spdlog::warn("Unreadable audio estimate output at {}kbps", bitrate);
				continue;
			}

			auto filesize = static_cast<long long>(
				utils::traverse_number(estimate.value(), {"filesize"}).value_or(0));
			auto reported_duration = static_cast<long long>(
				utils::traverse_number(estimate.value(), {"duration"})
					.value_or(static_cast<double>(duration)));
			out.push_back(
				synthesize_audio_format(bitrate, reported_duration, filesize));
		}
		return out;
	}

	Result<ResourceInfo> fetch_single(const std::string &video_id,
									  const CancelToken &cancel,
									  asio::yield_context yield) {
		if (auto cached = metadata.get(video_id)) {
			spdlog::debug("{}: Metadata cache hit", video_id);
			return *cached;
		}

		auto locator = watch_url(video_id);
		spdlog::info("{}: Downloading metadata", video_id);
		auto res = run(tool::info_args(config.tool, locator), cancel, yield);
		if (res.has_error()) return res.error();
		if (!res.value().succeeded()) {
			return make_error_code(failure_reason(video_id, res.value()));
		}

		auto dump = parse_last_json_line(res.value().captured_stdout);
		if (dump.has_error()) {
			spdlog::error("{}: Metadata dump is not valid JSON", video_id);
			return dump.error();
		}

		auto info = parse_resource_dump(dump.value());
		info.id = video_id;

		std::vector<RawFormat> raw;
		if (auto formats = utils::traverse_json(dump.value(), {"formats"});
			formats && formats->is_array()) {
			for (const auto &f : *formats) {
				if (f.is_object()) raw.push_back(f.get<RawFormat>());
			}
		}

		spdlog::info("{}: Estimating mp3 sizes", video_id);
		auto audio = estimate_audio_formats(locator, info.duration, cancel, yield);
		if (audio.has_error()) return audio.error();
		raw.insert(raw.end(), audio.value().begin(), audio.value().end());

		info.formats = normalize_formats(raw, info.duration);
		spdlog::info("{}: {} formats, {} caption tracks", video_id,
					 info.formats.size(), info.captions.size());

		metadata.put(video_id, info);
		return info;
	}

	Result<CollectionInfo> fetch_collection(const std::string &collection_id,
											const CancelToken &cancel,
											asio::yield_context yield) {
		if (!is_collection_id(collection_id)) {
			return make_error_code(errc::invalid_resource_ref);
		}

		spdlog::info("{}: Downloading playlist entries", collection_id);
		auto res = run(tool::collection_args(config.tool, collection_id), cancel,
					   yield);
		if (res.has_error()) return res.error();
		if (!res.value().succeeded()) {
			return make_error_code(failure_reason(collection_id, res.value()));
		}

		using utils::traverse_obj;

		CollectionInfo coll;
		coll.id = collection_id;
		coll.title = "YouTube Playlist";

		auto lines = utils::split_lines(res.value().captured_stdout);
		for (std::size_t i = 0; i < lines.size(); ++i) {
			auto item = nlohmann::json::parse(lines[i], nullptr, false);
			if (item.is_discarded() || !item.is_object()) {
				spdlog::warn("{}: Error parsing playlist item {}",
							 collection_id, i);
				continue;
			}

			if (i == 0) {
				coll.title = traverse_obj<std::string>(item, {"playlist"})
								 .value_or(coll.title);
				coll.thumbnail =
					traverse_obj<std::string>(item, {"thumbnail"}).value_or("");
				coll.channel =
					traverse_obj<std::string>(item, {"uploader"}).value_or("");
				coll.description =
					traverse_obj<std::string>(item, {"playlist_description"})
						.value_or("");
			}

			auto id = traverse_obj<std::string>(item, {"id"});
			if (!id || id->empty()) continue;

			CollectionMember m;
			m.id = *id;
			m.position = static_cast<int>(coll.members.size());
			m.title = traverse_obj<std::string>(item, {"title"})
						  .value_or(fmt::format("Video {}", m.position + 1));
			m.duration = static_cast<long long>(
				utils::traverse_number(item, {"duration"}).value_or(0));
			m.thumbnail =
				traverse_obj<std::string>(item, {"thumbnail"})
					.value_or(traverse_obj<std::string>(
								  item, {"thumbnails", -1, "url"})
								  .value_or(""));
			coll.members.push_back(std::move(m));
		}

		spdlog::info("{}: {} playlist entries", collection_id,
					 coll.members.size());
		return coll;
	}

	Result<ResourceInfo> fetch_info(const std::string &text,
									const CancelToken &cancel,
									asio::yield_context yield) {
		auto ref = parse_resource_ref(text);
		if (ref.has_error()) {
			spdlog::error("Invalid resource reference: {}", text);
			return ref.error();
		}
		const auto &r = ref.value();
		if (!r.has_collection()) return fetch_single(r.video_id, cancel, yield);

		auto key = r.video_id + "&list=" + r.collection_id;
		if (auto cached = metadata.get(key)) return *cached;

		auto coll = fetch_collection(r.collection_id, cancel, yield);
		if (coll.has_error()) {
			if (coll.error() == make_error_code(errc::cancelled)) {
				return coll.error();
			}
			if (!r.video_id.empty()) {
				spdlog::warn(
					"Failed to get playlist info for {}, falling back to single "
					"video: {}",
					r.collection_id, coll.error().message());
				return fetch_single(r.video_id, cancel, yield);
			}
			return coll.error();
		}

		auto &members = coll.value().members;
		if (members.empty() && r.video_id.empty()) {
			return make_error_code(errc::empty_collection);
		}

		// A bare playlist reference borrows the catalog of its first entry
		auto item_id = r.video_id.empty() ? members.front().id : r.video_id;
		auto single = fetch_single(item_id, cancel, yield);
		if (single.has_error()) return single.error();

		ResourceInfo info = std::move(single).value();
		if (r.video_id.empty()) {
			info.id = coll.value().id;
			info.title = coll.value().title;
			info.description = coll.value().description;
			if (!coll.value().thumbnail.empty()) {
				info.thumbnail = coll.value().thumbnail;
			}
			if (!coll.value().channel.empty()) {
				info.channel = coll.value().channel;
			}
		}
		info.is_collection = true;
		info.collection_members = std::move(members);

		metadata.put(key, info);
		return info;
	}

	Result<std::vector<std::string>> list_formats(const std::string &text,
												  asio::yield_context yield) {
		auto ref = parse_resource_ref(text);
		if (ref.has_error()) return ref.error();

		const auto &locator = ref.value().video_id.empty()
								  ? ref.value().locator
								  : watch_url(ref.value().video_id);
		if (auto cached = format_lines.get(locator)) return *cached;

		auto res = run(tool::list_formats_args(config.tool, locator),
					   CancelToken{}, yield);
		if (res.has_error()) return res.error();
		if (!res.value().succeeded()) {
			return make_error_code(failure_reason(locator, res.value()));
		}

		static const boost::regex row_re(R"(^\d+\s+)");
		std::vector<std::string> rows;
		for (auto &line : utils::split_lines(res.value().captured_stdout)) {
			if (boost::regex_search(line, row_re)) rows.push_back(line);
		}

		format_lines.put(locator, rows);
		return rows;
	}
};

InfoService::InfoService(asio::any_io_executor ex,
						 std::shared_ptr<ProcessRunner> runner,
						 PipelineConfig config)
	: impl_(std::make_shared<Impl>(std::move(ex), std::move(runner),
								   std::move(config))) {}

InfoService::~InfoService() = default;

asio::any_io_executor InfoService::get_executor() const { return impl_->ex; }

void InfoService::clear_caches() {
	impl_->metadata.clear();
	impl_->format_lines.clear();
}

MetadataCache &InfoService::metadata_cache() { return impl_->metadata; }

FormatListCache &InfoService::format_cache() { return impl_->format_lines; }

void InfoService::fetch_info_impl(
	std::string ref, CancelToken cancel,
	asio::any_completion_handler<void(Result<ResourceInfo>)> handler,
	CompletionExecutor handler_ex) {
	detail::spawn_task<ResourceInfo>(
		impl_->ex, "fetch_info",
		[impl = impl_, ref = std::move(ref),
		 cancel = std::move(cancel)](asio::yield_context yield) {
			return impl->fetch_info(ref, cancel, yield);
		},
		std::move(handler), std::move(handler_ex));
}

void InfoService::fetch_collection_impl(
	std::string collection_id, CancelToken cancel,
	asio::any_completion_handler<void(Result<CollectionInfo>)> handler,
	CompletionExecutor handler_ex) {
	detail::spawn_task<CollectionInfo>(
		impl_->ex, "fetch_collection_info",
		[impl = impl_, id = std::move(collection_id),
		 cancel = std::move(cancel)](asio::yield_context yield) {
			return impl->fetch_collection(id, cancel, yield);
		},
		std::move(handler), std::move(handler_ex));
}

void InfoService::list_formats_impl(
	std::string ref,
	asio::any_completion_handler<void(Result<std::vector<std::string>>)>
		handler,
	CompletionExecutor handler_ex) {
	detail::spawn_task<std::vector<std::string>>(
		impl_->ex, "list_formats",
		[impl = impl_, ref = std::move(ref)](asio::yield_context yield) {
			return impl->list_formats(ref, yield);
		},
		std::move(handler), std::move(handler_ex));
}

}  // namespace ytpipe
