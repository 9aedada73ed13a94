#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <set>
#include <tuple>
#include <ytpipe/format_normalizer.hpp>

#include "utils.hpp"

namespace ytpipe {

namespace {

bool codec_present(const std::string &codec) {
	return !codec.empty() && codec != "none";
}

std::string tier_suffix(int height) {
	if (height >= 2160) return " 4K";
	if (height >= 1440) return " 2K";
	if (height >= 1080) return " Full HD";
	if (height >= 720) return " HD";
	return {};
}

long long estimated_audio_size(long long duration, int bitrate) {
	if (duration <= 0) return kUnknownAudioSize;
	return duration * bitrate * 1000 / 8;
}

// Sort rank of the three output groups
int group_of(const FormatVariant &f) {
	if (f.has_video && f.has_audio) return 0;
	if (f.has_video) return 1;
	return 2;
}

bool catalog_order(const FormatVariant &a, const FormatVariant &b) {
	auto ga = group_of(a), gb = group_of(b);
	if (ga != gb) return ga < gb;
	if (a.height != b.height) return a.height > b.height;
	if (a.audio_bitrate != b.audio_bitrate) {
		return a.audio_bitrate > b.audio_bitrate;
	}
	return a.filesize > b.filesize;
}

}  // namespace

void from_json(const nlohmann::json &j, RawFormat &f) {
	using utils::traverse_number;
	using utils::traverse_obj_default;

	f.format_id = traverse_obj_default<std::string>(j, {"format_id"}, "");
	f.ext = traverse_obj_default<std::string>(j, {"ext"}, "");
	f.vcodec = traverse_obj_default<std::string>(j, {"vcodec"}, "");
	f.acodec = traverse_obj_default<std::string>(j, {"acodec"}, "");
	f.format_note = traverse_obj_default<std::string>(j, {"format_note"}, "");
	f.height = static_cast<int>(traverse_number(j, {"height"}).value_or(0));
	f.abr = traverse_number(j, {"abr"}).value_or(0.0);
	f.filesize =
		static_cast<long long>(traverse_number(j, {"filesize"}).value_or(0));
	f.filesize_approx = static_cast<long long>(
		traverse_number(j, {"filesize_approx"}).value_or(0));
	f.audio_channels =
		static_cast<int>(traverse_number(j, {"audio_channels"}).value_or(0));
}

int nearest_video_tier(int height) {
	int best = kVideoTiers.front();
	for (int tier : kVideoTiers) {
		if (std::abs(tier - height) < std::abs(best - height)) best = tier;
	}
	return best;
}

int nearest_audio_tier(double kbps) {
	int best = kAudioTiers.front();
	for (int tier : kAudioTiers) {
		if (std::fabs(tier - kbps) < std::fabs(best - kbps)) best = tier;
	}
	return best;
}

std::string quality_label_for(bool has_video, bool has_audio, int height,
							  double kbps) {
	if (has_video) {
		int tier = nearest_video_tier(height);
		return fmt::format("MP4 - {}p{}{}", tier,
						   has_audio ? " with Audio" : " (Video Only)",
						   tier_suffix(tier));
	}
	return fmt::format("MP3 - {}kbps", nearest_audio_tier(kbps));
}

RawFormat synthesize_audio_format(int bitrate, long long duration,
								  long long filesize) {
	RawFormat f;
	f.format_id = fmt::format("{}{}", kMp3Prefix, bitrate);
	f.ext = "mp3";
	f.acodec = "mp3";
	f.vcodec = "none";
	f.format_note = fmt::format("{}kbps", bitrate);
	f.abr = bitrate;
	f.filesize = filesize > 0 ? filesize : duration * bitrate * 1000 / 8;
	return f;
}

std::optional<int> mp3_bitrate_of(std::string_view format_id) {
	if (format_id.substr(0, kMp3Prefix.size()) != kMp3Prefix) {
		return std::nullopt;
	}
	auto kbps = utils::to_number<int>(format_id.substr(kMp3Prefix.size()));
	if (!kbps || kbps.value() <= 0) return std::nullopt;
	return kbps.value();
}

std::vector<FormatVariant> normalize_formats(const std::vector<RawFormat> &raw,
											 long long duration,
											 const NormalizeOptions &options) {
	std::vector<FormatVariant> candidates;
	candidates.reserve(raw.size());

	std::size_t fallback_seq = 0;
	for (const auto &r : raw) {
		bool is_video_container =
			r.ext == options.video_container && codec_present(r.vcodec);
		bool is_audio_container =
			r.ext == options.audio_container && codec_present(r.acodec);
		if (!is_video_container && !is_audio_container) continue;

		FormatVariant v;
		v.has_video = codec_present(r.vcodec);
		v.has_audio = codec_present(r.acodec);
		v.format_id = r.format_id.empty()
						  ? fmt::format("{}{}", kFallbackPrefix, fallback_seq++)
						  : r.format_id;
		v.extension = r.ext;
		v.quality = r.format_note.empty() ? "unknown" : r.format_note;
		v.audio_channels = r.audio_channels > 0 ? r.audio_channels : 2;

		if (v.has_video && r.height > 0) {
			v.height = nearest_video_tier(r.height);
			v.quality_label =
				quality_label_for(true, v.has_audio, r.height, 0.0);
		} else if (!v.has_video && v.has_audio) {
			double abr = r.abr > 0 ? r.abr : 128.0;
			v.audio_bitrate = nearest_audio_tier(abr);
			v.quality_label = quality_label_for(false, true, 0, abr);
		} else {
			v.quality_label = v.quality;
		}

		if (r.filesize > 0) {
			v.filesize = r.filesize;
		} else if (r.filesize_approx > 0) {
			v.filesize = r.filesize_approx;
		} else {
			v.filesize = v.has_video ? static_cast<long long>(r.height) *
										   r.height * kVideoSizeFactor
									 : kUnknownAudioSize;
		}

		candidates.push_back(std::move(v));
	}

	// Highest tier then largest first, so dedup keeps the best of each tier
	std::stable_sort(candidates.begin(), candidates.end(),
					 [](const FormatVariant &a, const FormatVariant &b) {
						 if (a.height != b.height) return a.height > b.height;
						 return a.filesize > b.filesize;
					 });

	std::vector<FormatVariant> catalog;
	std::set<std::tuple<bool, bool, std::string, std::string>> seen;
	for (auto &c : candidates) {
		if (seen.emplace(c.has_video, c.has_audio, c.quality_label, c.extension)
				.second) {
			catalog.push_back(std::move(c));
		}
	}

	if (options.fill_gaps) {
		std::set<int> video_tiers, audio_tiers;
		for (const auto &f : catalog) {
			if (f.has_video && f.height > 0) video_tiers.insert(f.height);
			if (!f.has_video && f.has_audio) {
				audio_tiers.insert(f.audio_bitrate);
			}
		}

		// catalog[0] is the best real variant after the sort above
		FormatVariant base = catalog.empty() ? FormatVariant{} : catalog.front();
		std::size_t real_count = catalog.size();

		for (int tier : kVideoTiers) {
			if (video_tiers.count(tier)) continue;
			FormatVariant p = base;
			p.format_id = fmt::format("{}{}p", kPlaceholderPrefix, tier);
			p.extension = options.video_container;
			p.quality = fmt::format("{}p", tier);
			p.has_video = true;
			p.has_audio = true;
			p.height = tier;
			p.audio_bitrate = 0;
			p.quality_label = quality_label_for(true, true, tier, 0.0);
			p.filesize = static_cast<long long>(tier) * tier * kVideoSizeFactor;
			if (seen.emplace(true, true, p.quality_label, p.extension).second) {
				catalog.push_back(std::move(p));
			}
		}

		for (int bitrate : kAudioTiers) {
			if (audio_tiers.count(bitrate)) continue;
			FormatVariant p = base;
			p.format_id = fmt::format("{}audio-{}", kPlaceholderPrefix, bitrate);
			p.extension = options.audio_container;
			p.quality = fmt::format("{}kbps", bitrate);
			p.has_video = false;
			p.has_audio = true;
			p.height = 0;
			p.audio_bitrate = bitrate;
			p.quality_label = quality_label_for(false, true, 0, bitrate);
			p.filesize = estimated_audio_size(duration, bitrate);
			if (seen.emplace(false, true, p.quality_label, p.extension)
					.second) {
				catalog.push_back(std::move(p));
			}
		}

		if (catalog.size() > real_count) {
			spdlog::debug("Catalog: {} real formats, {} placeholders",
						  real_count, catalog.size() - real_count);
		}
	}

	std::stable_sort(catalog.begin(), catalog.end(), catalog_order);
	return catalog;
}

}  // namespace ytpipe
