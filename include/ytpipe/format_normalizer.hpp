#pragma once

#include <ytpipe/ytpipe_export.h>

#include <array>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <ytpipe/types.hpp>

namespace ytpipe {

// Standard tiers every catalog covers, real or synthesized.
inline constexpr std::array<int, 8> kVideoTiers{144,  240,	360,  480,
												720,  1080, 1440, 2160};
inline constexpr std::array<int, 4> kAudioTiers{128, 192, 256, 320};

// Bytes per pixel row squared, used when the tool reports no size.
inline constexpr long long kVideoSizeFactor = 60;
inline constexpr long long kUnknownAudioSize = 3'000'000;

/// One entry of the tool's `formats` array, as dumped.
struct YTPIPE_EXPORT RawFormat {
	std::string format_id;
	std::string ext;
	std::string vcodec;	 // "none" or empty when absent
	std::string acodec;
	std::string format_note;
	int height = 0;
	double abr = 0.0;
	long long filesize = 0;
	long long filesize_approx = 0;
	int audio_channels = 0;
};

YTPIPE_EXPORT void from_json(const nlohmann::json &j, RawFormat &f);

struct YTPIPE_EXPORT NormalizeOptions {
	std::string video_container = "mp4";
	std::string audio_container = "mp3";
	bool fill_gaps = true;
};

YTPIPE_EXPORT int nearest_video_tier(int height);
YTPIPE_EXPORT int nearest_audio_tier(double kbps);

/// "MP4 - 720p with Audio HD", "MP4 - 1080p (Video Only) Full HD",
/// "MP3 - 192kbps". `height` and `kbps` are snapped to the ladders.
YTPIPE_EXPORT std::string quality_label_for(bool has_video, bool has_audio,
											int height, double kbps);

/// The entry produced by an mp3 estimate at `bitrate` kbps. Without a reported
/// size the estimate is duration * bitrate / 8.
YTPIPE_EXPORT RawFormat synthesize_audio_format(int bitrate,
												long long duration,
												long long filesize = 0);

/// Bitrate of an "audio-mp3-<kbps>" id, nullopt for any other id.
YTPIPE_EXPORT std::optional<int> mp3_bitrate_of(std::string_view format_id);

/// Filters, labels, deduplicates and gap-fills a raw format list.
/// Result order: video with audio, video only, audio only; best first.
YTPIPE_EXPORT std::vector<FormatVariant> normalize_formats(
	const std::vector<RawFormat> &raw, long long duration,
	const NormalizeOptions &options = {});

}  // namespace ytpipe
