#pragma once

#include <ytpipe/ytpipe_export.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ytpipe {

// Ids with these prefixes never reach the acquisition tool.
inline constexpr std::string_view kPlaceholderPrefix = "placeholder-";
inline constexpr std::string_view kFallbackPrefix = "fallback-";

// Synthesized mp3 variants, "audio-mp3-<kbps>". The tool has no such id; they
// are fetched by extracting the best audio stream at that bitrate.
inline constexpr std::string_view kMp3Prefix = "audio-mp3-";

struct YTPIPE_EXPORT FormatVariant {
	std::string format_id;
	std::string extension;	   // Container, e.g. "mp4", "mp3"
	std::string quality;	   // Raw note from the tool, e.g. "720p"
	std::string quality_label;	// e.g. "MP4 - 720p with Audio HD"
	bool has_audio = false;
	bool has_video = false;
	long long filesize = 0;	 // Estimated when the tool did not report one
	int audio_channels = 2;
	int height = 0;			 // Ladder tier for video, 0 for audio
	int audio_bitrate = 0;	 // Ladder kbps for audio, 0 for video

	/// Synthesized stand-in for a tier the tool did not report.
	[[nodiscard]] bool is_placeholder() const {
		return std::string_view(format_id).substr(
				   0, kPlaceholderPrefix.size()) == kPlaceholderPrefix ||
			   std::string_view(format_id).substr(0, kFallbackPrefix.size()) ==
				   kFallbackPrefix;
	}
};

struct YTPIPE_EXPORT CaptionTrack {
	std::string lang;  // Language code
	std::string name;  // Display name
};

struct YTPIPE_EXPORT CollectionMember {
	std::string id;
	std::string title;
	long long duration = 0;
	std::string thumbnail;
	int position = 0;  // Zero-based, upstream enumeration order
};

struct YTPIPE_EXPORT ResourceInfo {
	std::string id;
	std::string title;
	std::string description;
	std::string thumbnail;
	long long duration = 0;	 // Seconds
	std::string channel;
	std::vector<FormatVariant> formats;
	std::vector<CaptionTrack> captions;
	std::optional<bool> is_collection;
	std::optional<std::vector<CollectionMember>> collection_members;
};

struct YTPIPE_EXPORT CollectionInfo {
	std::string id;
	std::string title;
	std::string description;
	std::string thumbnail;
	std::string channel;
	std::vector<CollectionMember> members;
};

struct YTPIPE_EXPORT TrimRange {
	long long start = 0;  // Seconds
	long long end = 0;	  // Seconds, must be > start
};

struct YTPIPE_EXPORT CaptionRequest {
	std::string lang;	 // e.g. "en"
	std::string format;	 // e.g. "srt", "vtt"
};

struct YTPIPE_EXPORT DownloadRequest {
	std::string resource_id;
	std::string format_id;
	std::optional<TrimRange> trim;
	std::optional<CaptionRequest> captions;

	// Collection download
	bool is_collection = false;
	std::vector<std::string> member_ids;
};

struct YTPIPE_EXPORT ProgressEvent {
	double percent = 0.0;  // 0-100, non-decreasing within one attempt
	std::string rate;	   // Display string, e.g. "1.23MiB/s"
	std::string eta;	   // Display string or "unknown"
	std::string strategy;  // Tag of the attempt that produced it
};

using ProgressCallback = std::function<void(const ProgressEvent &)>;

enum class DeliveryKind { stream, single_file, archive };

struct YTPIPE_EXPORT DownloadSummary {
	std::string strategy;
	std::uint64_t bytes = 0;
	DeliveryKind delivery = DeliveryKind::stream;
	std::string file_name;	// Suggested name for the delivered payload
};

// Persistent output layout, one folder per category under the download dir.
enum class DownloadCategory {
	video_with_audio,
	video_only,
	audio_only,
	captions_only
};

YTPIPE_EXPORT std::string_view category_folder(DownloadCategory category);
YTPIPE_EXPORT std::optional<DownloadCategory> parse_category(
	std::string_view name);

struct YTPIPE_EXPORT CategoryDownloadOptions {
	std::string url;
	DownloadCategory category = DownloadCategory::video_with_audio;
	std::optional<std::string> resolution;		  // e.g. "1080"
	std::optional<std::string> audio_quality;	  // kbps: 128/192/256/320
	std::optional<std::string> caption_language;  // e.g. "en"
	bool collection = false;
};

struct YTPIPE_EXPORT DownloadedFile {
	std::string name;
	std::string relative_path;	// Relative to the download dir
};

}  // namespace ytpipe
