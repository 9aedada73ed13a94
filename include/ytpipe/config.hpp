#pragma once

#include <ytpipe/ytpipe_export.h>

#include <chrono>
#include <filesystem>
#include <map>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <ytpipe/result.hpp>
#include <ytpipe/ttl_cache.hpp>

namespace ytpipe {

// Static resilience flags passed to every acquisition tool invocation.
// Never derived from user input.
struct YTPIPE_EXPORT ToolOptions {
	int retries = 10;				 // --extractor-retries / --retries
	int fragment_retries = 20;		 // --fragment-retries
	int retry_sleep = 1;			 // --retry-sleep (seconds)
	std::string buffer_size = "16M";  // --buffer-size
	int socket_timeout = 180;		 // --socket-timeout (seconds)
	std::string throttled_rate = "10M";	 // --throttled-rate
	int concurrent_fragments = 5;		 // --concurrent-fragments
	bool force_ipv4 = true;
	bool geo_bypass = true;
	bool no_check_certificates = true;
	std::string user_agent =
		"Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, "
		"like Gecko) Chrome/122.0.0.0 Safari/537.36";
	std::map<std::string, std::string> headers = {
		{"Accept-Language", "en-US,en;q=0.9"},
		{"Accept",
		 "text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,*/"
		 "*;q=0.8"},
		{"Accept-Encoding", "gzip, deflate, br"},
		{"Referer", "https://www.youtube.com"},
	};
	std::string extractor_args = "youtube:player_client=android,web";

	// The file-buffered strategy trades throughput for stability
	std::string file_throttled_rate = "100K";
	std::string file_buffer_size = "16K";
};

// Defaults for category downloads into the download dir.
struct YTPIPE_EXPORT CategoryDefaults {
	std::string resolution = "1080";
	std::string audio_quality = "192";
	int max_concurrent_fragments = 16;
	std::string caption_language = "en";
};

struct YTPIPE_EXPORT PipelineConfig {
	std::string yt_dlp_path = "yt-dlp";
	std::string archiver_path = "zip";
	std::optional<std::string> ffmpeg_location;

	std::filesystem::path download_dir = "downloads";
	std::filesystem::path work_dir;	 // Empty: system temp directory

	ToolOptions tool;
	CategoryDefaults defaults;
	CacheConfig metadata_cache;
	CacheConfig format_cache;
	std::chrono::milliseconds progress_interval{500};

	/// work_dir, or the system temp directory when unset.
	[[nodiscard]] std::filesystem::path effective_work_dir() const;
};

YTPIPE_EXPORT void to_json(nlohmann::json &j, const ToolOptions &o);
YTPIPE_EXPORT void from_json(const nlohmann::json &j, ToolOptions &o);
YTPIPE_EXPORT void to_json(nlohmann::json &j, const CategoryDefaults &d);
YTPIPE_EXPORT void from_json(const nlohmann::json &j, CategoryDefaults &d);
YTPIPE_EXPORT void to_json(nlohmann::json &j, const CacheConfig &c);
YTPIPE_EXPORT void from_json(const nlohmann::json &j, CacheConfig &c);
YTPIPE_EXPORT void to_json(nlohmann::json &j, const PipelineConfig &c);
YTPIPE_EXPORT void from_json(const nlohmann::json &j, PipelineConfig &c);

/// Load JSON config. Missing keys keep their defaults. If the file does not
/// exist, the defaults are written to it and returned.
YTPIPE_EXPORT Result<PipelineConfig> load_config(
	const std::filesystem::path &path);

YTPIPE_EXPORT Result<void> save_config(const std::filesystem::path &path,
									   const PipelineConfig &config);

}  // namespace ytpipe
