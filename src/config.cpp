#include <spdlog/spdlog.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>
#include <ytpipe/config.hpp>

namespace ytpipe {

namespace fs = std::filesystem;

fs::path PipelineConfig::effective_work_dir() const {
	if (!work_dir.empty()) return work_dir;
	std::error_code ec;
	auto tmp = fs::temp_directory_path(ec);
	return ec ? fs::path(".") : tmp;
}

void to_json(nlohmann::json &j, const ToolOptions &o) {
	j = nlohmann::json{
		{"retries", o.retries},
		{"fragment_retries", o.fragment_retries},
		{"retry_sleep", o.retry_sleep},
		{"buffer_size", o.buffer_size},
		{"socket_timeout", o.socket_timeout},
		{"throttled_rate", o.throttled_rate},
		{"concurrent_fragments", o.concurrent_fragments},
		{"force_ipv4", o.force_ipv4},
		{"geo_bypass", o.geo_bypass},
		{"no_check_certificates", o.no_check_certificates},
		{"user_agent", o.user_agent},
		{"headers", o.headers},
		{"extractor_args", o.extractor_args},
		{"file_throttled_rate", o.file_throttled_rate},
		{"file_buffer_size", o.file_buffer_size},
	};
}

void from_json(const nlohmann::json &j, ToolOptions &o) {
	ToolOptions d;
	o.retries = j.value("retries", d.retries);
	o.fragment_retries = j.value("fragment_retries", d.fragment_retries);
	o.retry_sleep = j.value("retry_sleep", d.retry_sleep);
	o.buffer_size = j.value("buffer_size", d.buffer_size);
	o.socket_timeout = j.value("socket_timeout", d.socket_timeout);
	o.throttled_rate = j.value("throttled_rate", d.throttled_rate);
	o.concurrent_fragments =
		j.value("concurrent_fragments", d.concurrent_fragments);
	o.force_ipv4 = j.value("force_ipv4", d.force_ipv4);
	o.geo_bypass = j.value("geo_bypass", d.geo_bypass);
	o.no_check_certificates =
		j.value("no_check_certificates", d.no_check_certificates);
	o.user_agent = j.value("user_agent", d.user_agent);
	o.headers = j.value("headers", d.headers);
	o.extractor_args = j.value("extractor_args", d.extractor_args);
	o.file_throttled_rate =
		j.value("file_throttled_rate", d.file_throttled_rate);
	o.file_buffer_size = j.value("file_buffer_size", d.file_buffer_size);
}

void to_json(nlohmann::json &j, const CategoryDefaults &d) {
	j = nlohmann::json{
		{"DefaultResolution", d.resolution},
		{"DefaultAudioQuality", d.audio_quality},
		{"MaxConcurrentFragments", d.max_concurrent_fragments},
		{"SubtitleLanguage", d.caption_language},
	};
}

void from_json(const nlohmann::json &j, CategoryDefaults &d) {
	CategoryDefaults def;
	d.resolution = j.value("DefaultResolution", def.resolution);
	d.audio_quality = j.value("DefaultAudioQuality", def.audio_quality);
	d.max_concurrent_fragments =
		j.value("MaxConcurrentFragments", def.max_concurrent_fragments);
	d.caption_language = j.value("SubtitleLanguage", def.caption_language);
}

void to_json(nlohmann::json &j, const CacheConfig &c) {
	j = nlohmann::json{
		{"capacity", c.capacity},
		{"ttl_seconds",
		 std::chrono::duration_cast<std::chrono::seconds>(c.ttl).count()},
	};
}

void from_json(const nlohmann::json &j, CacheConfig &c) {
	CacheConfig d;
	c.capacity = j.value("capacity", d.capacity);
	c.ttl = std::chrono::seconds(j.value(
		"ttl_seconds",
		std::chrono::duration_cast<std::chrono::seconds>(d.ttl).count()));
}

void to_json(nlohmann::json &j, const PipelineConfig &c) {
	j = nlohmann::json{
		{"yt_dlp_path", c.yt_dlp_path},
		{"archiver_path", c.archiver_path},
		{"download_dir", c.download_dir.string()},
		{"work_dir", c.work_dir.string()},
		{"tool", c.tool},
		{"defaults", c.defaults},
		{"metadata_cache", c.metadata_cache},
		{"format_cache", c.format_cache},
		{"progress_interval_ms", c.progress_interval.count()},
	};
	if (c.ffmpeg_location) j["ffmpeg_location"] = *c.ffmpeg_location;
}

void from_json(const nlohmann::json &j, PipelineConfig &c) {
	PipelineConfig d;
	c.yt_dlp_path = j.value("yt_dlp_path", d.yt_dlp_path);
	c.archiver_path = j.value("archiver_path", d.archiver_path);
	if (j.contains("ffmpeg_location") && j["ffmpeg_location"].is_string()) {
		c.ffmpeg_location = j["ffmpeg_location"].get<std::string>();
	}
	c.download_dir = j.value("download_dir", d.download_dir.string());
	c.work_dir = j.value("work_dir", d.work_dir.string());
	c.tool = j.value("tool", d.tool);
	c.defaults = j.value("defaults", d.defaults);
	c.metadata_cache = j.value("metadata_cache", d.metadata_cache);
	c.format_cache = j.value("format_cache", d.format_cache);
	c.progress_interval = std::chrono::milliseconds(
		j.value("progress_interval_ms", d.progress_interval.count()));
}

Result<PipelineConfig> load_config(const fs::path &path) {
	std::error_code ec;
	if (!fs::exists(path, ec)) {
		spdlog::info("Config {} not found, writing defaults", path.string());
		PipelineConfig defaults;
		auto saved = save_config(path, defaults);
		if (saved.has_error()) return saved.error();
		return defaults;
	}

	std::ifstream in(path);
	if (!in) {
		spdlog::error("Could not open config file '{}'", path.string());
		return make_error_code(errc::file_open_failed);
	}

	auto j = nlohmann::json::parse(in, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		spdlog::error("Config file '{}' is not a JSON object", path.string());
		return make_error_code(errc::json_parse_error);
	}

	try {
		return j.get<PipelineConfig>();
	} catch (const nlohmann::json::exception &e) {
		spdlog::error("Invalid config '{}': {}", path.string(), e.what());
		return make_error_code(errc::config_error);
	}
}

Result<void> save_config(const fs::path &path, const PipelineConfig &config) {
	std::error_code ec;
	if (path.has_parent_path()) fs::create_directories(path.parent_path(), ec);

	std::ofstream out(path, std::ios::trunc);
	if (!out) {
		spdlog::error("Could not write config file '{}'", path.string());
		return make_error_code(errc::file_open_failed);
	}
	out << nlohmann::json(config).dump(2) << "\n";
	if (!out) return make_error_code(errc::file_write_failed);
	return outcome::success();
}

}  // namespace ytpipe
