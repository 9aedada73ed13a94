#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <ytpipe/config.hpp>

#include "fake_runner.hpp"

using namespace ytpipe;
using ytpipe::testing::read_file;
using ytpipe::testing::TempDir;
using ytpipe::testing::write_file;

TEST_CASE("Config defaults", "[config]") {
	PipelineConfig config;
	CHECK(config.yt_dlp_path == "yt-dlp");
	CHECK(config.archiver_path == "zip");
	CHECK(config.tool.retries == 10);
	CHECK(config.tool.fragment_retries == 20);
	CHECK(config.tool.socket_timeout == 180);
	CHECK(config.tool.buffer_size == "16M");
	CHECK(config.defaults.resolution == "1080");
	CHECK(config.defaults.audio_quality == "192");
	CHECK(config.metadata_cache.capacity == 100);
	CHECK(config.metadata_cache.ttl == std::chrono::hours(1));
}

TEST_CASE("load_config writes defaults when the file is missing", "[config]") {
	TempDir dir;
	auto path = dir.path() / "sub" / "config.json";

	auto loaded = load_config(path);
	REQUIRE(loaded.has_value());
	CHECK(loaded.value().yt_dlp_path == "yt-dlp");
	REQUIRE(std::filesystem::exists(path));

	auto j = nlohmann::json::parse(read_file(path));
	CHECK(j["defaults"]["DefaultResolution"] == "1080");
	CHECK(j["defaults"]["SubtitleLanguage"] == "en");
}

TEST_CASE("load_config keeps defaults for missing keys", "[config]") {
	TempDir dir;
	auto path = dir.path() / "config.json";
	write_file(path, R"({
		"yt_dlp_path": "/opt/bin/yt-dlp",
		"ffmpeg_location": "/opt/ffmpeg",
		"defaults": {"DefaultAudioQuality": "320"},
		"metadata_cache": {"capacity": 5, "ttl_seconds": 60},
		"progress_interval_ms": 250
	})");

	auto loaded = load_config(path);
	REQUIRE(loaded.has_value());
	const auto &c = loaded.value();
	CHECK(c.yt_dlp_path == "/opt/bin/yt-dlp");
	CHECK(c.archiver_path == "zip");
	REQUIRE(c.ffmpeg_location.has_value());
	CHECK(*c.ffmpeg_location == "/opt/ffmpeg");
	CHECK(c.defaults.audio_quality == "320");
	CHECK(c.defaults.resolution == "1080");
	CHECK(c.metadata_cache.capacity == 5);
	CHECK(c.metadata_cache.ttl == std::chrono::seconds(60));
	CHECK(c.format_cache.capacity == 100);
	CHECK(c.progress_interval == std::chrono::milliseconds(250));
	CHECK(c.tool.retries == 10);
}

TEST_CASE("load_config rejects malformed files", "[config]") {
	TempDir dir;

	SECTION("Not JSON") {
		auto path = dir.path() / "broken.json";
		write_file(path, "{ not json");
		CHECK(load_config(path).error() == errc::json_parse_error);
	}

	SECTION("Not an object") {
		auto path = dir.path() / "array.json";
		write_file(path, "[1, 2, 3]");
		CHECK(load_config(path).error() == errc::json_parse_error);
	}

	SECTION("Wrong value type") {
		auto path = dir.path() / "typed.json";
		write_file(path, R"({"tool": {"retries": "many"}})");
		CHECK(load_config(path).error() == errc::config_error);
	}
}

TEST_CASE("save_config output loads back", "[config]") {
	TempDir dir;
	auto path = dir.path() / "config.json";

	PipelineConfig config;
	config.download_dir = "/srv/media";
	config.tool.extractor_args.clear();
	config.defaults.caption_language = "de";
	REQUIRE(save_config(path, config).has_value());

	auto loaded = load_config(path);
	REQUIRE(loaded.has_value());
	CHECK(loaded.value().download_dir == "/srv/media");
	CHECK(loaded.value().tool.extractor_args.empty());
	CHECK(loaded.value().defaults.caption_language == "de");
}

TEST_CASE("effective_work_dir falls back to the temp directory", "[config]") {
	PipelineConfig config;
	CHECK(config.effective_work_dir() ==
		  std::filesystem::temp_directory_path());
	config.work_dir = "/var/tmp/ytpipe";
	CHECK(config.effective_work_dir() == "/var/tmp/ytpipe");
}
