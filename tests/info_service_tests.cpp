#include <algorithm>
#include <boost/asio/io_context.hpp>
#include <catch2/catch_all.hpp>
#include <nlohmann/json.hpp>
#include <ytpipe/info_service.hpp>

#include "fake_runner.hpp"

using namespace ytpipe;
using namespace ytpipe::testing;

namespace {

constexpr std::string_view kVideoId = "abc12345678";

const char *kDump = R"({
	"id": "abc12345678",
	"title": "Sample Video",
	"description": "A test upload",
	"thumbnail": "https://i.ytimg.com/vi/abc12345678/hq.jpg",
	"duration": 100,
	"uploader": "Sample Channel",
	"formats": [
		{"format_id": "22", "ext": "mp4", "vcodec": "avc1", "acodec": "mp4a",
		 "height": 720, "filesize": 5000000, "format_note": "720p"},
		{"format_id": "137", "ext": "mp4", "vcodec": "avc1", "acodec": "none",
		 "height": 1080, "filesize_approx": 9000000, "format_note": "1080p"},
		{"format_id": "251", "ext": "webm", "vcodec": "none",
		 "acodec": "opus", "abr": 160}
	],
	"subtitles": {
		"en": [{"ext": "vtt", "name": "English (Original)"}],
		"de": []
	}
})";

// Answers like the acquisition tool for one video and one playlist
Script tool_like(const ProcessRequest &req) {
	Script s;
	if (has_arg(req, "--flat-playlist")) {
		if (req.args.back().find("PLbroken") != std::string::npos) {
			s.exit_code = 1;
			s.stderr_text = "ERROR: The playlist does not exist\n";
			return s;
		}
		s.stdout_text =
			R"({"id": "aaaaaaaaaaa", "title": "First", "playlist": "My List", "uploader": "List Owner", "duration": 10})"
			"\n"
			"this line is not json\n"
			R"({"id": "bbbbbbbbbbb"})"
			"\n"
			R"({"id": "ccccccccccc", "title": "Third", "thumbnails": [{"url": "t0"}, {"url": "t1"}]})"
			"\n";
		return s;
	}
	if (has_arg(req, "--extract-audio")) {
		auto quality = arg_after(req, "--audio-quality");
		if (quality == "256K") {
			s.exit_code = 1;
			s.stderr_text = "ERROR: postprocessing failed\n";
			return s;
		}
		s.stdout_text = R"({"duration": 100, "filesize": 4242})";
		return s;
	}
	if (has_arg(req, "--dump-json")) {
		// The dump is a single line in real output
		auto j = nlohmann::json::parse(kDump);
		s.stdout_text = "[youtube] Extracting URL\n" + j.dump() + "\n";
		return s;
	}
	if (has_arg(req, "--list-formats")) {
		s.stdout_text =
			"[info] Available formats for abc12345678:\n"
			"ID  EXT   RESOLUTION FPS\n"
			"---------------------------\n"
			"18  mp4   640x360    30\n"
			"22  mp4   1280x720   30\n";
		return s;
	}
	return s;
}

const FormatVariant *find(const std::vector<FormatVariant> &formats,
						  std::string_view id) {
	auto it = std::find_if(formats.begin(), formats.end(),
						   [&](const FormatVariant &f) {
							   return f.format_id == id;
						   });
	return it == formats.end() ? nullptr : &*it;
}

struct Fixture {
	boost::asio::io_context ioc;
	std::shared_ptr<FakeRunner> runner =
		std::make_shared<FakeRunner>(ioc.get_executor());
	InfoService info{ioc.get_executor(), runner, PipelineConfig{}};

	Fixture() { runner->respond(tool_like); }

	Result<ResourceInfo> fetch(std::string ref) {
		return run_until_done<ResourceInfo>(ioc, [&](auto handler) {
			info.async_fetch_info(std::move(ref), std::move(handler));
		});
	}

	Result<ResourceInfo> fetch(std::string ref, CancelToken cancel) {
		return run_until_done<ResourceInfo>(ioc, [&](auto handler) {
			info.async_fetch_info(std::move(ref), std::move(cancel),
								  std::move(handler));
		});
	}

	Result<CollectionInfo> fetch_collection(std::string id) {
		return run_until_done<CollectionInfo>(ioc, [&](auto handler) {
			info.async_fetch_collection_info(std::move(id), std::move(handler));
		});
	}

	Result<std::vector<std::string>> list(std::string ref) {
		return run_until_done<std::vector<std::string>>(
			ioc, [&](auto handler) {
				info.async_list_formats(std::move(ref), std::move(handler));
			});
	}
};

}  // namespace

TEST_CASE_METHOD(Fixture, "InfoService - single video metadata", "[info]") {
	auto res = fetch(std::string(kVideoId));
	REQUIRE(res.has_value());
	const auto &info = res.value();

	CHECK(info.id == kVideoId);
	CHECK(info.title == "Sample Video");
	CHECK(info.channel == "Sample Channel");
	CHECK(info.duration == 100);
	CHECK_FALSE(info.is_collection.has_value());

	// One dump plus one estimate per mp3 bitrate
	CHECK(runner->invocations().size() == 5);
	CHECK(runner->count_with("--extract-audio") == 4);

	SECTION("Catalog") {
		CHECK(find(info.formats, "22"));
		CHECK(find(info.formats, "137"));
		CHECK_FALSE(find(info.formats, "251"));
		CHECK(find(info.formats, "audio-mp3-320"));
		CHECK(find(info.formats, "audio-mp3-192"));
		CHECK(find(info.formats, "audio-mp3-128"));

		// The failed 256 kbps estimate is covered by a placeholder
		CHECK_FALSE(find(info.formats, "audio-mp3-256"));
		const auto *gap = find(info.formats, "placeholder-audio-256");
		REQUIRE(gap);
		CHECK(gap->is_placeholder());

		const auto *estimated = find(info.formats, "audio-mp3-320");
		REQUIRE(estimated);
		CHECK(estimated->filesize == 4242);
		CHECK(estimated->quality_label == "MP3 - 320kbps");

		CHECK(info.formats.front().has_video);
		CHECK(info.formats.front().has_audio);
	}

	SECTION("Captions") {
		REQUIRE(info.captions.size() == 2);
		auto en = std::find_if(info.captions.begin(), info.captions.end(),
							   [](const CaptionTrack &c) { return c.lang == "en"; });
		auto de = std::find_if(info.captions.begin(), info.captions.end(),
							   [](const CaptionTrack &c) { return c.lang == "de"; });
		REQUIRE(en != info.captions.end());
		REQUIRE(de != info.captions.end());
		CHECK(en->name == "English (Original)");
		CHECK(de->name == "German");
	}

	SECTION("Metadata is cached") {
		auto again = fetch("https://youtu.be/abc12345678");
		REQUIRE(again.has_value());
		CHECK(again.value().title == "Sample Video");
		CHECK(runner->invocations().size() == 5);

		info.clear_caches();
		REQUIRE(fetch(std::string(kVideoId)).has_value());
		CHECK(runner->invocations().size() == 10);
	}
}

TEST_CASE_METHOD(Fixture, "InfoService - cancellation", "[info]") {
	CancelToken cancel;

	SECTION("Before the dump") {
		cancel.cancel();
		CHECK(fetch(std::string(kVideoId), cancel).error() == errc::cancelled);
		CHECK(runner->invocations().empty());
	}

	SECTION("Between the mp3 estimates") {
		runner->respond([cancel](const ProcessRequest &req) mutable {
			if (arg_after(req, "--audio-quality") == "320K") cancel.cancel();
			return tool_like(req);
		});

		CHECK(fetch(std::string(kVideoId), cancel).error() == errc::cancelled);

		// The dump and the first estimate only
		CHECK(runner->invocations().size() == 2);
		CHECK(runner->count_with("--extract-audio") == 1);
		CHECK(info.metadata_cache().size() == 0);
	}
}

TEST_CASE_METHOD(Fixture, "InfoService - rejected references", "[info]") {
	CHECK(fetch("not a video").error() == errc::invalid_resource_ref);
	CHECK(fetch_collection("bad id!").error() == errc::invalid_resource_ref);
	CHECK(runner->invocations().empty());
}

TEST_CASE_METHOD(Fixture, "InfoService - tool failures are classified",
				 "[info]") {
	runner->push(Script{1, "", "ERROR: [youtube] abc12345678: Private video\n"});
	CHECK(fetch(std::string(kVideoId)).error() == errc::resource_unavailable);

	runner->push(Script{1, "", "ERROR: Sign in to confirm your age\n"});
	CHECK(fetch(std::string(kVideoId)).error() == errc::age_restricted);

	runner->push(Script{0, "no json here\n", ""});
	CHECK(fetch(std::string(kVideoId)).error() == errc::json_parse_error);
}

TEST_CASE_METHOD(Fixture, "InfoService - playlist entries", "[info]") {
	auto res = fetch_collection("PLtest123");
	REQUIRE(res.has_value());
	const auto &coll = res.value();

	CHECK(coll.id == "PLtest123");
	CHECK(coll.title == "My List");
	CHECK(coll.channel == "List Owner");
	REQUIRE(coll.members.size() == 3);

	for (std::size_t i = 0; i < coll.members.size(); ++i) {
		CHECK(coll.members[i].position == static_cast<int>(i));
	}
	CHECK(coll.members[0].id == "aaaaaaaaaaa");
	CHECK(coll.members[0].duration == 10);
	CHECK(coll.members[1].title == "Video 2");
	CHECK(coll.members[2].thumbnail == "t1");

	CHECK(runner->invocations().size() == 1);
	CHECK(runner->invocations()[0].args.back() ==
		  "https://www.youtube.com/playlist?list=PLtest123");
}

TEST_CASE_METHOD(Fixture, "InfoService - playlist references", "[info]") {
	SECTION("Bare playlist borrows the first entry's catalog") {
		auto res = fetch("https://www.youtube.com/playlist?list=PLtest123");
		REQUIRE(res.has_value());
		const auto &info = res.value();
		CHECK(info.id == "PLtest123");
		CHECK(info.title == "My List");
		REQUIRE(info.is_collection.has_value());
		CHECK(*info.is_collection);
		REQUIRE(info.collection_members.has_value());
		CHECK(info.collection_members->size() == 3);
		CHECK(find(info.formats, "22"));

		// The catalog came from the first member
		CHECK(runner->invocations()[1].args.back() ==
			  "https://www.youtube.com/watch?v=aaaaaaaaaaa");
	}

	SECTION("Video inside a playlist keeps its own details") {
		auto res = fetch(
			"https://www.youtube.com/watch?v=abc12345678&list=PLtest123");
		REQUIRE(res.has_value());
		CHECK(res.value().title == "Sample Video");
		CHECK(res.value().is_collection.value_or(false));
		CHECK(res.value().collection_members->size() == 3);
	}

	SECTION("Broken playlist falls back to the single video") {
		auto res = fetch(
			"https://www.youtube.com/watch?v=abc12345678&list=PLbroken");
		REQUIRE(res.has_value());
		CHECK(res.value().id == kVideoId);
		CHECK_FALSE(res.value().is_collection.has_value());
	}

	SECTION("Broken bare playlist fails") {
		auto res = fetch("https://www.youtube.com/playlist?list=PLbroken");
		CHECK(res.error() == errc::download_failed);
	}
}

TEST_CASE_METHOD(Fixture, "InfoService - raw format table", "[info]") {
	auto rows = list(std::string(kVideoId));
	REQUIRE(rows.has_value());
	CHECK(rows.value() ==
		  std::vector<std::string>{"18  mp4   640x360    30",
								   "22  mp4   1280x720   30"});

	REQUIRE(list(std::string(kVideoId)).has_value());
	CHECK(runner->invocations().size() == 1);
}

TEST_CASE("parse_resource_dump defaults", "[info]") {
	auto info = parse_resource_dump(nlohmann::json::parse(R"({"id": "x"})"));
	CHECK(info.title == "Unknown Title");
	CHECK(info.channel == "Unknown Channel");
	CHECK(info.duration == 0);
	CHECK(info.captions.empty());

	auto with_channel = parse_resource_dump(
		nlohmann::json::parse(R"({"channel": "Fallback Channel"})"));
	CHECK(with_channel.channel == "Fallback Channel");

	CHECK(caption_language_name("ja") == "Japanese");
	CHECK(caption_language_name("tlh") == "tlh");
}

TEST_CASE("ResourceInfo JSON shape", "[info]") {
	ResourceInfo info;
	info.id = "abc12345678";
	info.title = "T";
	FormatVariant f;
	f.format_id = "placeholder-720p";
	f.extension = "mp4";
	info.formats.push_back(f);

	nlohmann::json j = info;
	CHECK(j["id"] == "abc12345678");
	CHECK(j["formats"][0]["placeholder"] == true);
	CHECK_FALSE(j.contains("isPlaylist"));

	info.is_collection = true;
	info.collection_members = std::vector<CollectionMember>{{"a", "b", 1, "", 0}};
	j = info;
	CHECK(j["isPlaylist"] == true);
	CHECK(j["playlistItems"].size() == 1);
}
