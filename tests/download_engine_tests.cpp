#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <catch2/catch_all.hpp>
#include <chrono>
#include <sstream>
#include <ytpipe/download_engine.hpp>

#include "fake_runner.hpp"

using namespace ytpipe;
using namespace ytpipe::testing;
using namespace std::chrono_literals;

namespace {

constexpr std::string_view kVideoId = "abc12345678";

ResourceInfo sample_info() {
	ResourceInfo info;
	info.id = std::string(kVideoId);
	info.title = "Sample: Video";
	info.duration = 100;

	FormatVariant real;
	real.format_id = "22";
	real.extension = "mp4";
	real.has_audio = true;
	real.has_video = true;
	real.height = 720;
	info.formats.push_back(real);

	FormatVariant audio;
	audio.format_id = "audio-mp3-192";
	audio.extension = "mp3";
	audio.has_audio = true;
	audio.audio_bitrate = 192;
	info.formats.push_back(audio);

	FormatVariant gap;
	gap.format_id = "placeholder-1080p";
	gap.extension = "mp4";
	gap.has_audio = true;
	gap.has_video = true;
	gap.height = 1080;
	info.formats.push_back(gap);
	return info;
}

DownloadRequest request_for(std::string format_id) {
	DownloadRequest req;
	req.resource_id = std::string(kVideoId);
	req.format_id = std::move(format_id);
	return req;
}

Script direct_output(std::string bytes) {
	Script s;
	s.stdout_text = std::move(bytes);
	return s;
}

Script file_output(std::string bytes) {
	Script s;
	s.files = {{"download.mp4", std::move(bytes)}};
	return s;
}

Script failure(std::string stderr_text) {
	Script s;
	s.exit_code = 1;
	s.stderr_text = std::move(stderr_text);
	return s;
}

// Rejects every write, like a client that went away
class BrokenSink : public DownloadSink {
   public:
	Result<void> write(std::string_view) override {
		return make_error_code(errc::file_write_failed);
	}
	bool discard() override { return true; }
};

struct Fixture {
	TempDir work;
	boost::asio::io_context ioc;
	std::shared_ptr<FakeRunner> runner =
		std::make_shared<FakeRunner>(ioc.get_executor());
	PipelineConfig config = make_config(work.path());
	std::shared_ptr<InfoService> info =
		std::make_shared<InfoService>(ioc.get_executor(), runner, config);
	DownloadEngine engine{ioc.get_executor(), info,
						  DownloadEngine::default_strategies(runner, config)};

	std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
	std::vector<ProgressEvent> events;
	CancelToken cancel;

	Fixture() { info->metadata_cache().put(std::string(kVideoId), sample_info()); }

	static PipelineConfig make_config(const std::filesystem::path &work_dir) {
		PipelineConfig c;
		c.work_dir = work_dir;
		c.progress_interval = 0ms;
		return c;
	}

	Result<DownloadSummary> download(DownloadRequest req,
									 std::shared_ptr<DownloadSink> out) {
		return run_until_done<DownloadSummary>(ioc, [&](auto handler) {
			engine.async_download(
				std::move(req), std::move(out),
				[this](const ProgressEvent &e) { events.push_back(e); }, cancel,
				std::move(handler));
		});
	}

	Result<DownloadSummary> download(DownloadRequest req) {
		return download(std::move(req), sink);
	}
};

}  // namespace

TEST_CASE("validate_request", "[engine]") {
	SECTION("Valid single request") {
		CHECK(validate_request(request_for("22")).has_value());
	}

	SECTION("Reference") {
		auto req = request_for("22");
		req.resource_id = "nope";
		CHECK(validate_request(req).error() == errc::invalid_resource_ref);
	}

	SECTION("Format") {
		CHECK(validate_request(request_for("")).error() == errc::invalid_format);
		CHECK(validate_request(request_for("placeholder-720p")).error() ==
			  errc::invalid_format);
		CHECK(validate_request(request_for("fallback-0")).error() ==
			  errc::invalid_format);
	}

	SECTION("Trim") {
		auto req = request_for("22");
		req.trim = TrimRange{10, 10};
		CHECK(validate_request(req).error() == errc::invalid_trim_range);
		req.trim = TrimRange{-1, 10};
		CHECK(validate_request(req).error() == errc::invalid_trim_range);
		req.trim = TrimRange{0, 1};
		CHECK(validate_request(req).has_value());
	}

	SECTION("Captions") {
		auto req = request_for("22");
		req.captions = CaptionRequest{"en", ""};
		CHECK(validate_request(req).error() == errc::invalid_caption_request);
	}

	SECTION("Collections") {
		DownloadRequest req;
		req.is_collection = true;
		req.format_id = "best";
		CHECK(validate_request(req).error() == errc::empty_collection);
		req.member_ids = {"aaaaaaaaaaa", "bad"};
		CHECK(validate_request(req).error() == errc::invalid_resource_ref);
		req.member_ids = {"aaaaaaaaaaa", "bbbbbbbbbbb"};
		CHECK(validate_request(req).has_value());
	}
}

TEST_CASE_METHOD(Fixture, "Engine - direct stream success", "[engine]") {
	Script s = direct_output("0123456789");
	s.stderr_text = "[download]  50.0% of 10B at 1B/s ETA 00:05\n";
	runner->push(s);

	auto res = download(request_for("22"));
	REQUIRE(res.has_value());
	CHECK(res.value().strategy == "direct");
	CHECK(res.value().bytes == 10);
	CHECK(res.value().delivery == DeliveryKind::stream);
	CHECK(res.value().file_name == "Sample_ Video.mp4");
	CHECK(sink->data() == "0123456789");

	REQUIRE(runner->invocations().size() == 1);
	const auto &inv = runner->invocations()[0];
	CHECK(inv.program == "yt-dlp");
	CHECK(inv.arg_after("-f") == "22");
	CHECK(inv.arg_after("-o") == "-");
	CHECK(inv.args.back() == "https://www.youtube.com/watch?v=abc12345678");

	REQUIRE(events.size() == 2);
	CHECK(events[0].percent == Catch::Approx(50.0));
	CHECK(events[0].strategy == "direct");
	CHECK(events.back().percent == Catch::Approx(100.0));
}

TEST_CASE_METHOD(Fixture, "Engine - invalid requests spawn nothing",
				 "[engine]") {
	SECTION("Placeholder format") {
		CHECK(download(request_for("placeholder-1080p")).error() ==
			  errc::invalid_format);
	}

	SECTION("Format missing from the catalog") {
		CHECK(download(request_for("999")).error() == errc::invalid_format);
	}

	SECTION("End not after start") {
		auto req = request_for("22");
		req.trim = TrimRange{30, 20};
		CHECK(download(req).error() == errc::invalid_trim_range);
	}

	SECTION("Bad reference") {
		auto req = request_for("22");
		req.resource_id = "https://example.com/video";
		CHECK(download(req).error() == errc::invalid_resource_ref);
	}

	SECTION("Collection request") {
		auto req = request_for("22");
		req.resource_id.clear();
		req.is_collection = true;
		req.member_ids = {"aaaaaaaaaaa", "bbbbbbbbbbb"};
		CHECK(download(req).error() == errc::invalid_resource_ref);
	}

	CHECK(runner->invocations().empty());
	CHECK(sink->data().empty());
}

TEST_CASE_METHOD(Fixture, "Engine - zero-byte direct falls back once",
				 "[engine]") {
	runner->push(direct_output(""));
	runner->push(file_output("from-file"));

	auto res = download(request_for("22"));
	REQUIRE(res.has_value());
	CHECK(res.value().strategy == "file");
	CHECK(res.value().bytes == 9);
	CHECK(sink->data() == "from-file");

	REQUIRE(runner->invocations().size() == 2);
	const auto &file_attempt = runner->invocations()[1];
	CHECK(file_attempt.arg_after("--merge-output-format") == "mp4");
	CHECK(file_attempt.has_arg("--newline"));
	CHECK(file_attempt.arg_after("-o").find("download.%(ext)s") !=
		  std::string::npos);

	// The file attempt's working directory is gone
	CHECK(work.entry_count() == 0);
}

TEST_CASE_METHOD(Fixture, "Engine - mp3 variants are extracted to a file",
				 "[engine]") {
	Script s;
	s.files = {{"download.mp3", "mp3-bytes"}};
	runner->push(s);

	auto res = download(request_for("audio-mp3-192"));
	REQUIRE(res.has_value());
	CHECK(res.value().strategy == "file");
	CHECK(res.value().file_name == "Sample_ Video.mp3");
	CHECK(sink->data() == "mp3-bytes");

	// Stdout cannot carry the transcoded result, so no direct attempt
	REQUIRE(runner->invocations().size() == 1);
	const auto &inv = runner->invocations()[0];
	CHECK(inv.arg_after("-f") == "bestaudio");
	CHECK(inv.has_arg("-x"));
	CHECK(inv.arg_after("--audio-format") == "mp3");
	CHECK(inv.arg_after("--audio-quality") == "192K");
	CHECK_FALSE(inv.has_arg("audio-mp3-192"));
	CHECK(work.entry_count() == 0);
}

TEST_CASE_METHOD(Fixture, "Engine - forbidden direct falls back", "[engine]") {
	runner->push(failure("ERROR: HTTP Error 403: Forbidden\n"));

	Script s;
	s.files = {{"download.mp4", "media-bytes"}, {"download.en.vtt", "cap"}};
	runner->push(s);

	auto res = download(request_for("22"));
	REQUIRE(res.has_value());
	CHECK(res.value().strategy == "file");
	CHECK(sink->data() == "media-bytes");
}

TEST_CASE_METHOD(Fixture, "Engine - every strategy fails", "[engine]") {
	runner->push(failure("ERROR: HTTP Error 403: Forbidden\n"));
	runner->push(failure("ERROR: HTTP Error 403: Forbidden\n"));

	CHECK(download(request_for("22")).error() == errc::access_forbidden);
	CHECK(runner->invocations().size() == 2);
	CHECK(work.entry_count() == 0);
}

TEST_CASE_METHOD(Fixture, "Engine - file attempt without output", "[engine]") {
	runner->push(direct_output(""));
	runner->push(Script{});

	CHECK(download(request_for("22")).error() == errc::empty_result);
	CHECK(runner->invocations().size() == 2);
}

TEST_CASE_METHOD(Fixture, "Engine - classified failures do not fall back",
				 "[engine]") {
	SECTION("Age restricted") {
		runner->push(failure("ERROR: Sign in to confirm your age\n"));
		CHECK(download(request_for("22")).error() == errc::age_restricted);
	}

	SECTION("Unavailable") {
		runner->push(failure("ERROR: Video unavailable\n"));
		CHECK(download(request_for("22")).error() ==
			  errc::resource_unavailable);
	}

	SECTION("Missing executable") {
		Script s;
		s.error = make_error_code(errc::executable_not_found);
		runner->push(s);
		CHECK(download(request_for("22")).error() ==
			  errc::executable_not_found);
	}

	CHECK(runner->invocations().size() == 1);
}

TEST_CASE_METHOD(Fixture, "Engine - delivered bytes block the fallback",
				 "[engine]") {
	Script s = direct_output("partial");
	s.exit_code = 1;
	s.stderr_text = "ERROR: HTTP Error 403: Forbidden\n";
	runner->push(s);

	std::ostringstream client;
	auto out = std::make_shared<OStreamSink>(client);

	CHECK(download(request_for("22"), out).error() ==
		  errc::stream_interrupted);
	CHECK(runner->invocations().size() == 1);
	CHECK(client.str() == "partial");
}

TEST_CASE_METHOD(Fixture, "Engine - discardable partial data is dropped",
				 "[engine]") {
	Script s = direct_output("partial");
	s.exit_code = 1;
	s.stderr_text = "ERROR: HTTP Error 403: Forbidden\n";
	runner->push(s);
	runner->push(file_output("complete"));

	auto res = download(request_for("22"));
	REQUIRE(res.has_value());
	CHECK(sink->data() == "complete");
}

TEST_CASE_METHOD(Fixture, "Engine - sink write failure", "[engine]") {
	runner->push(direct_output("bytes"));

	CHECK(download(request_for("22"), std::make_shared<BrokenSink>()).error() ==
		  errc::file_write_failed);
	CHECK(runner->invocations().size() == 1);
}

TEST_CASE_METHOD(Fixture, "Engine - trim and captions reach the tool",
				 "[engine]") {
	runner->push(direct_output("clip"));

	auto req = request_for("22");
	req.trim = TrimRange{5, 15};
	req.captions = CaptionRequest{"en", "srt"};

	auto res = download(req);
	REQUIRE(res.has_value());

	REQUIRE(runner->invocations().size() == 1);
	const auto &inv = runner->invocations()[0];
	CHECK(inv.arg_after("--download-sections") == "*5-15");
	CHECK(inv.arg_after("--sub-langs") == "en");
	CHECK(inv.arg_after("--sub-format") == "srt");

	// Caption files were confined to a scratch directory, now removed
	CHECK_FALSE(inv.working_dir.empty());
	CHECK(inv.working_dir.parent_path() == work.path());
	CHECK(work.entry_count() == 0);
}

TEST_CASE_METHOD(Fixture, "Engine - cancellation", "[engine]") {
	SECTION("Before the first attempt") {
		cancel.cancel();
		CHECK(download(request_for("22")).error() == errc::cancelled);
		CHECK(runner->invocations().empty());
	}

	SECTION("During the direct attempt") {
		Script s;
		s.wait_for_cancel = true;
		runner->push(s);

		boost::asio::steady_timer timer(ioc, 20ms);
		timer.async_wait([this](const boost::system::error_code &) {
			cancel.cancel();
		});

		CHECK(download(request_for("22")).error() == errc::cancelled);

		// No fallback after cancellation
		CHECK(runner->invocations().size() == 1);
		CHECK(work.entry_count() == 0);
	}

	SECTION("During the metadata fetch") {
		info->clear_caches();
		Script s;
		s.wait_for_cancel = true;
		runner->push(s);

		boost::asio::steady_timer timer(ioc, 20ms);
		timer.async_wait([this](const boost::system::error_code &) {
			cancel.cancel();
		});

		CHECK(download(request_for("22")).error() == errc::cancelled);

		// The dump was stopped and nothing else ran
		REQUIRE(runner->invocations().size() == 1);
		CHECK(runner->invocations()[0].has_arg("--dump-json"));
		CHECK(info->metadata_cache().size() == 0);
		CHECK(sink->data().empty());
	}
}
