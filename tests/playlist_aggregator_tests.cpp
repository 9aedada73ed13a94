#include <boost/asio/io_context.hpp>
#include <catch2/catch_all.hpp>
#include <chrono>
#include <ytpipe/pipeline.hpp>
#include <ytpipe/playlist_aggregator.hpp>

#include "fake_runner.hpp"

using namespace ytpipe;
using namespace ytpipe::testing;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

DownloadRequest playlist_request() {
	DownloadRequest req;
	req.is_collection = true;
	req.format_id = "best";
	req.member_ids = {"aaaaaaaaaaa", "bbbbbbbbbbb", "ccccccccccc"};
	return req;
}

Script batch_writes(std::vector<std::pair<std::string, std::string>> files) {
	Script s;
	s.files = std::move(files);
	return s;
}

// Stands in for `zip -j archive files...`: the archive lists its inputs
Script fake_zip(const ProcessRequest &req) {
	Script s;
	if (req.program != "zip" || req.args.size() < 2) return s;
	std::string listing = "ZIP\n";
	for (std::size_t i = 2; i < req.args.size(); ++i) {
		listing += fs::path(req.args[i]).filename().string() + "\n";
	}
	write_file(req.args[1], listing);
	return s;
}

struct Fixture {
	TempDir work;
	boost::asio::io_context ioc;
	std::shared_ptr<FakeRunner> runner =
		std::make_shared<FakeRunner>(ioc.get_executor());
	PipelineConfig config = make_config(work.path());
	PlaylistAggregator aggregator{ioc.get_executor(), runner, config};

	std::shared_ptr<MemorySink> sink = std::make_shared<MemorySink>();
	std::vector<ProgressEvent> events;
	CancelToken cancel;

	Fixture() { runner->respond(fake_zip); }

	static PipelineConfig make_config(const fs::path &work_dir) {
		PipelineConfig c;
		c.work_dir = work_dir;
		c.progress_interval = 0ms;
		return c;
	}

	Result<DownloadSummary> download(DownloadRequest req) {
		return run_until_done<DownloadSummary>(ioc, [&](auto handler) {
			aggregator.async_download(
				std::move(req), sink,
				[this](const ProgressEvent &e) { events.push_back(e); }, cancel,
				std::move(handler));
		});
	}
};

}  // namespace

TEST_CASE_METHOD(Fixture, "Playlist - batch invocation", "[playlist]") {
	runner->push(batch_writes({{"First.mp4", "1"}}));
	REQUIRE(download(playlist_request()).has_value());

	REQUIRE(runner->invocations().size() == 1);
	const auto &batch = runner->invocations()[0];
	CHECK(batch.program == "yt-dlp");
	CHECK(batch.arg_after("-f") == "best");
	CHECK(batch.has_arg("--ignore-errors"));

	auto n = batch.args.size();
	CHECK(batch.args[n - 3] == "https://www.youtube.com/watch?v=aaaaaaaaaaa");
	CHECK(batch.args[n - 2] == "https://www.youtube.com/watch?v=bbbbbbbbbbb");
	CHECK(batch.args[n - 1] == "https://www.youtube.com/watch?v=ccccccccccc");
}

TEST_CASE_METHOD(Fixture, "Playlist - nothing downloaded", "[playlist]") {
	runner->push(batch_writes({{"Broken.mp4.part", "partial"}}));

	CHECK(download(playlist_request()).error() == errc::nothing_downloaded);
	CHECK(runner->invocations().size() == 1);
	CHECK(sink->data().empty());
	CHECK(work.entry_count() == 0);
}

TEST_CASE_METHOD(Fixture, "Playlist - one file passes through", "[playlist]") {
	runner->push(batch_writes({{"Only One.mp4", "only-bytes"}}));

	auto res = download(playlist_request());
	REQUIRE(res.has_value());
	CHECK(res.value().delivery == DeliveryKind::single_file);
	CHECK(res.value().file_name == "Only One.mp4");
	CHECK(res.value().bytes == 10);
	CHECK(sink->data() == "only-bytes");

	CHECK(runner->count_with("-j") == 0);
	CHECK(work.entry_count() == 0);

	REQUIRE_FALSE(events.empty());
	CHECK(events.back().percent == Catch::Approx(100.0));
	CHECK(events.back().strategy == "batch");
}

TEST_CASE_METHOD(Fixture, "Playlist - several files become one archive",
				 "[playlist]") {
	Script batch = batch_writes(
		{{"B.mp4", "bbb"}, {"A.mp4", "aa"}, {"C.mp4.part", "partial"}});
	batch.exit_code = 1;  // One item failed; the others still count
	batch.stderr_text = "ERROR: [youtube] ccccccccccc: Video unavailable\n";
	runner->push(batch);

	auto res = download(playlist_request());
	REQUIRE(res.has_value());
	CHECK(res.value().delivery == DeliveryKind::archive);
	CHECK(res.value().file_name == "playlist.zip");
	CHECK(res.value().strategy == "batch");

	REQUIRE(runner->invocations().size() == 2);
	const auto &zip = runner->invocations()[1];
	CHECK(zip.program == "zip");
	REQUIRE(zip.args.size() == 4);
	CHECK(zip.args[0] == "-j");
	CHECK(fs::path(zip.args[1]).filename() == "playlist.zip");
	CHECK(fs::path(zip.args[2]).filename() == "A.mp4");
	CHECK(fs::path(zip.args[3]).filename() == "B.mp4");

	CHECK(sink->data() == "ZIP\nA.mp4\nB.mp4\n");
	CHECK(res.value().bytes == sink->data().size());

	// Downloaded files and the archive are gone
	CHECK(work.entry_count() == 0);
}

TEST_CASE_METHOD(Fixture, "Playlist - archiver failures", "[playlist]") {
	runner->push(batch_writes({{"A.mp4", "a"}, {"B.mp4", "b"}}));

	SECTION("Non-zero exit") {
		Script s;
		s.exit_code = 12;
		s.stderr_text = "zip error: Nothing to do!\n";
		runner->push(s);
	}

	SECTION("Archiver missing") {
		Script s;
		s.error = make_error_code(errc::executable_not_found);
		runner->push(s);
	}

	SECTION("Success without an archive") {
		runner->push(Script{});
	}

	CHECK(download(playlist_request()).error() == errc::archive_failed);
	CHECK(sink->data().empty());
	CHECK(work.entry_count() == 0);
}

TEST_CASE_METHOD(Fixture, "Playlist - rejected requests", "[playlist]") {
	SECTION("No members") {
		auto req = playlist_request();
		req.member_ids.clear();
		CHECK(download(req).error() == errc::empty_collection);
	}

	SECTION("Bad member id") {
		auto req = playlist_request();
		req.member_ids.push_back("x");
		CHECK(download(req).error() == errc::invalid_resource_ref);
	}

	SECTION("Placeholder format") {
		auto req = playlist_request();
		req.format_id = "placeholder-720p";
		CHECK(download(req).error() == errc::invalid_format);
	}

	SECTION("Cancelled") {
		cancel.cancel();
		CHECK(download(playlist_request()).error() == errc::cancelled);
	}

	CHECK(runner->invocations().empty());
}

TEST_CASE("Pipeline routes collection requests to the batch path",
		  "[playlist]") {
	TempDir work;
	boost::asio::io_context ioc;
	auto runner = std::make_shared<FakeRunner>(ioc.get_executor());
	runner->push(batch_writes({{"Only.mp4", "payload"}}));

	PipelineConfig config;
	config.work_dir = work.path();
	auto pipeline = Pipeline::create(ioc.get_executor(), config, runner);

	auto sink = std::make_shared<MemorySink>();
	auto res = run_until_done<DownloadSummary>(ioc, [&](auto handler) {
		pipeline.async_download(playlist_request(), sink, nullptr,
								CancelToken{}, std::move(handler));
	});

	REQUIRE(res.has_value());
	CHECK(res.value().delivery == DeliveryKind::single_file);
	CHECK(sink->data() == "payload");
	REQUIRE(runner->invocations().size() == 1);
	CHECK_FALSE(runner->invocations()[0].has_arg("--dump-json"));
}
