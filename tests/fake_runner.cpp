#include "fake_runner.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>

namespace ytpipe::testing {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kChunkSize = 4096;

// One in-flight fake run; completes exactly once.
struct Pending {
	ProcessRequest request;
	ProcessRunner::Handler handler;
	ProcessRunner::CompletionExecutor handler_ex;
	bool done = false;

	Pending(ProcessRequest req, ProcessRunner::Handler h,
			ProcessRunner::CompletionExecutor ex)
		: request(std::move(req)),
		  handler(std::move(h)),
		  handler_ex(std::move(ex)) {}

	void finish(Result<ProcessResult> res) {
		if (done) return;
		done = true;
		asio::dispatch(handler_ex, [h = std::move(handler),
									res = std::move(res)]() mutable {
			h(std::move(res));
		});
	}

	void play(const Script &script) {
		if (!script.files.empty()) {
			auto dir = output_dir_of(request.args);
			if (dir.empty()) dir = request.working_dir;
			for (const auto &[name, content] : script.files) {
				write_file(dir / name, content);
			}
		}

		if (script.error) return finish(*script.error);

		auto on_line = [this](std::string_view line) {
			if (request.on_line) request.on_line(line);
		};

		ProcessResult result;
		result.exit_code = script.exit_code;

		if (request.stdout_sink) {
			std::string_view out(script.stdout_text);
			while (!out.empty() && !request.cancel.cancelled()) {
				auto n = std::min(kChunkSize, out.size());
				request.stdout_sink(out.substr(0, n));
				out.remove_prefix(n);
			}
		} else {
			result.captured_stdout = script.stdout_text;
			LineSplitter lines;
			lines.feed(script.stdout_text, on_line);
			lines.flush(on_line);
		}

		LineSplitter err_lines;
		err_lines.feed(script.stderr_text, on_line);
		err_lines.flush(on_line);
		result.captured_stderr = script.stderr_text;

		if (request.cancel.cancelled()) {
			return finish(make_error_code(errc::cancelled));
		}
		finish(std::move(result));
	}
};

bool contains(const std::vector<std::string> &args, std::string_view arg) {
	return std::find(args.begin(), args.end(), arg) != args.end();
}

std::string value_after(const std::vector<std::string> &args,
						std::string_view flag) {
	auto it = std::find(args.begin(), args.end(), flag);
	if (it == args.end() || std::next(it) == args.end()) return {};
	return *std::next(it);
}

}  // namespace

bool Invocation::has_arg(std::string_view arg) const {
	return contains(args, arg);
}

std::string Invocation::arg_after(std::string_view flag) const {
	return value_after(args, flag);
}

bool has_arg(const ProcessRequest &request, std::string_view arg) {
	return contains(request.args, arg);
}

std::string arg_after(const ProcessRequest &request, std::string_view flag) {
	return value_after(request.args, flag);
}

std::size_t FakeRunner::count_with(std::string_view arg) const {
	return static_cast<std::size_t>(
		std::count_if(invocations_.begin(), invocations_.end(),
					  [&](const Invocation &inv) { return inv.has_arg(arg); }));
}

void FakeRunner::async_run_impl(ProcessRequest request, Handler handler,
								CompletionExecutor handler_ex) {
	invocations_.push_back(
		{request.program, request.args, request.working_dir});

	Script script;
	if (!queue_.empty()) {
		script = std::move(queue_.front());
		queue_.pop_front();
	} else if (responder_) {
		script = responder_(request);
	}

	auto pending = std::make_shared<Pending>(
		std::move(request), std::move(handler), std::move(handler_ex));

	if (pending->request.cancel.cancelled()) {
		asio::post(ex_, [pending] {
			pending->finish(make_error_code(errc::cancelled));
		});
		return;
	}

	if (script.wait_for_cancel) {
		auto ex = ex_;
		pending->request.cancel.on_cancel([ex, pending] {
			asio::post(ex, [pending] {
				pending->finish(make_error_code(errc::cancelled));
			});
		});
		return;
	}

	asio::post(ex_, [pending, script = std::move(script)] {
		pending->play(script);
	});
}

fs::path output_dir_of(const std::vector<std::string> &args) {
	for (std::size_t i = 0; i + 1 < args.size(); ++i) {
		if (args[i] == "-o" || args[i] == "--output") {
			if (args[i + 1] == "-") return {};
			return fs::path(args[i + 1]).parent_path();
		}
	}
	return {};
}

void write_file(const fs::path &path, std::string_view content) {
	if (path.has_parent_path()) fs::create_directories(path.parent_path());
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

std::string read_file(const fs::path &path) {
	std::ifstream in(path, std::ios::binary);
	std::ostringstream ss;
	ss << in.rdbuf();
	return ss.str();
}

TempDir::TempDir() {
	std::random_device rd;
	auto base = fs::temp_directory_path();
	do {
		path_ = base / fmt::format("ytpipe-test-{:08x}", rd());
	} while (fs::exists(path_));
	fs::create_directories(path_);
}

TempDir::~TempDir() {
	std::error_code ec;
	fs::remove_all(path_, ec);
}

std::size_t TempDir::entry_count() const {
	std::size_t n = 0;
	for ([[maybe_unused]] const auto &entry : fs::directory_iterator(path_)) {
		++n;
	}
	return n;
}

}  // namespace ytpipe::testing
