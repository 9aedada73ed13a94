#include <spdlog/spdlog.h>

#include <array>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/start_dir.hpp>
#include <boost/process/v2/stdio.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <ytpipe/process_runner.hpp>

namespace ytpipe {

namespace bp = boost::process::v2;
namespace fs = std::filesystem;

namespace {

constexpr std::size_t kReadBufferSize = 64 * 1024;

// Keep only the tail of very chatty stderr; classification looks at the end.
constexpr std::size_t kMaxCapturedStderr = 1024 * 1024;

// Grace period between SIGTERM and SIGKILL on cancellation. yt-dlp uses it
// to stop its own ffmpeg children.
constexpr auto kTerminateGrace = std::chrono::seconds(3);

std::string resolve_executable(const std::string &program) {
	if (program.find('/') != std::string::npos) {
		std::error_code ec;
		return fs::exists(program, ec) ? program : std::string{};
	}
	auto found = bp::environment::find_executable(program);
	return found.empty() ? std::string{} : found.string();
}

}  // namespace

class RunSession : public std::enable_shared_from_this<RunSession> {
   public:
	using CompletionExecutor = ProcessRunner::CompletionExecutor;

	RunSession(asio::any_io_executor ex, ProcessRequest request,
			   ProcessRunner::Handler handler, CompletionExecutor handler_ex)
		: strand_(asio::make_strand(ex)),
		  request_(std::move(request)),
		  handler_(std::move(handler)),
		  handler_ex_(std::move(handler_ex)),
		  out_pipe_(strand_),
		  err_pipe_(strand_),
		  kill_timer_(strand_) {}

	void start() {
		if (request_.cancel.cancelled()) {
			return complete(make_error_code(errc::cancelled));
		}

		auto exe = resolve_executable(request_.program);
		if (exe.empty()) {
			spdlog::error("Executable not found: {}", request_.program);
			return complete(make_error_code(errc::executable_not_found));
		}

		spdlog::debug("Running: {} {}", exe, fmt_args());

		try {
			if (request_.working_dir.empty()) {
				process_.emplace(
					strand_, exe, request_.args,
					bp::process_stdio{nullptr, out_pipe_, err_pipe_});
			} else {
				process_.emplace(
					strand_, exe, request_.args,
					bp::process_stdio{nullptr, out_pipe_, err_pipe_},
					bp::process_start_dir{request_.working_dir.string()});
			}
		} catch (const boost::system::system_error &e) {
			spdlog::error("Failed to start {}: {}", exe, e.what());
			return complete(make_error_code(errc::spawn_failed));
		}

		std::weak_ptr<RunSession> weak = shared_from_this();
		auto ex = strand_;
		registration_ = request_.cancel.on_cancel([weak, ex]() {
			asio::post(ex, [weak]() {
				if (auto self = weak.lock()) self->terminate();
			});
		});

		pending_ = 3;
		read_stdout();
		read_stderr();
		wait_exit();
	}

   private:
	asio::any_io_executor strand_;
	ProcessRequest request_;
	ProcessRunner::Handler handler_;
	CompletionExecutor handler_ex_;

	asio::readable_pipe out_pipe_;
	asio::readable_pipe err_pipe_;
	asio::steady_timer kill_timer_;
	std::optional<bp::process> process_;

	std::array<char, kReadBufferSize> out_buf_{};
	std::array<char, kReadBufferSize> err_buf_{};
	LineSplitter out_lines_;
	LineSplitter err_lines_;

	ProcessResult result_;
	int pending_ = 0;
	bool terminated_ = false;
	CancelToken::Registration registration_ = 0;

	std::string fmt_args() const {
		std::string out;
		for (const auto &a : request_.args) {
			if (!out.empty()) out += ' ';
			out += a;
		}
		return out;
	}

	void emit_line(std::string_view line) {
		spdlog::debug("[tool] {}", line);
		if (request_.on_line) request_.on_line(line);
	}

	void read_stdout() {
		out_pipe_.async_read_some(
			asio::buffer(out_buf_),
			[self = shared_from_this()](boost::system::error_code ec,
										std::size_t n) {
				if (n > 0) {
					std::string_view chunk(self->out_buf_.data(), n);
					if (self->request_.stdout_sink) {
						self->request_.stdout_sink(chunk);
					} else {
						self->result_.captured_stdout.append(chunk);
						self->out_lines_.feed(chunk, [&](std::string_view l) {
							self->emit_line(l);
						});
					}
				}
				if (ec) {
					self->out_lines_.flush(
						[&](std::string_view l) { self->emit_line(l); });
					return self->on_part_done();
				}
				self->read_stdout();
			});
	}

	void read_stderr() {
		err_pipe_.async_read_some(
			asio::buffer(err_buf_),
			[self = shared_from_this()](boost::system::error_code ec,
										std::size_t n) {
				if (n > 0) {
					std::string_view chunk(self->err_buf_.data(), n);
					auto &captured = self->result_.captured_stderr;
					captured.append(chunk);
					if (captured.size() > kMaxCapturedStderr) {
						captured.erase(
							0, captured.size() - kMaxCapturedStderr);
					}
					self->err_lines_.feed(chunk, [&](std::string_view l) {
						self->emit_line(l);
					});
				}
				if (ec) {
					self->err_lines_.flush(
						[&](std::string_view l) { self->emit_line(l); });
					return self->on_part_done();
				}
				self->read_stderr();
			});
	}

	void wait_exit() {
		process_->async_wait([self = shared_from_this()](
								 boost::system::error_code ec, int code) {
			if (ec) {
				spdlog::warn("Waiting for child failed: {}", ec.message());
				code = -1;
			}
			self->result_.exit_code = code;
			self->kill_timer_.cancel();
			self->on_part_done();
		});
	}

	void terminate() {
		if (terminated_ || !process_) return;
		terminated_ = true;

		spdlog::info("Cancelling external process");
		boost::system::error_code ec;
		process_->request_exit(ec);
		if (ec) process_->terminate(ec);

		// Children of the tool may keep the pipes open after it exits
		out_pipe_.close(ec);
		err_pipe_.close(ec);

		kill_timer_.expires_after(kTerminateGrace);
		kill_timer_.async_wait(
			[self = shared_from_this()](boost::system::error_code ec) {
				if (ec || !self->process_) return;
				boost::system::error_code kill_ec;
				if (self->process_->running(kill_ec)) {
					self->process_->terminate(kill_ec);
				}
			});
	}

	void on_part_done() {
		if (--pending_ > 0) return;

		request_.cancel.remove(registration_);
		if (terminated_ || request_.cancel.cancelled()) {
			return complete(make_error_code(errc::cancelled));
		}
		spdlog::debug("Process exited with code {}", result_.exit_code);
		complete(std::move(result_));
	}

	void complete(Result<ProcessResult> res) {
		asio::dispatch(handler_ex_, [h = std::move(handler_),
									 res = std::move(res)]() mutable {
			h(std::move(res));
		});
	}
};

SubprocessRunner::SubprocessRunner(asio::any_io_executor ex)
	: ex_(std::move(ex)) {}

SubprocessRunner::~SubprocessRunner() = default;

asio::any_io_executor SubprocessRunner::get_executor() const { return ex_; }

void SubprocessRunner::async_run_impl(ProcessRequest request, Handler handler,
									  CompletionExecutor handler_ex) {
	std::make_shared<RunSession>(ex_, std::move(request), std::move(handler),
								 std::move(handler_ex))
		->start();
}

}  // namespace ytpipe
