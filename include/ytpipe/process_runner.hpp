#pragma once

#include <ytpipe/ytpipe_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <ytpipe/cancellation.hpp>
#include <ytpipe/result.hpp>

namespace ytpipe {

namespace asio = boost::asio;

struct YTPIPE_EXPORT ProcessResult {
	int exit_code = 0;
	std::string captured_stdout;  // Empty when stdout went to a sink
	std::string captured_stderr;

	[[nodiscard]] bool succeeded() const { return exit_code == 0; }
};

struct YTPIPE_EXPORT ProcessRequest {
	std::string program;  // Name looked up in PATH, or a path
	std::vector<std::string> args;
	std::filesystem::path working_dir;	// Empty: inherit

	// Raw stdout bytes as they arrive. When empty, stdout is captured.
	std::function<void(std::string_view chunk)> stdout_sink;

	// Text lines from stderr (and from stdout when captured), split on
	// '\n' and '\r'.
	std::function<void(std::string_view line)> on_line;

	CancelToken cancel;
};

/// Runs the external tool once per call. Launch problems complete with
/// executable_not_found / spawn_failed, cancellation with cancelled;
/// otherwise the result carries the exit code and callers decide what a
/// non-zero exit means. No retries happen here.
class YTPIPE_EXPORT ProcessRunner {
   public:
	virtual ~ProcessRunner() = default;

	using CompletionExecutor = asio::any_completion_executor;
	using Handler = asio::any_completion_handler<void(Result<ProcessResult>)>;

	[[nodiscard]] virtual asio::any_io_executor get_executor() const = 0;

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<ProcessResult>))
				  CompletionToken>
	auto async_run(ProcessRequest request, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<ProcessResult>)>(
			[this, ex, request = std::move(request)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					Handler{std::forward<decltype(handler)>(handler)};

				async_run_impl(std::move(request), std::move(any_handler),
							   std::move(handler_ex));
			},
			token);
	}

   protected:
	virtual void async_run_impl(ProcessRequest request, Handler handler,
								CompletionExecutor handler_ex) = 0;
};

/// Spawns real child processes (Boost.Process) on the given executor.
class YTPIPE_EXPORT SubprocessRunner : public ProcessRunner {
   public:
	SubprocessRunner(const SubprocessRunner &) = delete;
	SubprocessRunner &operator=(const SubprocessRunner &) = delete;

	explicit SubprocessRunner(asio::any_io_executor ex);
	~SubprocessRunner() override;

	[[nodiscard]] asio::any_io_executor get_executor() const override;

   protected:
	void async_run_impl(ProcessRequest request, Handler handler,
						CompletionExecutor handler_ex) override;

   private:
	asio::any_io_executor ex_;
};

/// Splits a byte stream into text lines on '\n' or '\r'. Keeps the tail of
/// an incomplete line between chunks.
class YTPIPE_EXPORT LineSplitter {
   public:
	template <typename Fn>
	void feed(std::string_view chunk, Fn &&on_line) {
		for (char c : chunk) {
			if (c == '\n' || c == '\r') {
				if (!pending_.empty()) {
					on_line(std::string_view(pending_));
					pending_.clear();
				}
			} else {
				pending_.push_back(c);
			}
		}
	}

	template <typename Fn>
	void flush(Fn &&on_line) {
		if (!pending_.empty()) {
			on_line(std::string_view(pending_));
			pending_.clear();
		}
	}

   private:
	std::string pending_;
};

}  // namespace ytpipe
