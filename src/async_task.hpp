#pragma once

#include <spdlog/spdlog.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/spawn.hpp>
#include <exception>
#include <string>
#include <utility>
#include <ytpipe/result.hpp>

namespace ytpipe::detail {

namespace asio = boost::asio;

/// Runs `body(yield)` as a stackful coroutine on `ex` and hands its result to
/// `handler` on `handler_ex`. An exception escaping the body is logged and
/// reported as errc::unknown.
template <typename T, typename Body>
void spawn_task(asio::any_io_executor ex, std::string what, Body body,
				asio::any_completion_handler<void(Result<T>)> handler,
				asio::any_completion_executor handler_ex) {
	asio::spawn(
		ex,
		[what = std::move(what), body = std::move(body),
		 handler = std::move(handler),
		 handler_ex = std::move(handler_ex)](asio::yield_context yield) mutable {
			Result<T> res = make_error_code(errc::unknown);
			try {
				res = body(yield);
			} catch (const std::exception &e) {
				spdlog::error("{}: unexpected error: {}", what, e.what());
			}
			asio::dispatch(handler_ex, [h = std::move(handler),
										res = std::move(res)]() mutable {
				h(std::move(res));
			});
		},
		asio::detached);
}

}  // namespace ytpipe::detail
