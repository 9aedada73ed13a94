#pragma once

#include <ytpipe/ytpipe_export.h>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <ytpipe/types.hpp>

namespace ytpipe {

/// One parsed "[download]  42.0% of ~ 10.00MiB at 1.00MiB/s ETA 00:05" line.
struct YTPIPE_EXPORT ProgressSample {
	double percent = 0.0;
	std::string total;	// e.g. "10.00MiB", empty if not reported
	std::string rate;	// e.g. "1.00MiB/s"
	std::string eta;	// e.g. "00:05" or "unknown"
};

/// Returns std::nullopt for anything that is not a progress line.
YTPIPE_EXPORT std::optional<ProgressSample> parse_progress_line(
	std::string_view line);

/// Output path announced by the tool ("[download] Destination: X",
/// "[Merger] Merging formats into \"X\"", "[ExtractAudio] Destination: X",
/// "[download] X has already been downloaded").
YTPIPE_EXPORT std::optional<std::string> parse_destination_line(
	std::string_view line);

// =============================================================================
// PROGRESS CHANNEL
// =============================================================================
// One per strategy attempt. Turns tool output lines into ProgressEvents:
// percent never goes backwards, at most one event per interval, and
// complete() always delivers a final 100% event.
// =============================================================================

class YTPIPE_EXPORT ProgressChannel {
   public:
	using Clock = std::chrono::steady_clock;
	using NowFn = std::function<Clock::time_point()>;

	ProgressChannel(std::string strategy, ProgressCallback callback,
					std::chrono::milliseconds interval =
						std::chrono::milliseconds(500),
					NowFn now = {});

	/// Returns true when the line was a progress line.
	bool feed_line(std::string_view line);

	void complete();

	[[nodiscard]] double last_percent() const { return last_percent_; }
	[[nodiscard]] bool completed() const { return completed_; }

   private:
	std::string strategy_;
	ProgressCallback callback_;
	std::chrono::milliseconds interval_;
	NowFn now_;

	double last_percent_ = 0.0;
	std::optional<Clock::time_point> last_emit_;
	bool completed_ = false;

	void emit(double percent, std::string rate, std::string eta);
};

}  // namespace ytpipe
