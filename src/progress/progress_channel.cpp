#include <boost/regex.hpp>
#include <ytpipe/progress.hpp>

#include "utils.hpp"

namespace ytpipe {

namespace {

const boost::regex &progress_regex() {
	// [download]  42.0% of ~ 10.00MiB at  1.00MiB/s ETA 00:05 (frag 3/9)
	// [download] 100% of 10.00MiB in 00:00:03 at 3.10MiB/s
	static const boost::regex re(
		R"((\d+(?:\.\d+)?)%\s+of\s+~?\s*(\d+(?:\.\d+)?\w+)(?:\s+in\s+\S+)?(?:\s+at\s+(Unknown B/s|\S+))?(?:\s+ETA\s+(\S+))?)");
	return re;
}

const boost::regex &destination_regex() {
	static const boost::regex re(
		R"(^\[(?:download|ExtractAudio)\] Destination: (.+)$)");
	return re;
}

const boost::regex &merger_regex() {
	static const boost::regex re(R"(^\[Merger\] Merging formats into "(.+)"$)");
	return re;
}

const boost::regex &already_regex() {
	static const boost::regex re(
		R"(^\[download\] (.+) has already been downloaded$)");
	return re;
}

}  // namespace

std::optional<ProgressSample> parse_progress_line(std::string_view line) {
	boost::cmatch m;
	if (!boost::regex_search(line.data(), line.data() + line.size(), m,
							 progress_regex())) {
		return std::nullopt;
	}

	auto percent = utils::to_double(std::string_view(m[1].first, m[1].length()));
	if (!percent || percent.value() > 100.0) return std::nullopt;

	ProgressSample s;
	s.percent = percent.value();
	s.total = m[2].str();
	s.rate = m[3].matched ? m[3].str() : std::string{};
	s.eta = m[4].matched && m[4].str() != "Unknown" ? m[4].str() : "unknown";
	return s;
}

std::optional<std::string> parse_destination_line(std::string_view line) {
	auto text = utils::trim(line);
	const char *first = text.data();
	const char *last = text.data() + text.size();

	boost::cmatch m;
	if (boost::regex_match(first, last, m, destination_regex()) ||
		boost::regex_match(first, last, m, merger_regex()) ||
		boost::regex_match(first, last, m, already_regex())) {
		return m[1].str();
	}
	return std::nullopt;
}

ProgressChannel::ProgressChannel(std::string strategy,
								 ProgressCallback callback,
								 std::chrono::milliseconds interval, NowFn now)
	: strategy_(std::move(strategy)),
	  callback_(std::move(callback)),
	  interval_(interval),
	  now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

bool ProgressChannel::feed_line(std::string_view line) {
	auto sample = parse_progress_line(line);
	if (!sample) return false;
	if (completed_) return true;

	// Multi-part downloads restart at 0%; keep reporting forward only
	if (sample->percent < last_percent_) return true;

	auto now = now_();
	if (last_emit_ && now - *last_emit_ < interval_) {
		return true;
	}

	last_emit_ = now;
	emit(sample->percent, std::move(sample->rate), std::move(sample->eta));
	return true;
}

void ProgressChannel::complete() {
	if (completed_) return;
	completed_ = true;
	emit(100.0, "Complete", "0s");
}

void ProgressChannel::emit(double percent, std::string rate, std::string eta) {
	last_percent_ = percent;
	if (!callback_) return;
	ProgressEvent ev;
	ev.percent = percent;
	ev.rate = std::move(rate);
	ev.eta = std::move(eta);
	ev.strategy = strategy_;
	callback_(ev);
}

}  // namespace ytpipe
