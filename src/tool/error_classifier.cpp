#include <array>

#include "tool/error_classifier.hpp"

namespace ytpipe::tool {

namespace {

struct Pattern {
	std::string_view needle;
	errc reason;
};

// First match wins; age checks come before the generic "unavailable" text
// because an age-gated video also reports itself as unavailable.
constexpr std::array<Pattern, 8> kPatterns{{
	{"Sign in to confirm your age", errc::age_restricted},
	{"age-restricted", errc::age_restricted},
	{"inappropriate for some users", errc::age_restricted},
	{"HTTP Error 403", errc::access_forbidden},
	{"Video unavailable", errc::resource_unavailable},
	{"This video is unavailable", errc::resource_unavailable},
	{"Private video", errc::resource_unavailable},
	{"This video has been removed", errc::resource_unavailable},
}};

}  // namespace

errc classify_tool_error(std::string_view stderr_text) {
	for (const auto &p : kPatterns) {
		if (stderr_text.find(p.needle) != std::string_view::npos) {
			return p.reason;
		}
	}
	return errc::download_failed;
}

std::string_view stderr_tail(std::string_view stderr_text,
							 std::size_t max_lines) {
	while (!stderr_text.empty() &&
		   (stderr_text.back() == '\n' || stderr_text.back() == '\r')) {
		stderr_text.remove_suffix(1);
	}
	std::size_t pos = stderr_text.size();
	for (std::size_t n = 0; n < max_lines && pos > 0; ++n) {
		auto nl = stderr_text.rfind('\n', pos - 1);
		if (nl == std::string_view::npos) return stderr_text;
		pos = nl;
	}
	return pos == 0 ? stderr_text : stderr_text.substr(pos + 1);
}

}  // namespace ytpipe::tool
