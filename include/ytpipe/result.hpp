#pragma once

#include <ytpipe/ytpipe_export.h>

#include <boost/outcome.hpp>
#include <system_error>

namespace ytpipe {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// Invalid input, rejected before any process is spawned
	invalid_resource_ref = 10,
	invalid_format,	 // Unknown or placeholder format id
	invalid_trim_range,
	invalid_caption_request,
	empty_collection,

	// Process launch / exit
	executable_not_found = 20,
	spawn_failed,
	process_failed,	 // Non-zero exit without a more specific class

	// Upstream, classified from the acquisition tool's stderr
	access_forbidden = 30,
	resource_unavailable,
	age_restricted,
	download_failed,

	// Results
	empty_result = 40,	// Zero-byte or missing output
	nothing_downloaded,
	archive_failed,
	stream_interrupted,

	// Parsing / I/O
	json_parse_error = 50,
	file_open_failed,
	file_write_failed,
	invalid_number_format,
	config_error,

	cancelled = 60,

	unknown = 100
};

YTPIPE_EXPORT const std::error_category &ytpipe_category();

YTPIPE_EXPORT std::error_code make_error_code(errc e);

/// Rejected before any external process was involved.
YTPIPE_EXPORT bool is_invalid_input(const std::error_code &ec);

/// Attempt-local failure that may succeed with the next strategy.
YTPIPE_EXPORT bool is_retryable(const std::error_code &ec);

}  // namespace ytpipe

namespace std {
template <>
struct is_error_code_enum<ytpipe::errc> : true_type {};
}  // namespace std

namespace ytpipe {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace ytpipe
