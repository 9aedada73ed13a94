#pragma once

#include <string_view>
#include <ytpipe/result.hpp>

namespace ytpipe::tool {

/// Maps the acquisition tool's stderr of a failed run to a coarse reason.
/// Anything unrecognised is a generic download failure.
errc classify_tool_error(std::string_view stderr_text);

/// Last non-empty lines of stderr, for diagnostics in the log.
std::string_view stderr_tail(std::string_view stderr_text,
							 std::size_t max_lines = 5);

}  // namespace ytpipe::tool
