#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <ytpipe/config.hpp>
#include <ytpipe/types.hpp>

namespace ytpipe::tool {

using Args = std::vector<std::string>;

// Metadata dump of a single item. The JSON document is the last stdout line.
Args info_args(const ToolOptions &opts, std::string_view locator);

// Audio-only size estimate at a fixed mp3 bitrate (kbps).
Args audio_estimate_args(const ToolOptions &opts, std::string_view locator,
					  int bitrate);

// Flat JSON-lines dump of a collection, one member per line.
Args collection_args(const ToolOptions &opts, std::string_view collection_id);

Args list_formats_args(const ToolOptions &opts, std::string_view locator);

// Selected format written to stdout. Not usable for mp3 variants, which
// need a post-processing step.
Args direct_stream_args(const ToolOptions &opts, std::string_view locator,
						std::string_view format_id,
						const std::optional<TrimRange> &trim,
						const std::optional<CaptionRequest> &captions);

// Selected format written to `output`, merged into mp4 when needed. mp3
// variants extract the best audio stream at their bitrate instead.
Args file_buffered_args(const ToolOptions &opts, std::string_view locator,
						std::string_view format_id,
						const std::filesystem::path &output,
						const std::optional<TrimRange> &trim,
						const std::optional<CaptionRequest> &captions);

// One invocation for every member, written into `dir` by title.
Args batch_args(const ToolOptions &opts, std::string_view format_id,
				const std::filesystem::path &dir,
				const std::vector<std::string> &member_ids);

// Persistent download into a category folder.
Args category_args(const PipelineConfig &config,
				   const CategoryDownloadOptions &options,
				   const std::filesystem::path &folder);

// `zip -j archive files...`
Args archive_args(const std::filesystem::path &archive,
				  const std::vector<std::filesystem::path> &files);

// mp3 bitrate in kbps to the tool's VBR quality scale (0 best, 9 worst).
std::string audio_quality_scale(std::string_view kbps);

}  // namespace ytpipe::tool
