#pragma once

#include <ytpipe/ytpipe_export.h>

#include <string>
#include <string_view>
#include <ytpipe/result.hpp>

namespace ytpipe {

struct YTPIPE_EXPORT ResourceRef {
	std::string video_id;		  // Empty for a bare collection reference
	std::string collection_id;	  // Value of the `list=` parameter, if any
	std::string locator;		  // Locator handed to the acquisition tool

	[[nodiscard]] bool has_collection() const {
		return !collection_id.empty();
	}
};

/// Accepts a bare 11-character id or a YouTube locator (watch, shorts,
/// embed, youtu.be, playlist).
YTPIPE_EXPORT Result<ResourceRef> parse_resource_ref(std::string_view text);

/// True for an 11-character id made of [A-Za-z0-9_-].
YTPIPE_EXPORT bool is_video_id(std::string_view text);

/// True for a collection id made of [A-Za-z0-9_-].
YTPIPE_EXPORT bool is_collection_id(std::string_view text);

/// Loose check used before category downloads.
YTPIPE_EXPORT bool is_supported_locator(std::string_view url);

YTPIPE_EXPORT std::string watch_url(std::string_view video_id);
YTPIPE_EXPORT std::string collection_url(std::string_view collection_id);

}  // namespace ytpipe
