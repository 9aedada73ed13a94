#include <string>
#include <ytpipe/result.hpp>

namespace ytpipe {

struct ytpipe_error_category : std::error_category {
	const char *name() const noexcept override { return "ytpipe"; }

	// These strings are shown to end users; raw tool output never is.
	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::invalid_resource_ref:
				return "Invalid video or playlist reference";
			case errc::invalid_format:
				return "Invalid or placeholder format. Please select a valid "
					   "format.";
			case errc::invalid_trim_range:
				return "Invalid trim range: end must be greater than start";
			case errc::invalid_caption_request:
				return "Caption language and caption format must be given "
					   "together";
			case errc::empty_collection:
				return "No playlist items provided for download";
			case errc::executable_not_found:
				return "Required executable not found";
			case errc::spawn_failed: return "Failed to start external tool";
			case errc::process_failed: return "External tool failed";
			case errc::access_forbidden:
				return "YouTube restrictions prevent this download";
			case errc::resource_unavailable:
				return "This video is unavailable or private";
			case errc::age_restricted:
				return "This video requires age verification";
			case errc::download_failed:
				return "Failed to download video. Please try a different "
					   "format or video.";
			case errc::empty_result: return "No data was downloaded";
			case errc::nothing_downloaded:
				return "No files were downloaded from the playlist";
			case errc::archive_failed: return "Failed to create zip file";
			case errc::stream_interrupted:
				return "Download stream was interrupted";
			case errc::json_parse_error: return "JSON parse error";
			case errc::file_open_failed: return "File open failed";
			case errc::file_write_failed: return "File write failed";
			case errc::invalid_number_format: return "Invalid number format";
			case errc::config_error: return "Invalid configuration";
			case errc::cancelled: return "Download cancelled";
			default: return "Unknown error";
		}
	}
};

const std::error_category &ytpipe_category() {
	static ytpipe_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), ytpipe_category()};
}

bool is_invalid_input(const std::error_code &ec) {
	if (ec.category() != ytpipe_category()) return false;
	switch (static_cast<errc>(ec.value())) {
		case errc::invalid_resource_ref:
		case errc::invalid_format:
		case errc::invalid_trim_range:
		case errc::invalid_caption_request:
		case errc::empty_collection: return true;
		default: return false;
	}
}

bool is_retryable(const std::error_code &ec) {
	if (ec.category() != ytpipe_category()) return false;
	switch (static_cast<errc>(ec.value())) {
		case errc::access_forbidden:
		case errc::download_failed:
		case errc::process_failed:
		case errc::empty_result: return true;
		default: return false;
	}
}

}  // namespace ytpipe
