#include <spdlog/spdlog.h>

#include <boost/regex.hpp>
#include <boost/url.hpp>
#include <ytpipe/resource_ref.hpp>

#include "utils.hpp"

namespace ytpipe {

namespace {

// Matches:
// - youtube.com/watch?v=ID
// - youtube.com/shorts/ID
// - youtube.com/embed/ID
// - youtube.com/v/ID
// - youtu.be/ID
const boost::regex &video_url_regex() {
	static const boost::regex re(
		R"(^(?:https?://)?(?:www\.|m\.|music\.)?(?:youtube\.com/(?:watch\?(?:.*&)?v=|shorts/|embed/|v/|live/)|youtu\.be/)([\w-]{11}))");
	return re;
}

const boost::regex &supported_regex() {
	static const boost::regex re(
		R"(^(https?://)?(www\.)?(youtube\.com|youtu\.be)/.+)");
	return re;
}

std::string query_param(std::string_view locator, std::string_view key) {
	std::string with_scheme(locator);
	if (with_scheme.find("://") == std::string::npos) {
		with_scheme = "https://" + with_scheme;
	}

	auto parsed = boost::urls::parse_uri(with_scheme);
	if (!parsed) return {};

	boost::urls::url_view u = *parsed;
	auto params = u.params();
	auto it = params.find(key);
	if (it == params.end() || !(*it).has_value) return {};
	return std::string((*it).value);
}

}  // namespace

bool is_video_id(std::string_view text) {
	static const boost::regex re(R"(^[\w-]{11}$)");
	return boost::regex_match(text.data(), text.data() + text.size(), re);
}

bool is_collection_id(std::string_view text) {
	static const boost::regex re(R"(^[\w-]{2,64}$)");
	return boost::regex_match(text.data(), text.data() + text.size(), re);
}

bool is_supported_locator(std::string_view url) {
	return boost::regex_match(
		url.data(), url.data() + url.size(), supported_regex());
}

std::string watch_url(std::string_view video_id) {
	return "https://www.youtube.com/watch?v=" + std::string(video_id);
}

std::string collection_url(std::string_view collection_id) {
	return "https://www.youtube.com/playlist?list=" +
		   std::string(collection_id);
}

Result<ResourceRef> parse_resource_ref(std::string_view text) {
	ResourceRef ref;

	std::string input(utils::trim(text));

	if (is_video_id(input)) {
		ref.video_id = input;
		ref.locator = watch_url(input);
		return ref;
	}

	if (!is_supported_locator(input)) {
		spdlog::debug("Unsupported resource reference: {}", input);
		return make_error_code(errc::invalid_resource_ref);
	}

	boost::smatch m;
	if (boost::regex_search(input, m, video_url_regex())) {
		ref.video_id = m[1];
	}

	auto list = query_param(input, "list");
	if (!list.empty()) {
		if (!is_collection_id(list)) {
			return make_error_code(errc::invalid_resource_ref);
		}
		ref.collection_id = std::move(list);
	}

	if (ref.video_id.empty() && ref.collection_id.empty()) {
		return make_error_code(errc::invalid_resource_ref);
	}

	ref.locator = input;
	return ref;
}

}  // namespace ytpipe
