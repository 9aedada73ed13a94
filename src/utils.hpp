#pragma once

#include <boost/charconv.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <ytpipe/result.hpp>

namespace ytpipe::utils {

// =============================================================================
// Numeric conversions (boost::charconv, locale independent)
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv) {
	T val{};
	auto res =
		boost::charconv::from_chars(sv.data(), sv.data() + sv.size(), val);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

inline Result<long long> to_long(std::string_view sv) {
	return to_number<long long>(sv);
}

inline Result<double> to_double(std::string_view sv) {
	return to_number<double>(sv);
}

template <typename T>
T to_number_default(std::string_view sv, T def_val = 0) {
	auto res = to_number<T>(sv);
	return res ? res.value() : def_val;
}

// =============================================================================
// Text helpers
// =============================================================================

inline std::string_view trim(std::string_view sv) {
	constexpr std::string_view ws = " \t\r\n";
	auto first = sv.find_first_not_of(ws);
	if (first == std::string_view::npos) return {};
	auto last = sv.find_last_not_of(ws);
	return sv.substr(first, last - first + 1);
}

/// Split on '\n', dropping blank lines.
inline std::vector<std::string> split_lines(std::string_view text) {
	std::vector<std::string> lines;
	size_t pos = 0;
	while (pos <= text.size()) {
		size_t nl = text.find('\n', pos);
		if (nl == std::string_view::npos) nl = text.size();
		auto line = trim(text.substr(pos, nl - pos));
		if (!line.empty()) lines.emplace_back(line);
		pos = nl + 1;
	}
	return lines;
}

// =============================================================================
// JSON traversal (yt-dlp style traverse_obj)
// =============================================================================

// Path element: string key or integer index (negative counts from the end)
class PathElement {
   public:
	PathElement(const char *key) : m_is_index(false), m_key(key), m_index(0) {}
	PathElement(const std::string &key)
		: m_is_index(false), m_key(key), m_index(0) {}
	PathElement(int index) : m_is_index(true), m_index(index) {}

	[[nodiscard]] bool is_index() const { return m_is_index; }
	[[nodiscard]] const std::string &key() const { return m_key; }
	[[nodiscard]] int index() const { return m_index; }

   private:
	bool m_is_index;
	std::string m_key;
	int m_index;
};

namespace detail {

inline const nlohmann::json *step(const nlohmann::json *j,
								  const PathElement &elem) {
	if (!j) return nullptr;

	if (!elem.is_index()) {
		const auto &key = elem.key();
		if (j->is_object() && j->contains(key)) { return &(*j)[key]; }
	} else {
		int idx = elem.index();
		if (j->is_array()) {
			if (idx < 0) { idx = static_cast<int>(j->size()) + idx; }
			if (idx >= 0 && static_cast<size_t>(idx) < j->size()) {
				return &(*j)[static_cast<size_t>(idx)];
			}
		}
	}
	return nullptr;
}

inline const nlohmann::json *traverse(
	const nlohmann::json *j, const std::initializer_list<PathElement> &path) {
	for (const auto &elem : path) {
		j = step(j, elem);
		if (!j) return nullptr;
	}
	return j;
}

}  // namespace detail

/// Returns std::nullopt if the path is missing, null, or of another type.
///
///   auto title = traverse_obj<std::string>(dump, {"title"});
///   auto first = traverse_obj<std::string>(dump, {"formats", 0, "ext"});
template <typename T>
std::optional<T> traverse_obj(const nlohmann::json &j,
							  std::initializer_list<PathElement> path) {
	const nlohmann::json *result = detail::traverse(&j, path);
	if (!result || result->is_null()) return std::nullopt;

	try {
		return result->get<T>();
	} catch (const nlohmann::json::exception &) { return std::nullopt; }
}

inline std::optional<nlohmann::json> traverse_json(
	const nlohmann::json &j, std::initializer_list<PathElement> path) {
	const nlohmann::json *result = detail::traverse(&j, path);
	if (!result) return std::nullopt;
	return *result;
}

template <typename T>
T traverse_obj_default(const nlohmann::json &j,
					   std::initializer_list<PathElement> path, T default_val) {
	auto result = traverse_obj<T>(j, path);
	return result.value_or(std::move(default_val));
}

/// Numbers in tool dumps come as ints, floats, or null. Reads any of them.
inline std::optional<double> traverse_number(
	const nlohmann::json &j, std::initializer_list<PathElement> path) {
	const nlohmann::json *result = detail::traverse(&j, path);
	if (!result || !result->is_number()) return std::nullopt;
	return result->get<double>();
}

// =============================================================================
// File names
// =============================================================================

/// Replace characters that are not allowed in file names on common systems.
inline std::string sanitize_filename(std::string_view filename) {
	std::string result;
	result.reserve(filename.size());

	for (char c : filename) {
		switch (c) {
			case '/':
			case '\\':
			case ':':
			case '*':
			case '?':
			case '"':
			case '<':
			case '>':
			case '|':
			case '\0': result += '_'; break;
			case '\n':
			case '\r':
			case '\t': result += ' '; break;
			default: result += c; break;
		}
	}

	// Trailing spaces and dots break Windows clients
	while (!result.empty() && (result.back() == ' ' || result.back() == '.')) {
		result.pop_back();
	}

	if (result.empty()) { result = "download"; }
	return result;
}

}  // namespace ytpipe::utils
