#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <random>
#include <ytpipe/download_sink.hpp>
#include <ytpipe/workspace.hpp>

namespace ytpipe {

namespace fs = std::filesystem;

namespace {

constexpr int kCreateAttempts = 8;
constexpr std::size_t kChunkSize = 64 * 1024;

bool is_partial(const fs::path &p) {
	auto ext = p.extension().string();
	return ext == ".part" || ext == ".ytdl" || ext == ".temp";
}

}  // namespace

ScopedWorkspace::ScopedWorkspace(fs::path path) : path_(std::move(path)) {}

ScopedWorkspace::ScopedWorkspace(ScopedWorkspace &&other) noexcept
	: path_(std::move(other.path_)) {
	other.path_.clear();
}

ScopedWorkspace &ScopedWorkspace::operator=(ScopedWorkspace &&other) noexcept {
	if (this != &other) {
		remove();
		path_ = std::move(other.path_);
		other.path_.clear();
	}
	return *this;
}

ScopedWorkspace::~ScopedWorkspace() { remove(); }

void ScopedWorkspace::remove() {
	if (path_.empty()) return;
	std::error_code ec;
	auto removed = fs::remove_all(path_, ec);
	if (ec) {
		spdlog::warn("Could not remove working directory {}: {}",
					 path_.string(), ec.message());
	} else {
		spdlog::debug("Removed working directory {} ({} entries)",
					  path_.string(), removed);
	}
	path_.clear();
}

Result<ScopedWorkspace> ScopedWorkspace::create(const fs::path &root,
												std::string_view prefix) {
	std::error_code ec;
	fs::create_directories(root, ec);
	if (ec) {
		spdlog::error("Cannot create {}: {}", root.string(), ec.message());
		return make_error_code(errc::file_open_failed);
	}

	std::random_device rd;
	std::mt19937_64 gen(rd());
	for (int i = 0; i < kCreateAttempts; ++i) {
		auto candidate = root / fmt::format("{}{:016x}", prefix, gen());
		if (fs::create_directory(candidate, ec)) {
			spdlog::debug("Created working directory {}", candidate.string());
			return ScopedWorkspace(std::move(candidate));
		}
		if (ec) break;
	}

	spdlog::error("Cannot create a working directory under {}", root.string());
	return make_error_code(errc::file_open_failed);
}

std::vector<fs::path> ScopedWorkspace::files() const {
	std::vector<fs::path> out;
	std::error_code ec;
	for (const auto &entry : fs::directory_iterator(path_, ec)) {
		if (entry.is_regular_file(ec) && !is_partial(entry.path())) {
			out.push_back(entry.path());
		}
	}
	std::sort(out.begin(), out.end());
	return out;
}

Result<std::uint64_t> stream_file(const fs::path &file, DownloadSink &sink,
								  const CancelToken &cancel) {
	std::ifstream in(file, std::ios::binary);
	if (!in) {
		spdlog::error("Could not open {}", file.string());
		return make_error_code(errc::file_open_failed);
	}

	std::array<char, kChunkSize> buf{};
	std::uint64_t total = 0;
	while (in) {
		if (cancel.cancelled()) return make_error_code(errc::cancelled);

		in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
		auto n = static_cast<std::size_t>(in.gcount());
		if (n == 0) break;

		auto res = sink.write(std::string_view(buf.data(), n));
		if (res.has_error()) return res.error();
		total += n;
	}

	if (in.bad()) return make_error_code(errc::file_open_failed);
	return total;
}

}  // namespace ytpipe
