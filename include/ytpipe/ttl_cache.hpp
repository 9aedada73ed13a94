#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include <ytpipe/types.hpp>

namespace ytpipe {

struct CacheConfig {
	std::size_t capacity = 100;
	std::chrono::milliseconds ttl = std::chrono::hours(1);
};

// =============================================================================
// TIME-BOUNDED IN-MEMORY CACHE
// =============================================================================
// Keyed by resource id (or locator). Expiry is checked lazily on read; when
// full, the oldest inserted entry is evicted first. Safe for concurrent use.
// Losing entries only costs another external tool invocation.
// =============================================================================

template <typename Value, typename Clock = std::chrono::steady_clock>
class TtlCache {
   public:
	using key_type = std::string;
	using duration = typename Clock::duration;

	explicit TtlCache(CacheConfig config = {}) : config_(config) {}

	TtlCache(const TtlCache &) = delete;
	TtlCache &operator=(const TtlCache &) = delete;

	std::optional<Value> get(const key_type &key) {
		std::lock_guard lock(mutex_);
		auto it = entries_.find(key);
		if (it == entries_.end()) return std::nullopt;
		if (Clock::now() >= it->second.expires) {
			order_.erase(it->second.position);
			entries_.erase(it);
			return std::nullopt;
		}
		return it->second.value;
	}

	void put(const key_type &key, Value value) {
		put(key, std::move(value), config_.ttl);
	}

	template <typename Rep, typename Period>
	void put(const key_type &key, Value value,
			 std::chrono::duration<Rep, Period> ttl) {
		if (config_.capacity == 0) return;

		std::lock_guard lock(mutex_);
		auto expires =
			Clock::now() + std::chrono::duration_cast<duration>(ttl);

		// Re-inserting counts as a fresh insertion
		if (auto it = entries_.find(key); it != entries_.end()) {
			order_.erase(it->second.position);
			entries_.erase(it);
		}

		while (entries_.size() >= config_.capacity && !order_.empty()) {
			entries_.erase(order_.front());
			order_.pop_front();
		}

		order_.push_back(key);
		entries_.emplace(
			key, Entry{std::move(value), expires, std::prev(order_.end())});
	}

	bool erase(const key_type &key) {
		std::lock_guard lock(mutex_);
		auto it = entries_.find(key);
		if (it == entries_.end()) return false;
		order_.erase(it->second.position);
		entries_.erase(it);
		return true;
	}

	void clear() {
		std::lock_guard lock(mutex_);
		entries_.clear();
		order_.clear();
	}

	/// Includes expired entries not yet observed by get().
	[[nodiscard]] std::size_t size() const {
		std::lock_guard lock(mutex_);
		return entries_.size();
	}

	[[nodiscard]] const CacheConfig &config() const { return config_; }

   private:
	struct Entry {
		Value value;
		typename Clock::time_point expires;
		typename std::list<key_type>::iterator position;
	};

	CacheConfig config_;
	mutable std::mutex mutex_;
	std::unordered_map<key_type, Entry> entries_;
	std::list<key_type> order_;	 // Oldest insertion first
};

using MetadataCache = TtlCache<ResourceInfo>;

// Raw `--list-formats` table lines per locator
using FormatListCache = TtlCache<std::vector<std::string>>;

}  // namespace ytpipe
