#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace ytpipe {

/// Shared cancellation flag for one request. Copies observe the same state.
/// Callbacks registered with on_cancel() run once, on the thread calling
/// cancel(), or immediately if the token is already cancelled.
class CancelToken {
   public:
	using Registration = std::uint64_t;

	CancelToken() : state_(std::make_shared<State>()) {}

	void cancel() {
		std::map<Registration, std::function<void()>> callbacks;
		{
			std::lock_guard lock(state_->mutex);
			if (state_->cancelled) return;
			state_->cancelled = true;
			callbacks.swap(state_->callbacks);
		}
		for (auto &[id, cb] : callbacks) cb();
	}

	[[nodiscard]] bool cancelled() const {
		std::lock_guard lock(state_->mutex);
		return state_->cancelled;
	}

	Registration on_cancel(std::function<void()> cb) {
		{
			std::lock_guard lock(state_->mutex);
			if (!state_->cancelled) {
				auto id = ++state_->next_id;
				state_->callbacks.emplace(id, std::move(cb));
				return id;
			}
		}
		cb();
		return 0;
	}

	/// Unregister before the object the callback refers to goes away.
	void remove(Registration id) {
		std::lock_guard lock(state_->mutex);
		state_->callbacks.erase(id);
	}

   private:
	struct State {
		mutable std::mutex mutex;
		bool cancelled = false;
		Registration next_id = 0;
		std::map<Registration, std::function<void()>> callbacks;
	};

	std::shared_ptr<State> state_;
};

}  // namespace ytpipe
