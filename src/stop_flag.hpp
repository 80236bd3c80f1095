#ifndef STOP_FLAG_HPP
#define STOP_FLAG_HPP

#include <atomic>

// Set once, never cleared. Safe to set from a signal handler.
// A flag made with an outer flag also reads as requested once the outer one is.
class stop_flag {
	std::atomic<bool> requested_{false};
	const stop_flag *outer_ = nullptr;

public:
	stop_flag() = default;
	explicit stop_flag(const stop_flag *outer) : outer_{outer} {}
	stop_flag(const stop_flag &) = delete;
	stop_flag &operator=(const stop_flag &) = delete;

	void request() noexcept { requested_.store(true, std::memory_order_release); }
	bool requested() const noexcept {
		return requested_.load(std::memory_order_acquire) ||
		       (outer_ && outer_->requested());
	}
};

#endif /* end of include guard: STOP_FLAG_HPP */
