#ifndef DEFER_HPP
#define DEFER_HPP

#include <functional>
#include <utility>

// Runs the action when leaving scope, however the scope is left.
class defer {
public:
	explicit defer(std::function<void()> action) : action_{std::move(action)} {}
	defer(const defer &) = delete;
	defer &operator=(const defer &) = delete;
	~defer() { action_(); }

private:
	std::function<void()> action_;
};

#endif /* end of include guard: DEFER_HPP */
