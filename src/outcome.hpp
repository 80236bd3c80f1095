#ifndef OUTCOME_HPP
#define OUTCOME_HPP

#include <string>
#include <variant>

// Server refused one operation (5xx). The session stays usable.
struct recoverable_error {
	std::string detail;
};
// Transport, timeout or protocol failure. The session is lost.
struct fatal_error {
	std::string detail;
};
using done = std::monostate;

template <typename T>
using outcome = std::variant<T, recoverable_error, fatal_error>;

template <typename T> bool succeeded(const outcome<T> &o) {
	return std::holds_alternative<T>(o);
}

#endif /* end of include guard: OUTCOME_HPP */
