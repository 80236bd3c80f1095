#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct auth_info {
	std::string login = "anonymous";
	std::string password = "anonymous@";
};
struct host_info {
	std::string address;
	uint16_t port = 21;
};
inline bool operator==(const host_info &a, const host_info &b) {
	return a.address == b.address && a.port == b.port;
}
using path_info = std::string;

struct crawl_result {
	std::vector<path_info> files;
	std::vector<std::string> errors;
	bool stopped = false;
};

enum class host_status { succeeded, partial, failed, stopped };
struct host_report {
	host_info host;
	host_status status = host_status::failed;
	size_t files = 0;
	std::vector<std::string> diagnostics;
};

// extension (with the leading dot, empty for none) -> number of files
using extension_counter = std::map<std::string, size_t>;

#endif /* end of include guard: TYPES_HPP */
