#include "statistics.hpp"

#include <cstdio>

std::string extension_of(const path_info &path) {
	auto slash = path.rfind('/');
	auto name = slash == std::string::npos ? path : path.substr(slash + 1);
	auto dot = name.rfind('.');
	if (dot == std::string::npos || dot == 0 || dot + 1 == name.size())
		return {};
	return name.substr(dot);
}

extension_counter count_extensions(const std::vector<path_info> &files) {
	extension_counter result;
	for (auto &file : files)
		++result[extension_of(file)];
	return result;
}

void merge(extension_counter &total, const extension_counter &part) {
	for (auto &[extension, count] : part)
		total[extension] += count;
}

size_t total_files(const extension_counter &counter) {
	size_t result = 0;
	for (auto &entry : counter)
		result += entry.second;
	return result;
}

std::string percent_encode(const std::string &path) {
	static const char hex[] = "0123456789ABCDEF";
	std::string result;
	result.reserve(path.size());
	for (unsigned char c : path) {
		if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
		    (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~' ||
		    c == '/') {
			result += static_cast<char>(c);
		} else {
			result += '%';
			result += hex[c >> 4];
			result += hex[c & 0x0f];
		}
	}
	return result;
}

std::string file_reference(const host_info &host, const path_info &path,
                           bool quote) {
	auto address = host.address.find(':') == std::string::npos
	                   ? host.address
	                   : '[' + host.address + ']';
	return "ftp://" + address + ":" + std::to_string(host.port) +
	       (quote ? percent_encode(path) : path);
}

std::string format_statistics(const extension_counter &counter) {
	std::string result = "Total: " + std::to_string(total_files(counter)) + " files\n";
	for (auto &[extension, count] : counter)
		if (!extension.empty())
			result += " " + extension + ": " + std::to_string(count) + "\n";
	auto unknown = counter.find("");
	if (unknown != counter.end())
		result += " Unknown files: " + std::to_string(unknown->second) + "\n";
	return result;
}

std::string format_elapsed(std::chrono::seconds elapsed) {
	auto total = elapsed.count() < 0 ? 0 : elapsed.count();
	char buffer[32];
	std::snprintf(buffer, sizeof(buffer), "%lld:%02lld:%02lld",
	              static_cast<long long>(total / 3600),
	              static_cast<long long>(total / 60 % 60),
	              static_cast<long long>(total % 60));
	return buffer;
}
