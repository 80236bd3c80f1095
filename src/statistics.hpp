#ifndef STATISTICS_HPP
#define STATISTICS_HPP

#include "types.hpp"
#include <chrono>
#include <string>
#include <vector>

// Suffix of the last path component including the dot, "" if there is none.
// A leading or trailing dot does not start a suffix (".profile", "name.").
std::string extension_of(const path_info &path);

extension_counter count_extensions(const std::vector<path_info> &files);
void merge(extension_counter &total, const extension_counter &part);
size_t total_files(const extension_counter &counter);

// ftp://host:port/path, with IPv6 literals in brackets. With quote set the
// path is percent-encoded, leaving unreserved characters and '/' alone.
std::string file_reference(const host_info &host, const path_info &path,
                           bool quote = false);
std::string percent_encode(const std::string &path);

// "Total: N files", then " .ext: n" per extension in order, then
// " Unknown files: n" for names without an extension.
std::string format_statistics(const extension_counter &counter);

// H:MM:SS
std::string format_elapsed(std::chrono::seconds elapsed);

#endif /* end of include guard: STATISTICS_HPP */
