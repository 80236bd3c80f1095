#include "listing.hpp"

#include <algorithm>

static const std::string dir_marker = "<DIR>";

static bool ends_with(const std::string &s, const std::string &suffix) {
	return s.size() >= suffix.size() &&
	       s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
static bool is_directory_line(const std::string &line) {
	return (!line.empty() && line[0] == 'd') ||
	       line.find(dir_marker) != std::string::npos;
}
static bool is_file_line(const std::string &line) {
	return (!line.empty() && line[0] == '-') ||
	       line.find(dir_marker) == std::string::npos;
}

const std::vector<listing_rule> &listing_rules() {
	static const std::vector<listing_rule> rules{
	    {entry_kind::directory, &is_directory_line},
	    {entry_kind::file, &is_file_line}};
	return rules;
}

entry_kind classify_line(const std::string &line) {
	for (auto &rule : listing_rules())
		if (rule.matches(line))
			return rule.kind;
	return entry_kind::unrecognized;
}

std::vector<entry_class> classify_entries(std::vector<std::string> lines,
                                          const std::vector<std::string> &names) {
	std::vector<entry_class> result;
	for (auto &name : names) {
		if (name == "." || name == "..")
			continue;
		auto line = std::find_if(lines.begin(), lines.end(),
		                         [&](const std::string &l) { return ends_with(l, name); });
		if (line == lines.end()) {
			result.push_back({entry_kind::unrecognized, name});
			continue;
		}
		auto kind = classify_line(*line);
		result.push_back({kind, kind == entry_kind::unrecognized ? *line : name});
		lines.erase(line);
	}
	return result;
}
