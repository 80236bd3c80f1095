#ifndef LISTING_HPP
#define LISTING_HPP

#include <string>
#include <vector>

enum class entry_kind { directory, file, unrecognized };

struct entry_class {
	entry_kind kind;
	// the entry name, or the offending text for unrecognized entries
	std::string text;
};

struct listing_rule {
	entry_kind kind;
	bool (*matches)(const std::string &line);
};

// Checked in order, first match wins. The file rule accepts anything without a
// "<DIR>" marker, so a line in no known format ends up as a file.
const std::vector<listing_rule> &listing_rules();

entry_kind classify_line(const std::string &line);

// One entry per name (except "." and ".."), in name order. Each name takes the
// first unused LIST line ending with it; a used line is never matched again.
std::vector<entry_class> classify_entries(std::vector<std::string> lines,
                                          const std::vector<std::string> &names);

#endif /* end of include guard: LISTING_HPP */
