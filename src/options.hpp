#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include "crawl.hpp"
#include <QtCore/QStringList>
#include <cstdint>
#include <stdexcept>
#include <string>

enum class input_mode { host, file, nmap };

struct options {
	input_mode mode = input_mode::host;
	uint16_t port = 21;
	bool verbose = false;
	std::string input;
	std::string output;
	crawl_options crawling{};
};

// Bad command line. what() is the message to show next to the usage text.
class usage_error : public std::invalid_argument {
public:
	using std::invalid_argument::invalid_argument;
};

// Throws usage_error. Help and version requests are handled by
// QCommandLineParser itself and exit the process.
options parse_options(const QStringList &arguments);

#endif /* end of include guard: OPTIONS_HPP */
