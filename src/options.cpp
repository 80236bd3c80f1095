#include "options.hpp"

#include <QtCore/QCommandLineParser>

namespace {
unsigned long positive(const QCommandLineParser &parser, const QString &name,
                       unsigned long max) {
	bool ok = false;
	auto value = parser.value(name).toULong(&ok);
	if (!ok || value == 0 || value > max)
		throw usage_error{("invalid value for --" + name + ": " + parser.value(name))
		                      .toStdString()};
	return value;
}
} // namespace

options parse_options(const QStringList &arguments) {
	QCommandLineParser parser;
	parser.setApplicationDescription("Get list of files from FTP servers");
	auto help = parser.addHelpOption();
	auto version = parser.addVersionOption();
	parser.addOptions({
	    {{"m", "mode"}, "Input type: host, file or nmap.", "mode", "host"},
	    {{"p", "port"}, "Default port number.", "port", "21"},
	    {{"t", "threads"}, "Number of threads.", "threads"},
	    {"timeout", "Timeout in seconds for FTP operations.", "seconds", "60"},
	    {{"v", "verbose"}, "Show progress for every directory."},
	    {{"q", "quote"}, "Percent-encode paths in the output."},
	});
	parser.addPositionalArgument("input", "Host, host list file or nmap XML.");
	parser.addPositionalArgument("output", "Path to save list of files.");

	if (!parser.parse(arguments))
		throw usage_error{parser.errorText().toStdString()};
	if (parser.isSet(help))
		parser.showHelp();
	if (parser.isSet(version))
		parser.showVersion();

	options result;
	auto mode = parser.value("mode");
	if (mode == "host")
		result.mode = input_mode::host;
	else if (mode == "file")
		result.mode = input_mode::file;
	else if (mode == "nmap")
		result.mode = input_mode::nmap;
	else
		throw usage_error{("unknown mode: " + mode).toStdString()};

	result.port = static_cast<uint16_t>(positive(parser, "port", 65535));
	if (parser.isSet("threads"))
		result.crawling.threads = positive(parser, "threads", 1024);
	result.crawling.timeout = std::chrono::seconds{positive(parser, "timeout", 86400)};
	result.crawling.quote_paths = parser.isSet("quote");
	result.verbose = parser.isSet("verbose");

	auto positional = parser.positionalArguments();
	if (positional.size() != 2)
		throw usage_error{"expected input and output arguments"};
	result.input = positional[0].toStdString();
	result.output = positional[1].toStdString();
	return result;
}
