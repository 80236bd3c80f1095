// before any Qt header: Qt's keyword macros must not reach Boost
#include "interrupts.hpp"

#include "FtpRipper.hpp"
#include "consolereport.hpp"
#include "options.hpp"
#include "sources.hpp"
#include <QtCore/QCoreApplication>
#include <cstdlib>
#include <fstream>

static std::vector<host_info> read_hosts(const options &opts) {
	switch (opts.mode) {
	case input_mode::file:
		return hosts_from_file(opts.input, opts.port);
	case input_mode::nmap:
		return hosts_from_nmap(opts.input);
	case input_mode::host:
		break;
	}
	auto host = parse_host(opts.input, opts.port);
	if (!host)
		throw source_error{"invalid host: " + opts.input};
	return {*host};
}

int main(int argc, char *argv[]) {
	QCoreApplication app{argc, argv};
	QCoreApplication::setApplicationName("ftpripper");
	QCoreApplication::setApplicationVersion(FTPRIPPER_VERSION);

	options opts;
	try {
		opts = parse_options(app.arguments());
	} catch (const usage_error &e) {
		qCritical().noquote() << e.what() << "\nTry 'ftpripper --help'.";
		return 2;
	}
	configureLogging(opts.verbose);

	std::vector<host_info> hosts;
	try {
		hosts = read_hosts(opts);
	} catch (const std::exception &e) {
		qCCritical(lcCrawl).noquote() << e.what();
		return 1;
	}
	std::ofstream out{opts.output};
	if (!out) {
		qCCritical(lcCrawl).noquote() << "cannot open" << QString::fromStdString(opts.output);
		return 1;
	}

	ConsoleReport::printBanner();
	FtpRipper ripper;
	ConsoleReport report{&ripper};
	QObject::connect(&report, &ConsoleReport::done, &app, &QCoreApplication::exit,
	                 Qt::QueuedConnection);

	interrupts watch{[&ripper] {
		                 qCInfo(lcCrawl) << "\nStopping...";
		                 ripper.stop();
	                 },
	                 [] {
		                 qCWarning(lcCrawl) << "Interrupted again, exiting now.";
		                 std::_Exit(130);
	                 }};

	ripper.start(std::move(hosts), opts.crawling, out);
	return app.exec();
}
