#include "consolereport.hpp"

#include "statistics.hpp"
#include <QtCore/QCoreApplication>
#include <QtCore/QTextStream>

Q_LOGGING_CATEGORY(lcCrawl, "ftpripper.crawl")
Q_LOGGING_CATEGORY(lcProgress, "ftpripper.progress", QtInfoMsg)

static QString hostName(const FtpRipper::HostInfo &host) {
	return QString::fromStdString(host.address) + ':' + QString::number(host.port);
}

void configureLogging(bool verbose) {
	qSetMessagePattern("%{message}");
	if (verbose)
		QLoggingCategory::setFilterRules("ftpripper.progress.debug=true");
}

static const char banner[] = R"(
 _____ _____ ____       _
|  ___|_   _|  _ \ _ __(_)_ __  _ __   ___ _ __
| |_    | | | |_) | '__| | '_ \| '_ \ / _ \ '__|
|  _|   | | |  __/| |  | | |_) | |_) |  __/ |
|_|     |_| |_|   |_|  |_| .__/| .__/ \___|_|
                         |_|   |_|
)";

QString bannerText() {
	return QString{banner} + 'v' + QCoreApplication::applicationVersion() + '\n';
}

void ConsoleReport::printBanner() {
	QTextStream out{stdout};
	out << bannerText() << '\n';
}

ConsoleReport::ConsoleReport(FtpRipper *ripper, QObject *parent)
    : QObject{parent} {
	connect(ripper, &FtpRipper::started, this,
	        [](size_t hosts) {
		        qCInfo(lcCrawl).noquote() << "Total number of hosts:" << hosts;
	        },
	        Qt::QueuedConnection);
	connect(ripper, &FtpRipper::progress, this,
	        [](FtpRipper::HostInfo host, size_t dirsLeft, size_t filesFound) {
		        qCDebug(lcProgress).noquote()
		            << QString{"Working with %1 server. %2 directory left, %3 files found."}
		                   .arg(hostName(host))
		                   .arg(dirsLeft)
		                   .arg(filesFound);
	        },
	        Qt::QueuedConnection);
	connect(ripper, &FtpRipper::hostFinished, this,
	        [](FtpRipper::HostReport report) {
		        auto name = hostName(report.host);
		        switch (report.status) {
		        case host_status::failed:
			        qCWarning(lcCrawl).noquote()
			            << QString{"Error on %1 server. %2"}.arg(
			                   name, QString::fromStdString(report.diagnostics.front()));
			        return;
		        case host_status::stopped:
			        qCInfo(lcCrawl).noquote()
			            << QString{"Stopped working with %1 server."}.arg(name);
			        if (report.files == 0)
				        return;
			        break;
		        case host_status::partial:
			        for (auto &diagnostic : report.diagnostics)
				        qCWarning(lcCrawl).noquote() << QString::fromStdString(diagnostic);
			        break;
		        case host_status::succeeded:
			        break;
		        }
		        qCInfo(lcCrawl).noquote() << QString{"Done with %1 server. %2 files found."}
		                                         .arg(name)
		                                         .arg(report.files);
	        },
	        Qt::QueuedConnection);
	connect(ripper, &FtpRipper::finished, this,
	        [this](FtpRipper::Summary summary) {
		        QTextStream out{stdout};
		        out << "Elapsed time: "
		            << QString::fromStdString(format_elapsed(summary.elapsed)) << '\n';
		        if (summary.failed > 0 || summary.stopped > 0)
			        out << "Hosts failed: " << summary.failed
			            << ", stopped: " << summary.stopped << '\n';
		        out << "SUMMARY STATISTICS\n"
		            << QString::fromStdString(format_statistics(summary.total));
		        out.flush();
		        emit done(0);
	        },
	        Qt::QueuedConnection);
	connect(ripper, &FtpRipper::failed, this,
	        [this](QString reason) {
		        qCCritical(lcCrawl).noquote() << reason;
		        emit done(1);
	        },
	        Qt::QueuedConnection);
}
ConsoleReport::~ConsoleReport() {}
