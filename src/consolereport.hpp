#ifndef CONSOLEREPORT_HPP
#define CONSOLEREPORT_HPP

#include "FtpRipper.hpp"
#include <QtCore/QLoggingCategory>
#include <QtCore/QObject>

Q_DECLARE_LOGGING_CATEGORY(lcCrawl)
Q_DECLARE_LOGGING_CATEGORY(lcProgress)

// Bare messages; per-directory progress only when verbose.
void configureLogging(bool verbose);

// ASCII-art name followed by the version line
QString bannerText();

class ConsoleReport : public QObject {
	Q_OBJECT

public:
	explicit ConsoleReport(FtpRipper *ripper, QObject *parent = nullptr);
	~ConsoleReport() override;

	static void printBanner();

signals:
	// the run is over; exitCode is what the process should return
	void done(int exitCode);
};

#endif // CONSOLEREPORT_HPP
