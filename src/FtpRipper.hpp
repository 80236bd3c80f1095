#ifndef FTP_RIPPER_HPP
#define FTP_RIPPER_HPP

#include "crawl.hpp"
#include "stop_flag.hpp"
#include "types.hpp"
#include <QtCore/QMetaType>
#include <QtCore/QObject>
#include <future>
#include <ostream>
#include <vector>

// Runs a crawl off the calling thread and reports it through signals.
class FtpRipper : public QObject {
	Q_OBJECT

	stop_flag stop_;
	std::future<void> current_crawl_;

public:
	using HostInfo = host_info;
	using HostReport = host_report;
	using Summary = crawl_summary;

	explicit FtpRipper(QObject *parent = nullptr);
	// requests a stop and waits for the running crawl
	~FtpRipper() override;

	// sink must outlive this object
	void start(std::vector<host_info> hosts, crawl_options options,
	           std::ostream &sink);

public slots:
	void stop();
signals:
	void started(size_t hosts);
	void progress(HostInfo host, size_t dirsLeft, size_t filesFound);
	void hostFinished(HostReport report);
	void finished(Summary summary);
	void failed(QString reason);
};

Q_DECLARE_METATYPE(host_info)
Q_DECLARE_METATYPE(host_report)
Q_DECLARE_METATYPE(crawl_summary)

#endif /* end of include guard: FTP_RIPPER_HPP */
