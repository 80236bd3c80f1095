#include "FtpRipper.hpp"

using std::move;

FtpRipper::FtpRipper(QObject *parent) : QObject{parent}, current_crawl_{} {
	qRegisterMetaType<size_t>("size_t");
	qRegisterMetaType<HostInfo>("HostInfo");
	qRegisterMetaType<HostReport>("HostReport");
	qRegisterMetaType<Summary>("Summary");
}
FtpRipper::~FtpRipper() {
	stop();
	if (current_crawl_.valid())
		current_crawl_.wait();
}

void FtpRipper::stop() { stop_.request(); }
void FtpRipper::start(std::vector<host_info> hosts, crawl_options options,
                      std::ostream &sink) {
	current_crawl_ = std::async(
	    std::launch::async,
	    [this, hosts = move(hosts), options = move(options), &sink] {
		    crawl c{options,
		            sink,
		            stop_,
		            {[this](size_t count) { emit started(count); },
		             [this](const host_info &host, size_t dirs, size_t files) {
			             emit progress(host, dirs, files);
		             },
		             [this](const host_report &report) { emit hostFinished(report); }}};
		    try {
			    emit finished(c.run(hosts));
		    } catch (const std::exception &e) {
			    emit failed(QString::fromStdString(e.what()));
		    }
	    });
}
