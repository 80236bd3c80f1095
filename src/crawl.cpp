#include "crawl.hpp"

#include "connection.hpp"
#include "executor.hpp"
#include "statistics.hpp"
#include "walk.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

using std::move;

size_t default_thread_count() {
	return std::min(32u, std::thread::hardware_concurrency() + 4);
}

std::unique_ptr<session> connect_session(const host_info &host,
                                         const auth_info &auth,
                                         std::chrono::seconds timeout) {
	return std::make_unique<connection>(host, auth, timeout);
}

crawl::crawl(crawl_options options, std::ostream &sink, const stop_flag &stop,
             callbacks cbks, session_factory factory)
    : options_{move(options)}, sink_{&sink}, halt_{&stop},
      callbacks_{move(cbks)}, factory_{move(factory)} {}

crawl_summary crawl::run(const std::vector<host_info> &hosts) {
	auto start = std::chrono::steady_clock::now();
	crawl_summary summary;
	if (callbacks_.started)
		callbacks_.started(hosts.size());
	{
		executor<completion> workers{options_.threads ? options_.threads
		                                              : default_thread_count()};
		for (auto &host : hosts)
			workers.submit([this, host] { return visit(host); });
		try {
			while (workers.pending() > 0)
				record(workers.next(), summary);
		} catch (const std::exception &) {
			halt_.request();
			throw;
		}
	}
	summary.elapsed = std::chrono::duration_cast<std::chrono::seconds>(
	    std::chrono::steady_clock::now() - start);
	return summary;
}

// Runs on a worker thread; everything it produces goes back via the result.
crawl::completion crawl::visit(const host_info &host) const {
	completion item;
	item.report.host = host;
	if (halt_.requested()) {
		item.report.status = host_status::stopped;
		item.report.diagnostics.push_back(stopped_message(host));
		return item;
	}
	try {
		auto s = factory_(host, options_.auth, options_.timeout);
		walk w{*s, host, halt_,
		       {[this, &host](size_t dirs_left, size_t files_found) {
			       if (callbacks_.progress)
				       callbacks_.progress(host, dirs_left, files_found);
		       }}};
		item.result = w.run();
	} catch (const std::exception &e) {
		item.report.status = host_status::failed;
		item.report.diagnostics.push_back(e.what());
		return item;
	}
	item.report.files = item.result.files.size();
	item.report.diagnostics = item.result.errors;
	if (item.result.stopped)
		item.report.status = host_status::stopped;
	else if (item.result.errors.empty())
		item.report.status = host_status::succeeded;
	else
		item.report.status = host_status::partial;
	return item;
}

void crawl::record(completion item, crawl_summary &summary) {
	auto &report = item.report;
	if (report.status == host_status::failed) {
		++summary.failed;
	} else {
		if (report.status == host_status::stopped)
			++summary.stopped;
		for (auto &file : item.result.files)
			*sink_ << file_reference(report.host, file, options_.quote_paths) << '\n';
		sink_->flush();
		if (!*sink_)
			throw std::runtime_error{"cannot write the file list"};
		merge(summary.total, count_extensions(item.result.files));
	}
	if (callbacks_.finished)
		callbacks_.finished(report);
	summary.reports.push_back(move(report));
}
