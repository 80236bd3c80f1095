#ifndef CRAWL_HPP
#define CRAWL_HPP

#include "session.hpp"
#include "stop_flag.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <ostream>
#include <vector>

struct crawl_options {
	size_t threads = 0; // 0 picks default_thread_count()
	std::chrono::seconds timeout{60};
	bool quote_paths = false;
	auth_info auth{};
};

struct crawl_summary {
	extension_counter total;
	std::vector<host_report> reports; // in completion order
	size_t failed = 0;
	size_t stopped = 0;
	std::chrono::seconds elapsed{0};
};

size_t default_thread_count();

std::unique_ptr<session> connect_session(const host_info &host,
                                         const auth_info &auth,
                                         std::chrono::seconds timeout);

// Crawls every host on a fixed pool of workers, one fresh session per host.
// Only the thread calling run() writes to the sink and the totals; hosts are
// written one at a time, in the order they finish. If writing fails, hosts not
// yet started are skipped, running ones stop at their next checkpoint, and
// run() throws.
class crawl {
public:
	using session_factory = std::function<std::unique_ptr<session>(
	    const host_info &, const auth_info &, std::chrono::seconds)>;
	struct callbacks {
		std::function<void(size_t hosts)> started;
		// called on worker threads
		std::function<void(const host_info &, size_t dirs_left, size_t files_found)>
		    progress;
		std::function<void(const host_report &)> finished;
	};

	crawl(crawl_options options, std::ostream &sink, const stop_flag &stop,
	      callbacks cbks = {}, session_factory factory = connect_session);
	crawl(const crawl &) = delete;
	crawl &operator=(const crawl &) = delete;

	crawl_summary run(const std::vector<host_info> &hosts);

private:
	struct completion {
		host_report report;
		crawl_result result;
	};

	crawl_options options_;
	std::ostream *sink_;
	// the caller's flag, plus our own request when the run is aborted
	stop_flag halt_;
	callbacks callbacks_;
	session_factory factory_;

	completion visit(const host_info &host) const;
	void record(completion item, crawl_summary &summary);
};

#endif /* end of include guard: CRAWL_HPP */
