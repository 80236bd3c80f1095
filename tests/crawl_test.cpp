#include "crawl.hpp"
#include "fake_session.hpp"
#include "walk.hpp"
#include <algorithm>
#include <atomic>
#include <gtest/gtest.h>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace {
using dir = fake_session;

std::unique_ptr<session> make_site(const host_info &host) {
	auto s = std::make_unique<fake_session>();
	if (host.address == "unreachable")
		throw std::runtime_error{"Connection refused"};
	if (host.address == "alpha") {
		s->tree["/"] = dir::unix_dir({{'-', "index.html"}, {'d', "pub"}});
		s->tree["/pub/"] = dir::unix_dir({{'-', "a.txt"}, {'-', "README"}});
	} else if (host.address == "beta") {
		s->tree["/"] = dir::unix_dir({{'-', "b.txt"}, {'d', "private"}});
		s->tree["/private/"] = dir::unix_dir({});
		s->refused.insert("/private/");
	} else {
		s->tree["/"] = dir::unix_dir({{'-', "my file.txt"}});
	}
	return s;
}

std::vector<std::string> lines_of(const std::string &text) {
	std::vector<std::string> result;
	std::istringstream in{text};
	std::string line;
	while (std::getline(in, line))
		result.push_back(line);
	return result;
}

crawl_options two_threads() {
	crawl_options options;
	options.threads = 2;
	return options;
}
} // namespace

TEST(Crawl, OneUnreachableHostDoesNotAffectTheOthers) {
	std::ostringstream sink;
	stop_flag stop;
	crawl c{two_threads(), sink, stop, {},
	        [](const host_info &host, const auth_info &, std::chrono::seconds) {
		        return make_site(host);
	        }};

	auto summary = c.run({{"alpha", 21}, {"unreachable", 21}, {"beta", 2121}});

	ASSERT_EQ(summary.reports.size(), 3u);
	EXPECT_EQ(summary.failed, 1u);
	EXPECT_EQ(summary.stopped, 0u);
	std::map<std::string, host_report> by_host;
	for (auto &report : summary.reports)
		by_host[report.host.address] = report;

	EXPECT_EQ(by_host["alpha"].status, host_status::succeeded);
	EXPECT_EQ(by_host["alpha"].files, 3u);
	EXPECT_EQ(by_host["beta"].status, host_status::partial);
	EXPECT_EQ(by_host["beta"].files, 1u);
	EXPECT_EQ(by_host["beta"].diagnostics.size(), 1u);
	EXPECT_EQ(by_host["unreachable"].status, host_status::failed);
	EXPECT_EQ(by_host["unreachable"].files, 0u);
	EXPECT_EQ(by_host["unreachable"].diagnostics,
	          (std::vector<std::string>{"Connection refused"}));

	EXPECT_EQ(summary.total, (extension_counter{{".html", 1}, {".txt", 2}, {"", 1}}));
}

TEST(Crawl, WritesEveryFileOnceWithItsHostPrefix) {
	std::ostringstream sink;
	stop_flag stop;
	crawl c{two_threads(), sink, stop, {},
	        [](const host_info &host, const auth_info &, std::chrono::seconds) {
		        return make_site(host);
	        }};

	c.run({{"alpha", 21}, {"beta", 2121}});

	auto written = lines_of(sink.str());
	std::multiset<std::string> paths;
	for (auto &line : written) {
		if (line.rfind("ftp://alpha:21", 0) == 0)
			paths.insert(line.substr(std::string{"ftp://alpha:21"}.size()));
		else if (line.rfind("ftp://beta:2121", 0) == 0)
			paths.insert(line.substr(std::string{"ftp://beta:2121"}.size()));
		else
			ADD_FAILURE() << "unexpected line " << line;
	}
	EXPECT_EQ(paths, (std::multiset<std::string>{"/index.html", "/pub/a.txt",
	                                             "/pub/README", "/b.txt"}));
}

TEST(Crawl, KeepsEachHostsFilesTogetherInWalkOrder) {
	std::ostringstream sink;
	stop_flag stop;
	crawl c{two_threads(), sink, stop, {},
	        [](const host_info &host, const auth_info &, std::chrono::seconds) {
		        return make_site(host);
	        }};

	c.run({{"alpha", 21}, {"beta", 2121}});

	auto written = lines_of(sink.str());
	std::vector<std::string> alpha{"ftp://alpha:21/index.html",
	                               "ftp://alpha:21/pub/a.txt",
	                               "ftp://alpha:21/pub/README"};
	auto at = std::search(written.begin(), written.end(), alpha.begin(), alpha.end());
	EXPECT_NE(at, written.end());
}

TEST(Crawl, QuotesPathsWhenAsked) {
	std::ostringstream sink;
	stop_flag stop;
	auto options = two_threads();
	options.quote_paths = true;
	crawl c{options, sink, stop, {},
	        [](const host_info &host, const auth_info &, std::chrono::seconds) {
		        return make_site(host);
	        }};

	c.run({{"gamma", 21}});

	EXPECT_EQ(sink.str(), "ftp://gamma:21/my%20file.txt\n");
}

TEST(Crawl, HostsNotStartedBeforeStopNeverConnect) {
	std::ostringstream sink;
	stop_flag stop;
	stop.request();
	std::atomic<int> connects{0};
	crawl c{two_threads(), sink, stop, {},
	        [&](const host_info &host, const auth_info &, std::chrono::seconds) {
		        ++connects;
		        return make_site(host);
	        }};

	auto summary = c.run({{"alpha", 21}, {"beta", 21}});

	EXPECT_EQ(connects.load(), 0);
	EXPECT_EQ(summary.stopped, 2u);
	EXPECT_TRUE(sink.str().empty());
	for (auto &report : summary.reports) {
		EXPECT_EQ(report.status, host_status::stopped);
		EXPECT_EQ(report.diagnostics,
		          (std::vector<std::string>{stopped_message(report.host)}));
	}
}

TEST(Crawl, UnwritableSinkAbortsWithoutStartingMoreHosts) {
	std::ostringstream sink;
	sink.setstate(std::ios::badbit);
	stop_flag stop;
	crawl_options options;
	options.threads = 1;
	std::mutex opened_mutex;
	std::vector<std::string> opened;
	crawl c{options, sink, stop, {},
	        [&](const host_info &host, const auth_info &, std::chrono::seconds) {
		        {
			        std::lock_guard lk{opened_mutex};
			        opened.push_back(host.address);
		        }
		        if (host.address == "slow")
			        std::this_thread::sleep_for(std::chrono::milliseconds{300});
		        return make_site(host);
	        }};

	EXPECT_THROW(c.run({{"alpha", 21}, {"slow", 21}, {"late", 21}, {"later", 21}}),
	             std::runtime_error);

	std::lock_guard lk{opened_mutex};
	ASSERT_FALSE(opened.empty());
	EXPECT_EQ(opened.front(), "alpha");
	EXPECT_EQ(std::count(opened.begin(), opened.end(), "late"), 0);
	EXPECT_EQ(std::count(opened.begin(), opened.end(), "later"), 0);
	EXPECT_FALSE(stop.requested());
}

TEST(Crawl, ReportsEachHostAsItFinishes) {
	std::ostringstream sink;
	stop_flag stop;
	std::vector<std::string> finished;
	size_t announced = 0;
	crawl c{two_threads(), sink, stop,
	        {[&](size_t hosts) { announced = hosts; },
	         {},
	         [&](const host_report &report) { finished.push_back(report.host.address); }},
	        [](const host_info &host, const auth_info &, std::chrono::seconds) {
		        return make_site(host);
	        }};

	auto summary = c.run({{"alpha", 21}, {"unreachable", 21}});

	EXPECT_EQ(announced, 2u);
	ASSERT_EQ(finished.size(), 2u);
	EXPECT_EQ(finished[0], summary.reports[0].host.address);
	EXPECT_EQ(finished[1], summary.reports[1].host.address);
}

TEST(Crawl, PassesTimeoutAndAnonymousLoginToFactory) {
	std::ostringstream sink;
	stop_flag stop;
	crawl_options options;
	options.threads = 1;
	options.timeout = std::chrono::seconds{7};
	std::chrono::seconds seen{0};
	std::string login;
	crawl c{options, sink, stop, {},
	        [&](const host_info &host, const auth_info &auth, std::chrono::seconds timeout) {
		        seen = timeout;
		        login = auth.login;
		        return make_site(host);
	        }};

	c.run({{"gamma", 21}});

	EXPECT_EQ(seen, std::chrono::seconds{7});
	EXPECT_EQ(login, "anonymous");
}

TEST(Crawl, NoHostsGivesEmptySummary) {
	std::ostringstream sink;
	stop_flag stop;
	crawl c{two_threads(), sink, stop};

	auto summary = c.run({});

	EXPECT_TRUE(summary.reports.empty());
	EXPECT_TRUE(summary.total.empty());
}

TEST(Crawl, DefaultThreadCountIsBounded) {
	EXPECT_GE(default_thread_count(), 4u);
	EXPECT_LE(default_thread_count(), 32u);
}
