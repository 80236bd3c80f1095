#ifndef WALK_HPP
#define WALK_HPP

#include "session.hpp"
#include "stop_flag.hpp"
#include "types.hpp"
#include <deque>
#include <functional>
#include <stdexcept>
#include <string>

// The session broke down; nothing more can be listed on this host.
class session_error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

std::string stopped_message(const host_info &host);

// Walks the whole tree behind one logged in session. Directories the server
// refuses are recorded and skipped; run() throws session_error for anything
// worse. The session is closed when run() returns or throws.
class walk {
public:
	struct callbacks {
		std::function<void(size_t dirs_left, size_t files_found)> progress;
	};

	walk(session &s, const host_info &host, const stop_flag &stop,
	     callbacks cbks = {});
	walk(const walk &) = delete;
	walk &operator=(const walk &) = delete;

	crawl_result run();

private:
	struct directory_content {
		std::vector<path_info> directories;
		std::vector<path_info> files;
	};

	session *session_;
	host_info host_;
	const stop_flag *stop_;
	callbacks callbacks_;
	std::deque<path_info> frontier_;
	// prefix for CWD when the root could not be entered
	std::string home_;
	bool rooted_ = true;
	// levels below the login directory, when neither "/" nor PWD is usable
	size_t depth_ = 0;

	void choose_root();
	outcome<done> enter(const path_info &path);
	outcome<directory_content> list(const path_info &path);
	path_info absolute(const path_info &path) const;
	std::string diagnostic(const path_info &path, const std::string &detail) const;
};

#endif /* end of include guard: WALK_HPP */
