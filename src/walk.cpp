#include "walk.hpp"

#include "defer.hpp"
#include "listing.hpp"
#include <algorithm>

using std::move;

namespace {
// Pass values and refusals on; a broken session ends the walk.
template <typename T> outcome<T> checked(outcome<T> o) {
	if (auto e = std::get_if<fatal_error>(&o))
		throw session_error{e->detail};
	return o;
}
} // namespace

std::string stopped_message(const host_info &host) {
	return "Stopped working with " + host.address + ":" +
	       std::to_string(host.port) + " server.";
}

walk::walk(session &s, const host_info &host, const stop_flag &stop,
           callbacks cbks)
    : session_{&s}, host_{host}, stop_{&stop}, callbacks_{move(cbks)},
      frontier_{}, home_{} {}

void walk::choose_root() {
	auto root = checked(session_->change_directory("/"));
	if (succeeded(root)) {
		rooted_ = true;
		frontier_ = {"/"};
		return;
	}
	// No access to "/": walk below the login directory instead.
	rooted_ = false;
	frontier_ = {""};
	auto home = checked(session_->print_directory());
	if (auto dir = std::get_if<std::string>(&home)) {
		home_ = *dir;
		if (!home_.empty() && home_.back() != '/')
			home_ += '/';
	}
}

outcome<done> walk::enter(const path_info &path) {
	if (rooted_ || !home_.empty())
		return checked(session_->change_directory(home_ + path));
	// Login directory unknown: climb back to it, then descend relative to it.
	for (; depth_ > 0; --depth_) {
		auto up = checked(session_->change_directory(".."));
		if (!succeeded(up))
			return up;
	}
	auto cwd = checked(session_->change_directory(path));
	if (succeeded(cwd))
		depth_ = static_cast<size_t>(std::count(path.begin(), path.end(), '/'));
	return cwd;
}

outcome<walk::directory_content> walk::list(const path_info &path) {
	auto cwd = enter(path);
	if (!succeeded(cwd))
		return std::get<recoverable_error>(cwd);
	auto names = checked(session_->names());
	if (!succeeded(names))
		return std::get<recoverable_error>(names);
	auto lines = checked(session_->lines());
	if (!succeeded(lines))
		return std::get<recoverable_error>(lines);

	directory_content result;
	auto entries = classify_entries(move(std::get<std::vector<std::string>>(lines)),
	                                std::get<std::vector<std::string>>(names));
	for (auto &entry : entries) {
		switch (entry.kind) {
		case entry_kind::directory:
			result.directories.push_back(path + entry.text + '/');
			break;
		case entry_kind::file:
			result.files.push_back(path + entry.text);
			break;
		case entry_kind::unrecognized:
			return recoverable_error{"Unsupported string format: " + entry.text};
		}
	}
	return result;
}

path_info walk::absolute(const path_info &path) const {
	return rooted_ ? path : '/' + path;
}

std::string walk::diagnostic(const path_info &path,
                             const std::string &detail) const {
	return host_.address + ":" + std::to_string(host_.port) + " " +
	       absolute(path) + ": " + detail;
}

crawl_result walk::run() {
	defer closing{[this] { session_->close(); }};
	crawl_result result;
	choose_root();
	while (!frontier_.empty()) {
		if (stop_->requested()) {
			result.errors.push_back(stopped_message(host_));
			result.stopped = true;
			frontier_.clear();
			break;
		}
		if (callbacks_.progress)
			callbacks_.progress(frontier_.size(), result.files.size());

		auto path = frontier_.front();
		auto content = list(path);
		frontier_.pop_front();
		if (auto e = std::get_if<recoverable_error>(&content)) {
			result.errors.push_back(diagnostic(path, e->detail));
			continue;
		}
		auto &found = std::get<directory_content>(content);
		for (auto &file : found.files)
			result.files.push_back(absolute(file));
		frontier_.insert(frontier_.begin(), found.directories.begin(),
		                 found.directories.end());
	}
	return result;
}
