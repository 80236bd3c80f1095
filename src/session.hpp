#ifndef SESSION_HPP
#define SESSION_HPP

#include "outcome.hpp"
#include <string>
#include <vector>

// One logged in FTP control connection, as seen by the walker.
class session {
public:
	virtual ~session() = default;

	virtual outcome<std::string> print_directory() = 0;
	virtual outcome<done> change_directory(const std::string &path) = 0;
	// NLST of the current directory
	virtual outcome<std::vector<std::string>> names() = 0;
	// LIST of the current directory
	virtual outcome<std::vector<std::string>> lines() = 0;
	virtual void close() = 0;
};

#endif /* end of include guard: SESSION_HPP */
