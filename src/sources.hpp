#ifndef SOURCES_HPP
#define SOURCES_HPP

#include "types.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class source_error : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

// host[:port]; host is a name, an IPv4 address or a bracketed IPv6 address
std::optional<host_info> parse_host(const std::string &token,
                                    uint16_t default_port);

// One host[:port] per line. Blank and unparsable lines are skipped.
std::vector<host_info> hosts_from_file(const std::string &path,
                                       uint16_t default_port);

// Open ports nmap identified as ftp, from an -oX report.
std::vector<host_info> hosts_from_nmap(const std::string &path);

#endif /* end of include guard: SOURCES_HPP */
