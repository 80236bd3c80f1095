#include "sources.hpp"
#include <fstream>
#include <gtest/gtest.h>

namespace {
std::string write_file(const std::string &name, const std::string &content) {
	auto path = testing::TempDir() + name;
	std::ofstream out{path};
	out << content;
	return path;
}
} // namespace

TEST(Sources, HostToken) {
	EXPECT_EQ(parse_host("ftp.example.org", 21), (host_info{"ftp.example.org", 21}));
	EXPECT_EQ(parse_host("10.0.0.1:2121", 21), (host_info{"10.0.0.1", 2121}));
	EXPECT_EQ(parse_host("[2001:db8::1]:990", 21), (host_info{"2001:db8::1", 990}));
	EXPECT_EQ(parse_host("[::1]", 2121), (host_info{"::1", 2121}));
	EXPECT_FALSE(parse_host("", 21));
	EXPECT_FALSE(parse_host("host:0", 21));
	EXPECT_FALSE(parse_host("host:70000", 21));
	EXPECT_FALSE(parse_host("host:port", 21));
	EXPECT_FALSE(parse_host("two words", 21));
}

TEST(Sources, HostFileSkipsBlankAndBadLines) {
	auto path = write_file("hosts.txt", "alpha\n"
	                                    "\n"
	                                    "  beta:2121  \n"
	                                    "not a host\n"
	                                    "10.1.1.1\r\n");

	auto hosts = hosts_from_file(path, 21);

	EXPECT_EQ(hosts, (std::vector<host_info>{
	                     {"alpha", 21}, {"beta", 2121}, {"10.1.1.1", 21}}));
}

TEST(Sources, MissingHostFileThrows) {
	EXPECT_THROW(hosts_from_file(testing::TempDir() + "no-such-hosts.txt", 21),
	             source_error);
}

TEST(Sources, NmapReportKeepsOpenFtpPorts) {
	auto path = write_file("scan.xml", R"(<?xml version="1.0"?>
<nmaprun scanner="nmap">
  <host>
    <status state="up"/>
    <address addr="192.168.0.10" addrtype="ipv4"/>
    <address addr="00:11:22:33:44:55" addrtype="mac"/>
    <ports>
      <extraports state="closed" count="997"/>
      <port protocol="tcp" portid="21"><state state="open"/><service name="ftp"/></port>
      <port protocol="tcp" portid="22"><state state="open"/><service name="ssh"/></port>
      <port protocol="tcp" portid="2121"><state state="open"/><service name="ftp"/></port>
    </ports>
  </host>
  <host>
    <address addr="192.168.0.11" addrtype="ipv4"/>
    <ports>
      <port protocol="tcp" portid="21"><state state="filtered"/><service name="ftp"/></port>
    </ports>
  </host>
</nmaprun>
)");

	auto hosts = hosts_from_nmap(path);

	EXPECT_EQ(hosts, (std::vector<host_info>{{"192.168.0.10", 21},
	                                         {"192.168.0.10", 2121}}));
}

TEST(Sources, BrokenNmapReportThrows) {
	auto path = write_file("broken.xml", "<nmaprun><host><address addr=\"1.2.3.4\"/>");
	EXPECT_THROW(hosts_from_nmap(path), source_error);
}
