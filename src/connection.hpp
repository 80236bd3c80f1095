#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include "session.hpp"
#include "types.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct ftp_reply {
	int code;
	std::string text;
};

// "NNN text" or "NNN-text". last is false for the "NNN-" form opening a
// multi-line reply.
bool parse_reply_line(const std::string &line, int &code, bool &last,
                      std::string &text);
// 227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)
std::optional<boost::asio::ip::tcp::endpoint>
parse_passive_reply(const std::string &text);
// 229 Entering Extended Passive Mode (|||port|)
std::optional<uint16_t> parse_extended_passive_reply(const std::string &text);
// 257 "/some ""quoted"" dir" is current directory; empty if there is no quote
std::string parse_directory_reply(const std::string &text);

// Blocking FTP client session. Connects and logs in on construction and
// throws if either fails. Every network operation is bounded by timeout.
class connection : public session {
	boost::asio::io_context context_;
	boost::asio::ip::tcp::socket control_port_;
	boost::asio::streambuf input_;
	std::chrono::steady_clock::duration timeout_;
	bool ascii_ = false;

	template <typename Cancel> void await(Cancel cancel);
	std::string read_line();
	ftp_reply read_answer();
	void send(const std::string &msg);
	ftp_reply ask(const std::string &msg);
	std::string expect(int required_class, const ftp_reply &answer) const;
	boost::asio::ip::tcp::socket connect_transfer();
	std::vector<std::string> transfer(const std::string &command);

public:
	connection(const host_info &host, const auth_info &auth,
	           std::chrono::steady_clock::duration timeout);
	connection(const connection &) = delete;
	connection &operator=(const connection &) = delete;
	~connection() override;

	outcome<std::string> print_directory() override;
	outcome<done> change_directory(const std::string &path) override;
	outcome<std::vector<std::string>> names() override;
	outcome<std::vector<std::string>> lines() override;
	void close() override;
};

#endif /* end of include guard: CONNECTION_HPP */
