#include "connection.hpp"

#include <istream>
#include <regex>
#include <stdexcept>

using boost::asio::ip::tcp;
using boost::system::error_code;
using boost::system::system_error;

namespace {
// Server said no (5xx), or the command cannot be sent at all.
class command_refused : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

std::string describe(const ftp_reply &answer) {
	return std::to_string(answer.code) + " " + answer.text;
}

template <typename T, typename Fn> outcome<T> guarded(Fn &&fn) {
	try {
		return fn();
	} catch (const command_refused &e) {
		return recoverable_error{e.what()};
	} catch (const std::exception &e) {
		return fatal_error{e.what()};
	}
}
} // namespace

bool parse_reply_line(const std::string &line, int &code, bool &last,
                      std::string &text) {
	static const std::regex answer_parser{
	    R"R((\d{3})(?:([ -])(.*))?)R",
	    std::regex_constants::ECMAScript | std::regex_constants::optimize};
	std::smatch match;
	if (!std::regex_match(line, match, answer_parser))
		return false;
	code = std::stoi(match[1]);
	last = match[2] != "-";
	text = match[3];
	return true;
}

std::optional<tcp::endpoint> parse_passive_reply(const std::string &text) {
	static const std::regex ip_port_parser{
	    R"R((\d{1,3}),(\d{1,3}),(\d{1,3}),(\d{1,3}),(\d{1,3}),(\d{1,3}))R",
	    std::regex_constants::ECMAScript | std::regex_constants::optimize};
	std::smatch match;
	if (!std::regex_search(text, match, ip_port_parser))
		return std::nullopt;
	int parts[6];
	for (int i = 0; i < 6; i++) {
		parts[i] = std::stoi(match[i + 1]);
		if (parts[i] > 255)
			return std::nullopt;
	}
	uint32_t ip = 0;
	for (int i = 0; i < 4; i++)
		ip |= (static_cast<uint32_t>(parts[i]) << (8 * (3 - i)));
	uint16_t port = static_cast<uint16_t>((parts[4] << 8) | parts[5]);
	return tcp::endpoint{boost::asio::ip::address_v4(ip), port};
}

std::optional<uint16_t> parse_extended_passive_reply(const std::string &text) {
	static const std::regex port_parser{
	    R"R(\((.)\1\1(\d{1,5})\1\))R",
	    std::regex_constants::ECMAScript | std::regex_constants::optimize};
	std::smatch match;
	if (!std::regex_search(text, match, port_parser))
		return std::nullopt;
	auto port = std::stoul(match[2]);
	if (port == 0 || port > 65535)
		return std::nullopt;
	return static_cast<uint16_t>(port);
}

std::string parse_directory_reply(const std::string &text) {
	auto start = text.find('"');
	if (start == std::string::npos)
		return {};
	std::string result;
	for (size_t i = start + 1; i < text.size(); i++) {
		if (text[i] != '"') {
			result += text[i];
			continue;
		}
		if (i + 1 < text.size() && text[i + 1] == '"') {
			result += '"';
			i++;
			continue;
		}
		break;
	}
	return result;
}

// Runs the pending operation; on expiry cancels it and throws.
template <typename Cancel> void connection::await(Cancel cancel) {
	context_.restart();
	context_.run_for(timeout_);
	if (!context_.stopped()) {
		cancel();
		context_.run();
		throw system_error{boost::asio::error::timed_out};
	}
}

connection::connection(const host_info &host, const auth_info &auth,
                       std::chrono::steady_clock::duration timeout)
    : context_{}, control_port_{context_}, input_{}, timeout_{timeout} {
	error_code ec;
	tcp::resolver resolver{context_};
	tcp::resolver::results_type endpoints;
	resolver.async_resolve(host.address, std::to_string(host.port),
	                       [&](const error_code &e, tcp::resolver::results_type r) {
		                       ec = e;
		                       endpoints = std::move(r);
	                       });
	await([&] { resolver.cancel(); });
	if (ec)
		throw system_error{ec, "resolve " + host.address};

	boost::asio::async_connect(control_port_, endpoints,
	                           [&](const error_code &e, const tcp::endpoint &) { ec = e; });
	await([this] {
		error_code ignored;
		control_port_.close(ignored);
	});
	if (ec)
		throw system_error{ec, "connect"};

	expect(2, read_answer());
	auto answer = ask("USER " + auth.login);
	if (answer.code / 100 == 3)
		answer = ask("PASS " + auth.password);
	if (answer.code / 100 == 3)
		answer = ask("ACCT ");
	expect(2, answer);
}
connection::~connection() { close(); }

std::string connection::read_line() {
	error_code ec;
	size_t input_len = 0;
	boost::asio::async_read_until(control_port_, input_, '\n',
	                              [&](const error_code &e, size_t n) {
		                              ec = e;
		                              input_len = n;
	                              });
	await([this] {
		error_code ignored;
		control_port_.close(ignored);
	});
	if (ec)
		throw system_error{ec};
	auto begin = boost::asio::buffers_begin(input_.data());
	std::string result(begin, begin + static_cast<std::ptrdiff_t>(input_len) - 1);
	input_.consume(input_len);
	if (!result.empty() && result.back() == '\r')
		result.pop_back();
	return result;
}

ftp_reply connection::read_answer() {
	auto line = read_line();
	ftp_reply result;
	bool last;
	if (!parse_reply_line(line, result.code, last, result.text))
		throw std::runtime_error{"Invalid answer: " + line};
	while (!last) {
		line = read_line();
		int code;
		std::string text;
		if (parse_reply_line(line, code, last, text) && code == result.code &&
		    last) {
			result.text += '\n' + text;
		} else {
			last = false;
			result.text += '\n' + line;
		}
	}
	return result;
}

void connection::send(const std::string &msg) {
	if (msg.find_first_of("\r\n") != std::string::npos)
		throw command_refused{"illegal newline character in command"};
	auto line = msg + "\r\n";
	error_code ec;
	boost::asio::async_write(control_port_, boost::asio::buffer(line),
	                         [&](const error_code &e, size_t) { ec = e; });
	await([this] {
		error_code ignored;
		control_port_.close(ignored);
	});
	if (ec)
		throw system_error{ec};
}

ftp_reply connection::ask(const std::string &msg) {
	send(msg);
	return read_answer();
}

std::string connection::expect(int required_class,
                               const ftp_reply &answer) const {
	if (answer.code / 100 == required_class)
		return answer.text;
	if (answer.code / 100 == 5)
		throw command_refused{describe(answer)};
	throw std::runtime_error{describe(answer)};
}

tcp::socket connection::connect_transfer() {
	auto peer = control_port_.remote_endpoint();
	tcp::endpoint endpoint;
	if (peer.address().is_v6()) {
		auto port = parse_extended_passive_reply(expect(2, ask("EPSV")));
		if (!port)
			throw std::runtime_error{"Invalid answer to EPSV"};
		endpoint = tcp::endpoint{peer.address(), *port};
	} else {
		// the advertised address is often a private one; use the peer instead
		auto advertised = parse_passive_reply(expect(2, ask("PASV")));
		if (!advertised)
			throw std::runtime_error{"Invalid answer to PASV"};
		endpoint = tcp::endpoint{peer.address(), advertised->port()};
	}
	tcp::socket transfer_port{context_};
	error_code ec;
	transfer_port.async_connect(endpoint, [&](const error_code &e) { ec = e; });
	await([&] {
		error_code ignored;
		transfer_port.close(ignored);
	});
	if (ec)
		throw system_error{ec, "data connection"};
	return transfer_port;
}

std::vector<std::string> connection::transfer(const std::string &command) {
	if (!ascii_) {
		expect(2, ask("TYPE A"));
		ascii_ = true;
	}
	auto transfer_port = connect_transfer();
	expect(1, ask(command));

	boost::asio::streambuf data;
	error_code ec;
	boost::asio::async_read(transfer_port, data,
	                        [&](const error_code &e, size_t) { ec = e; });
	await([&] {
		error_code ignored;
		transfer_port.close(ignored);
	});
	if (ec && ec != boost::asio::error::eof)
		throw system_error{ec, "data transfer"};
	transfer_port.close(ec);
	expect(2, read_answer());

	std::vector<std::string> result;
	std::istream is{&data};
	std::string line;
	while (std::getline(is, line)) {
		if (!line.empty() && line.back() == '\r')
			line.pop_back();
		if (!line.empty())
			result.push_back(std::move(line));
	}
	return result;
}

outcome<std::string> connection::print_directory() {
	return guarded<std::string>(
	    [this] { return parse_directory_reply(expect(2, ask("PWD"))); });
}
outcome<done> connection::change_directory(const std::string &path) {
	return guarded<done>([&] {
		if (path == "..")
			expect(2, ask("CDUP"));
		else
			expect(2, ask("CWD " + (path.empty() ? std::string{"."} : path)));
		return done{};
	});
}
outcome<std::vector<std::string>> connection::names() {
	return guarded<std::vector<std::string>>([this] { return transfer("NLST"); });
}
outcome<std::vector<std::string>> connection::lines() {
	return guarded<std::vector<std::string>>([this] { return transfer("LIST"); });
}
void connection::close() {
	error_code ignored;
	control_port_.close(ignored);
}
