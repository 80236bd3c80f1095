#include "sources.hpp"

#include <QtCore/QFile>
#include <QtCore/QTextStream>
#include <QtCore/QXmlStreamReader>
#include <regex>

namespace {
std::optional<uint16_t> port_number(const std::string &digits) {
	if (digits.empty() || digits.size() > 5 ||
	    digits.find_first_not_of("0123456789") != std::string::npos)
		return std::nullopt;
	auto port = std::stoul(digits);
	if (port == 0 || port > 65535)
		return std::nullopt;
	return static_cast<uint16_t>(port);
}
} // namespace

std::optional<host_info> parse_host(const std::string &token,
                                    uint16_t default_port) {
	static const std::regex host_parser{
	    R"R((?:\[([0-9A-Fa-f:.]+)\]|([\w.-]+))(?::(\d+))?)R",
	    std::regex_constants::ECMAScript | std::regex_constants::optimize};
	std::smatch match;
	if (!std::regex_match(token, match, host_parser))
		return std::nullopt;
	host_info result{match[1].matched ? match[1].str() : match[2].str(),
	                 default_port};
	if (match[3].matched) {
		auto port = port_number(match[3]);
		if (!port)
			return std::nullopt;
		result.port = *port;
	}
	return result;
}

std::vector<host_info> hosts_from_file(const std::string &path,
                                       uint16_t default_port) {
	QFile file{QString::fromStdString(path)};
	if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
		throw source_error{"cannot open " + path + ": " +
		                   file.errorString().toStdString()};
	std::vector<host_info> result;
	QTextStream in{&file};
	while (!in.atEnd()) {
		auto line = in.readLine().trimmed();
		if (line.isEmpty())
			continue;
		if (auto host = parse_host(line.toStdString(), default_port))
			result.push_back(*host);
	}
	return result;
}

std::vector<host_info> hosts_from_nmap(const std::string &path) {
	QFile file{QString::fromStdString(path)};
	if (!file.open(QIODevice::ReadOnly))
		throw source_error{"cannot open " + path + ": " +
		                   file.errorString().toStdString()};
	std::vector<host_info> result;
	QXmlStreamReader xml{&file};
	std::string address;
	bool in_port = false;
	std::optional<uint16_t> port;
	QString state, service;
	while (!xml.atEnd()) {
		xml.readNext();
		if (xml.isStartElement()) {
			auto name = xml.name();
			auto attributes = xml.attributes();
			if (name == QLatin1String("host")) {
				address.clear();
			} else if (name == QLatin1String("address") && address.empty()) {
				address = attributes.value(QLatin1String("addr")).toString().toStdString();
			} else if (name == QLatin1String("port")) {
				in_port = true;
				port = port_number(
				    attributes.value(QLatin1String("portid")).toString().toStdString());
				state.clear();
				service.clear();
			} else if (in_port && name == QLatin1String("state")) {
				state = attributes.value(QLatin1String("state")).toString();
			} else if (in_port && name == QLatin1String("service")) {
				service = attributes.value(QLatin1String("name")).toString();
			}
		} else if (xml.isEndElement() && xml.name() == QLatin1String("port")) {
			in_port = false;
			if (port && !address.empty() && state == QLatin1String("open") &&
			    service == QLatin1String("ftp"))
				result.push_back({address, *port});
		}
	}
	if (xml.hasError())
		throw source_error{path + ": " + xml.errorString().toStdString()};
	return result;
}
