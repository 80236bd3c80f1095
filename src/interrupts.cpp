#include "interrupts.hpp"

#include <csignal>

using std::move;

interrupts::interrupts(std::function<void()> stop, std::function<void()> force)
    : stop_{move(stop)}, force_{move(force)}, context_{},
      signals_{context_, SIGINT, SIGTERM} {
	wait();
	thread_ = std::thread{[this] { context_.run(); }};
}

interrupts::~interrupts() {
	context_.stop();
	thread_.join();
}

void interrupts::wait() {
	signals_.async_wait([this](const boost::system::error_code &ec, int) {
		if (ec)
			return;
		if (stopping_) {
			force_();
		} else {
			stopping_ = true;
			stop_();
		}
		wait();
	});
}
