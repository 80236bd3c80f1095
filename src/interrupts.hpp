#ifndef INTERRUPTS_HPP
#define INTERRUPTS_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <functional>
#include <thread>

// Watches SIGINT and SIGTERM on a thread of its own for as long as it lives.
// The first signal calls stop, every later one calls force.
class interrupts {
public:
	interrupts(std::function<void()> stop, std::function<void()> force);
	interrupts(const interrupts &) = delete;
	interrupts &operator=(const interrupts &) = delete;
	~interrupts();

private:
	std::function<void()> stop_;
	std::function<void()> force_;
	boost::asio::io_context context_;
	boost::asio::signal_set signals_;
	bool stopping_ = false; // touched only on thread_
	std::thread thread_;

	void wait();
};

#endif /* end of include guard: INTERRUPTS_HPP */
