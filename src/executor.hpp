#ifndef EXECUTOR_HPP
#define EXECUTOR_HPP

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

template <typename Element> class completion_queue {
	std::mutex done_mutex_{};
	std::condition_variable ready_{};
	std::deque<Element> done_{};

public:
	using value_type = Element;
	void push(Element el) {
		{
			std::lock_guard lk{done_mutex_};
			done_.push_back(std::move(el));
		}
		ready_.notify_one();
	}
	Element pop() {
		std::unique_lock lk{done_mutex_};
		ready_.wait(lk, [this] { return !done_.empty(); });
		Element el = std::move(done_.front());
		done_.pop_front();
		return el;
	}
};

// Fixed set of worker threads. Results are handed back in the order the tasks
// finish, to whichever single thread calls next().
template <typename Result> class executor {
public:
	using result_type = Result;

	explicit executor(size_t threads) : completed_{}, pool_{threads} {}
	executor(const executor &) = delete;
	executor &operator=(const executor &) = delete;
	~executor() { pool_.join(); }

	// task must not throw
	template <typename Task> void submit(Task task) {
		++submitted_;
		boost::asio::post(pool_, [this, task = std::move(task)]() mutable {
			completed_.push(task());
		});
	}
	size_t pending() const { return submitted_ - drained_; }
	Result next() {
		++drained_;
		return completed_.pop();
	}

private:
	completion_queue<Result> completed_;
	// after completed_: workers are joined before the queue goes away
	boost::asio::thread_pool pool_;
	size_t submitted_ = 0;
	size_t drained_ = 0;
};

#endif /* end of include guard: EXECUTOR_HPP */
