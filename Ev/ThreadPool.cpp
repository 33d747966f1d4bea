#include"Ev/ThreadPool.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<condition_variable>
#include<deque>
#include<ev.h>
#include<mutex>
#include<signal.h>
#include<stdexcept>
#include<thread>
#include<vector>

namespace {

/* Blocks every signal in this thread while alive,
 * so that threads started meanwhile inherit the
 * full mask.  */
class SignalMask {
private:
	sigset_t saved;

public:
	SignalMask(SignalMask const&) =delete;
	SignalMask() {
		sigset_t all;
		sigfillset(&all);
		pthread_sigmask(SIG_SETMASK, &all, &saved);
	}
	~SignalMask() {
		pthread_sigmask(SIG_SETMASK, &saved, nullptr);
	}
};

}

namespace Ev {

class ThreadPool::Impl {
private:
	/* Loop thread only.  */
	std::vector<std::thread> workers;
	std::size_t outstanding;
	ev_async wakeup;

	/* Guarded by mtx.  */
	std::mutex mtx;
	std::condition_variable has_work;
	bool stopping;
	std::deque<std::function<std::function<void()>()>> work;
	std::deque<std::function<void()>> done;

	void worker() {
		auto lock = std::unique_lock<std::mutex>(mtx);
		for (;;) {
			has_work.wait(lock, [this]() {
				return stopping || !work.empty();
			});
			if (stopping)
				return;
			auto w = std::move(work.front());
			work.pop_front();

			lock.unlock();
			auto k = w();
			w = nullptr;
			lock.lock();

			done.push_back(std::move(k));
			ev_async_send(EV_DEFAULT_ &wakeup);
		}
	}

	void on_wakeup() {
		auto ready = std::deque<std::function<void()>>();
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			ready.swap(done);
		}
		outstanding -= ready.size();
		/* An idle pool must not keep the loop alive.  */
		if (outstanding == 0)
			ev_async_stop(EV_DEFAULT_ &wakeup);
		for (auto& k : ready)
			k();
	}
	static
	void on_wakeup_static(EV_P_ ev_async* w, int) {
		static_cast<Impl*>(w->data)->on_wakeup();
	}

public:
	explicit
	Impl(std::size_t num_threads) : outstanding(0), stopping(false) {
		if (num_threads == 0)
			throw Util::BacktraceException<std::invalid_argument>(
				"Ev::ThreadPool: need at least one thread"
			);
		ev_async_init(&wakeup, &on_wakeup_static);
		wakeup.data = this;

		SignalMask mask;
		for (auto i = std::size_t(0); i < num_threads; ++i)
			workers.emplace_back([this]() { worker(); });
	}
	~Impl() {
		ev_async_stop(EV_DEFAULT_ &wakeup);
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			stopping = true;
		}
		has_work.notify_all();
		for (auto& t : workers)
			t.join();
	}

	void add(std::function<std::function<void()>()> w) {
		if (outstanding++ == 0)
			ev_async_start(EV_DEFAULT_ &wakeup);
		{
			auto lock = std::unique_lock<std::mutex>(mtx);
			work.push_back(std::move(w));
		}
		has_work.notify_one();
	}
};

ThreadPool::ThreadPool(std::size_t num_threads)
	: pimpl(std::make_unique<Impl>(num_threads)) { }
ThreadPool::~ThreadPool() { }

void ThreadPool::add(std::function<std::function<void()>()> w) {
	pimpl->add(std::move(w));
}

}
