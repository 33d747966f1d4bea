#ifndef EV_THREADPOOL_HPP
#define EV_THREADPOOL_HPP

#include<cstddef>
#include<functional>
#include<memory>
#include"Ev/Io.hpp"

namespace Ev {

/** class Ev::ThreadPool
 *
 * @brief runs blocking calls (reading stdin,
 * connecting to the `lightningd` socket) off the
 * event loop thread.
 *
 * @desc `background(f)` calls `f` on a worker
 * thread and resumes the calling greenthread on the
 * loop thread with its result or exception.
 * Workers run with all signals blocked.
 * Destruction waits for running calls to return;
 * queued calls that never started are dropped.
 */
class ThreadPool {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	/* `work` runs on a worker and returns the
	 * continuation to run on the loop thread.  */
	void add(std::function<std::function<void()>()> work);

public:
	explicit
	ThreadPool(std::size_t num_threads = 4);
	~ThreadPool();
	ThreadPool(ThreadPool const&) =delete;
	ThreadPool(ThreadPool&&) =delete;

	template<typename a>
	Ev::Io<a> background(std::function<a()> func) {
		auto pfunc = std::make_shared<std::function<a()>>(std::move(func));
		return Ev::Io<a>([ pfunc
				 , this
				 ]( std::function<void(a)> pass
				  , std::function<void(std::exception_ptr)> fail
				  ) {
			add([pfunc, pass, fail]() -> std::function<void()> {
				auto res = std::shared_ptr<a>();
				try {
					res = std::make_shared<a>((*pfunc)());
				} catch (...) {
					/* Rethrown in the caller.  */
					auto e = std::current_exception();
					return [fail, e]() { fail(e); };
				}
				return [pass, res]() { pass(std::move(*res)); };
			});
		});
	}
};

}

#endif /* EV_THREADPOOL_HPP */
