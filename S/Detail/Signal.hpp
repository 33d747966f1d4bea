#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include<Ev/Io.hpp>
#include<Ev/yield.hpp>
#include<S/Detail/SignalBase.hpp>
#include<cstddef>
#include<functional>
#include<memory>
#include<vector>

namespace S { namespace Detail {

/* Subscribers of one message type.  */
template<typename a>
class Signal : public SignalBase {
private:
	typedef std::function<Ev::Io<void>(a const&)> Callback;
	std::vector<std::shared_ptr<Callback>> callbacks;

	/* Completes the raise once every subscriber has
	 * finished, failing with the first exception seen.  */
	struct Join {
		std::size_t remaining;
		std::exception_ptr exc;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;

		void finish(std::exception_ptr e) {
			if (e && !exc)
				exc = e;
			if (--remaining != 0)
				return;
			if (exc)
				fail(exc);
			else
				pass();
		}
	};

public:
	/* Subscribers added while a message is being
	 * raised do not see that message.  */
	void subscribe(Callback callback) {
		if (!callback)
			return;
		callbacks.push_back(std::make_shared<Callback>(std::move(callback)));
	}

	Ev::Io<void> raise(a value) {
		auto msg = std::make_shared<a const>(std::move(value));
		auto targets = callbacks;
		return Ev::yield().then([msg, targets]() {
			return Ev::Io<void>([ msg, targets
					    ]( std::function<void()> pass
					     , std::function<void(std::exception_ptr)> fail
					     ) {
				if (targets.empty())
					return pass();
				auto join = std::make_shared<Join>();
				join->remaining = targets.size();
				join->pass = std::move(pass);
				join->fail = std::move(fail);
				for (auto const& cb : targets) {
					auto act = Ev::yield().then([msg, cb]() {
						return (*cb)(*msg);
					});
					act.run([join]() {
						join->finish(nullptr);
					}, [join](std::exception_ptr e) {
						join->finish(e);
					});
				}
			});
		});
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
