#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Mint/Mod/Waiter.hpp"
#include"Mint/Shutdown.hpp"
#include"S/Bus.hpp"
#include<memory>
#include<cstdint>
#include<ev.h>
#include<map>

namespace Mint { namespace Mod {

class Waiter::Impl {
private:
	struct Timer {
		ev_timer w;
		Impl* self;
		std::uint64_t id;
		std::function<void()> on_fire;
		std::function<void()> on_shutdown;
	};
	std::map<std::uint64_t, std::unique_ptr<Timer>> timers;
	std::uint64_t next_id;
	bool shutting_down;

	static
	void on_timer(EV_P_ ev_timer* w, int) {
		auto t = static_cast<Timer*>(w->data);
		ev_timer_stop(EV_A_ w);
		auto self = t->self;
		auto it = self->timers.find(t->id);
		auto owned = std::move(it->second);
		self->timers.erase(it);
		owned->on_fire();
	}

	void shutdown() {
		shutting_down = true;
		auto doomed = std::move(timers);
		timers.clear();
		for (auto& e : doomed) {
			ev_timer_stop(EV_DEFAULT_ &e.second->w);
			e.second->on_shutdown();
		}
	}

	static
	void fail_with_shutdown(std::function<void(std::exception_ptr)> const& fail) {
		fail(std::make_exception_ptr(Mint::Shutdown()));
	}

	/* Calls exactly one of the two after `seconds`, or
	 * at shutdown.  */
	std::uint64_t arm( double seconds
			 , std::function<void()> on_fire
			 , std::function<void()> on_shutdown
			 ) {
		auto id = next_id++;
		auto t = std::make_unique<Timer>();
		ev_timer_init(&t->w, &on_timer, seconds, 0);
		t->w.data = t.get();
		t->self = this;
		t->id = id;
		t->on_fire = std::move(on_fire);
		t->on_shutdown = std::move(on_shutdown);
		ev_timer_start(EV_DEFAULT_ &t->w);
		timers[id] = std::move(t);
		return id;
	}
	void disarm(std::uint64_t id) {
		auto it = timers.find(id);
		if (it == timers.end())
			return;
		ev_timer_stop(EV_DEFAULT_ &it->second->w);
		timers.erase(it);
	}

public:
	explicit
	Impl(S::Bus& bus) : next_id(0), shutting_down(false) {
		bus.subscribe<Mint::Shutdown>([this](Mint::Shutdown const&) {
			shutdown();
			return Ev::lift();
		});
	}
	~Impl() {
		for (auto& e : timers)
			ev_timer_stop(EV_DEFAULT_ &e.second->w);
	}

	Ev::Io<void> wait(double seconds) {
		return Ev::Io<void>([this, seconds
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (shutting_down)
				return fail_with_shutdown(fail);
			arm( seconds
			   , std::move(pass)
			   , [fail]() { fail_with_shutdown(fail); }
			   );
		});
	}

	Ev::Io<void> timed_core(double timeout, Ev::Io<void> action) {
		struct Race {
			bool over;
			std::uint64_t deadline;
			std::function<void()> pass;
			std::function<void(std::exception_ptr)> fail;
		};
		auto paction = std::make_shared<Ev::Io<void>>(std::move(action));
		return Ev::Io<void>([this, timeout, paction
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (shutting_down)
				return fail_with_shutdown(fail);

			auto race = std::make_shared<Race>(Race{
				false, 0, std::move(pass), std::move(fail)
			});
			auto lose = [race](std::exception_ptr e) {
				if (race->over)
					return;
				race->over = true;
				auto fail = std::move(race->fail);
				race->pass = nullptr;
				fail(e);
			};
			race->deadline = arm( timeout
					    , [lose]() {
				lose(std::make_exception_ptr(TimedOut()));
			}, [lose]() {
				lose(std::make_exception_ptr(Mint::Shutdown()));
			});
			paction->run([this, race]() {
				if (race->over)
					return;
				race->over = true;
				disarm(race->deadline);
				auto pass = std::move(race->pass);
				race->fail = nullptr;
				pass();
			}, [this, race, lose](std::exception_ptr e) {
				if (!race->over)
					disarm(race->deadline);
				lose(e);
			});
		}).then([]() {
			/* Unwind the stack of a synchronous action.  */
			return Ev::yield();
		});
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(std::make_unique<Impl>(bus)) { }
Waiter::~Waiter() { }

Ev::Io<void> Waiter::wait(double seconds) {
	return pimpl->wait(seconds);
}
Ev::Io<void> Waiter::timed_core(double timeout, Ev::Io<void> action) {
	return pimpl->timed_core(timeout, std::move(action));
}

}}
