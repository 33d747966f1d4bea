#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/now.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Mint/Mod/Waiter.hpp"
#include"Mint/Shutdown.hpp"
#include"Mint/concurrent.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<memory>
#include<stdexcept>
#include<string>

using Mint::Mod::Waiter;

namespace {

enum Outcome { Done, TimedOut, Stopped };

/* A slow call to the node, given up on after `timeout`.  */
Ev::Io<Outcome> call_node(Waiter& waiter, double delay, double timeout) {
	return waiter.timed(timeout, waiter.wait(delay).then([]() {
		return Ev::lift(Done);
	})).catching<Waiter::TimedOut>([](Waiter::TimedOut const&) {
		return Ev::lift(TimedOut);
	});
}

}

int main() {
	S::Bus bus;
	Waiter waiter(bus);

	auto stopped = std::make_shared<bool>(false);

	auto code = Ev::lift().then([&]() {
		return waiter.timed(60, Ev::lift(42));
	}).then([&](int i) {
		assert(i == 42);

		return call_node(waiter, 0.001, 60);
	}).then([&](Outcome o) {
		assert(o == Done);

		return call_node(waiter, 60, 0.001);
	}).then([&](Outcome o) {
		assert(o == TimedOut);

		/* A failing call reports its own error, not a
		 * timeout.  */
		return waiter.timed(60, Ev::lift().then([]() -> Ev::Io<int> {
			throw std::runtime_error("lightningd said no");
		})).then([](int) {
			assert(false);
			return Ev::lift(std::string());
		}).catching<std::runtime_error>([](std::runtime_error const& e) {
			return Ev::lift(std::string(e.what()));
		});
	}).then([&](std::string what) {
		assert(what == "lightningd said no");

		/* Many short calls in a row, each finishing first.  */
		auto act = Ev::lift();
		for (auto i = 0; i < 100; ++i)
			act += waiter.timed(60, Ev::yield());
		return act;
	}).then([&]() {
		/* A polling loop parked on the waiter.  */
		auto loop = waiter.wait(3600).then([]() {
			/* Never reached.  */
			assert(false);
			return Ev::lift();
		}).catching<Mint::Shutdown>([stopped](Mint::Shutdown const&) -> Ev::Io<void> {
			*stopped = true;
			throw Mint::Shutdown();
		});
		return Mint::concurrent(bus, "poller", loop);
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {
		assert(!*stopped);
		return bus.raise(Mint::Shutdown());
	}).then([&]() {
		return Ev::yield();
	}).then([&]() {
		assert(*stopped);

		/* Waiting after shutdown fails at once.  */
		return waiter.wait(60).then([]() {
			return Ev::lift(Done);
		}).catching<Mint::Shutdown>([](Mint::Shutdown const&) {
			return Ev::lift(Stopped);
		});
	}).then([](Outcome o) {
		assert(o == Stopped);
		return Ev::lift(0);
	});

	/* Finished calls disarm their 60-second deadlines;
	 * otherwise the loop would idle on until they
	 * expired.  */
	auto started = Ev::now();
	auto rv = Ev::start(code);
	assert(Ev::now() - started < 30);
	return rv;
}
