#ifndef MINT_MOD_WAITER_HPP
#define MINT_MOD_WAITER_HPP

#include"Ev/Io.hpp"
#include<memory>

namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::Waiter
 *
 * @brief timers for the mint: polling intervals
 * and deadlines on calls to lightningd.
 *
 * @desc On `Mint::Shutdown` every pending wait
 * fails with `Mint::Shutdown`, as does every wait
 * begun afterwards.
 */
class Waiter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	explicit
	Waiter(S::Bus& bus);
	~Waiter();

	/* Completes after `seconds`.  */
	Ev::Io<void> wait(double seconds);

	/** Mint::Mod::Waiter::timed
	 *
	 * @brief runs `action`, failing with `TimedOut`
	 * if it has not completed within `timeout`
	 * seconds.
	 *
	 * @desc A timed-out action keeps running, since
	 * an `Ev::Io` cannot be cancelled, but its
	 * result is dropped.
	 * If the action finishes first, its deadline is
	 * disarmed at once.
	 */
	template<typename a>
	Ev::Io<a> timed(double timeout, Ev::Io<a> action);

	struct TimedOut { };

private:
	Ev::Io<void> timed_core(double timeout, Ev::Io<void> action);
};

template<typename a>
inline
Ev::Io<a> Waiter::timed(double timeout, Ev::Io<a> action) {
	auto result = std::make_shared<std::unique_ptr<a>>();
	auto store = std::move(action).then([result](a value) {
		*result = std::make_unique<a>(std::move(value));
		return Ev::lift();
	});
	return timed_core(timeout, std::move(store)).then([result]() {
		return Ev::lift(std::move(**result));
	});
}
template<>
inline
Ev::Io<void> Waiter::timed<void>(double timeout, Ev::Io<void> action) {
	return timed_core(timeout, std::move(action));
}

}}

#endif /* !defined(MINT_MOD_WAITER_HPP) */
