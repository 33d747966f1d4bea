#ifndef S_BUS_HPP
#define S_BUS_HPP

#include<S/Detail/Signal.hpp>
#include<memory>
#include<typeindex>
#include<typeinfo>

namespace S {

/** class S::Bus
 *
 * @brief typed broadcast channel connecting the
 * mint's modules.
 *
 * @desc Any movable type can be a message.
 * `raise` delivers a message to every subscriber of
 * exactly that type, each on its own greenthread,
 * and completes once all of them have completed.
 * If a subscriber throws, `raise` rethrows the first
 * such exception after the others finish.
 */
class Bus {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	Detail::SignalBase* find(std::type_index) const;
	Detail::SignalBase& add( std::type_index
			       , std::unique_ptr<Detail::SignalBase>
			       );

	template<typename a>
	Detail::Signal<a>& signal() {
		auto type = std::type_index(typeid(a));
		auto s = find(type);
		if (!s)
			s = &add(type, std::make_unique<Detail::Signal<a>>());
		return static_cast<Detail::Signal<a>&>(*s);
	}

public:
	Bus();
	Bus(Bus&&);
	~Bus();

	template<typename a>
	void subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		signal<a>().subscribe(std::move(cb));
	}
	template<typename a>
	Ev::Io<void> raise(a value) {
		return signal<a>().raise(std::move(value));
	}
};

}

#endif /* !defined(S_BUS_HPP) */
