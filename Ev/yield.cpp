#include<Ev/Detail/idle_once.hpp>
#include<Ev/Io.hpp>
#include<Ev/yield.hpp>

namespace Ev {

Io<void> yield() {
	return Io<void>([]( std::function<void()> pass
			  , std::function<void(std::exception_ptr)>
			  ) {
		Detail::idle_once(std::move(pass));
	});
}

Io<void> yield(std::size_t num_yields) {
	if (num_yields == 0)
		return Ev::lift();
	return yield().then([num_yields]() {
		return yield(num_yields - 1);
	});
}

}
