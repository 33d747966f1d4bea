#include"Ev/Detail/idle_once.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include<iostream>
#include<memory>

namespace Ev {

Ev::Io<void> concurrent(Ev::Io<void> io) {
	auto pio = std::make_shared<Ev::Io<void>>(std::move(io));
	return Ev::Io<void>([pio]( std::function<void()> pass
				 , std::function<void(std::exception_ptr)>
				 ) {
		Detail::idle_once([pio]() {
			pio->run([]() { }, [](std::exception_ptr e) {
				std::cerr << "Ev::concurrent: greenthread died: "
					  << Detail::describe(e)
					  << std::endl
					  ;
			});
		});
		pass();
	});
}

}
