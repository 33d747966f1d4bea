#include<Ev/Detail/idle_once.hpp>
#include<Ev/Io.hpp>
#include<Ev/start.hpp>
#include<ev.h>
#include<iostream>

namespace Ev {

int start(Io<int> main) {
	if (!ev_default_loop(EVFLAG_AUTO)) {
		std::cerr << "Ev::start: libev failed to initialize" << std::endl;
		return 255;
	}

	auto exit_code = 255;
	Detail::idle_once([&exit_code, &main]() {
		main.run([&exit_code](int ec) {
			exit_code = ec;
		}, [&exit_code](std::exception_ptr e) {
			std::cerr << "Ev::start: unhandled: "
				  << Detail::describe(e)
				  << std::endl
				  ;
			exit_code = 254;
		});
	});

	if (ev_run(EV_DEFAULT_ 0))
		std::cerr << "Ev::start: watchers still active at exit"
			  << std::endl
			  ;
	return exit_code;
}

}
