#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Mint/Main.hpp"
#include"Mint/open_rpc_socket.hpp"
#include"Net/Fd.hpp"
#include<iostream>
#include<memory>
#include<signal.h>

int main(int argc, char** argv) {
	/* lightningd closing the RPC socket under us must show
	 * up as a write error, not kill the mint mid-melt.  */
	signal(SIGPIPE, SIG_IGN);

	auto main = std::make_shared<Mint::Main>(
		std::vector<std::string>(argv, argv + argc),
		std::cin, std::cout, std::cerr,
		&Mint::open_rpc_socket
	);
	return Ev::start(main->run().then([main](int code) {
		return Ev::lift(code);
	}));
}
