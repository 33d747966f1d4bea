#include"Mint/open_rpc_socket.hpp"
#include"Net/Fd.hpp"
#include<errno.h>
#include<string.h>
#include<sys/socket.h>
#include<sys/un.h>
#include<system_error>
#include<unistd.h>

namespace {

[[noreturn]]
void fail(std::string const& what) {
	throw std::system_error(errno, std::generic_category(), what);
}

}

namespace Mint {

Net::Fd open_rpc_socket( std::string const& lightning_dir
		       , std::string const& rpc_file
		       ) {
	auto path = (!rpc_file.empty() && rpc_file[0] == '/') ? rpc_file
		  : lightning_dir + "/" + rpc_file
		  ;

	auto addr = sockaddr_un();
	addr.sun_family = AF_UNIX;
	if (path.size() + 1 > sizeof(addr.sun_path)) {
		if (chdir(lightning_dir.c_str()) < 0)
			fail("chdir " + lightning_dir);
		path = rpc_file;
	}
	if (path.size() + 1 > sizeof(addr.sun_path)) {
		errno = ENAMETOOLONG;
		fail(path);
	}
	strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

	auto fd = Net::Fd(socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
	if (!fd)
		fail("socket");

	auto res = int();
	do {
		res = connect( fd.get()
			     , reinterpret_cast<sockaddr const*>(&addr)
			     , sizeof(addr)
			     );
	} while (res < 0 && errno == EINTR);
	if (res < 0)
		fail("connect " + path);

	return fd;
}

}
