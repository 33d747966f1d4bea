#include"Net/Fd.hpp"
#include<errno.h>
#include<fcntl.h>
#include<sys/socket.h>
#include<system_error>
#include<unistd.h>

namespace Net {

Fd::~Fd() {
	reset();
}

void Fd::reset(int fd_) {
	if (fd >= 0 && fd != fd_) {
		/* Nothing useful to do if close fails.  */
		auto saved = errno;
		close(fd);
		errno = saved;
	}
	fd = fd_;
}

void Fd::set_nonblocking() {
	auto flags = fcntl(fd, F_GETFL);
	if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
		throw std::system_error(errno, std::generic_category(), "fcntl");
}

std::pair<Fd, Fd> Fd::socketpair() {
	int fds[2];
	if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0)
		throw std::system_error(errno, std::generic_category(), "socketpair");
	return std::make_pair(Fd(fds[0]), Fd(fds[1]));
}

}
