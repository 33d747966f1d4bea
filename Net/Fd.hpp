#ifndef NET_FD_HPP
#define NET_FD_HPP

#include<utility>

namespace Net {

/** class Net::Fd
 *
 * @brief owns a file descriptor and closes it on
 * destruction.
 *
 * @desc Move-only.
 * For the local sockets the plugin talks over:
 * the lightningd RPC socket and, in tests, socket
 * pairs standing in for lightningd.
 */
class Fd {
private:
	int fd;

public:
	Fd() : fd(-1) { }
	explicit Fd(int fd_) : fd(fd_) { }
	Fd(Fd const&) =delete;
	Fd(Fd&& o) : fd(o.release()) { }
	Fd& operator=(Fd&& o) {
		reset(o.release());
		return *this;
	}
	~Fd();

	int get() const { return fd; }
	int release() {
		auto rv = fd;
		fd = -1;
		return rv;
	}
	void reset(int fd_ = -1);

	explicit operator bool() const { return fd >= 0; }
	bool operator!() const { return fd < 0; }

	/* Throws std::system_error.  */
	void set_nonblocking();

	/* A connected pair of Unix stream sockets.
	 * Throws std::system_error.  */
	static std::pair<Fd, Fd> socketpair();
};

}

#endif /* !defined(NET_FD_HPP) */
