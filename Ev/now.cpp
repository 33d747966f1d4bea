#include"Ev/now.hpp"
#include<ev.h>

namespace Ev {

double now() {
	return ev_now(EV_DEFAULT);
}

std::uint64_t now_seconds() {
	auto t = now();
	if (t < 0)
		return 0;
	return std::uint64_t(t);
}

}
