#include"Ev/Detail/idle_once.hpp"
#include<ev.h>
#include<memory>
#include<typeinfo>

namespace {

struct Once {
	ev_idle idler;
	std::function<void()> f;
};

void on_idle(EV_P_ ev_idle* w, int) {
	auto once = std::unique_ptr<Once>(static_cast<Once*>(w->data));
	ev_idle_stop(EV_A_ &once->idler);
	auto f = std::move(once->f);
	once = nullptr;
	f();
}

}

namespace Ev { namespace Detail {

void idle_once(std::function<void()> f) {
	auto once = std::make_unique<Once>();
	once->f = std::move(f);
	ev_idle_init(&once->idler, &on_idle);
	once->idler.data = once.get();
	ev_idle_start(EV_DEFAULT_ &once.release()->idler);
}

std::string describe(std::exception_ptr e) {
	try {
		std::rethrow_exception(e);
	} catch (std::exception const& ex) {
		return std::string(typeid(ex).name()) + ": " + ex.what();
	} catch (...) {
		return "exception not derived from std::exception";
	}
}

}}
