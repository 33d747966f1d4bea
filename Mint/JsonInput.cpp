#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Jsmn/Object.hpp"
#include"Mint/JsonInput.hpp"
#include"Mint/Msg/JsonCin.hpp"
#include"Mint/log.hpp"
#include"S/Bus.hpp"
#include<memory>

namespace {

struct Read {
	bool eof;
	Jsmn::Object obj;
};

}

namespace Mint {

class JsonInput::Impl {
private:
	Ev::ThreadPool& threadpool;
	std::istream& cin;
	S::Bus& bus;
	unsigned long count;

	/* Runs on a pool thread.  */
	Read read_one() {
		auto rv = Read{true, Jsmn::Object()};
		cin >> std::ws;
		if (!cin || cin.peek() == std::char_traits<char>::eof())
			return rv;
		cin >> rv.obj;
		rv.eof = false;
		return rv;
	}

public:
	Impl( Ev::ThreadPool& threadpool_
	    , std::istream& cin_
	    , S::Bus& bus_
	    ) : threadpool(threadpool_)
	      , cin(cin_)
	      , bus(bus_)
	      , count(0)
	      { }

	Ev::Io<void> run() {
		return threadpool.background<Read>([this]() {
			return read_one();
		}).then([this](Read r) {
			if (r.eof)
				return Mint::log( bus, Debug
						, "JsonInput: stdin closed after "
						  "%lu messages."
						, count
						);
			++count;
			return bus.raise(Mint::Msg::JsonCin{std::move(r.obj)})
			     + run()
			     ;
		});
	}
};

JsonInput::JsonInput( Ev::ThreadPool& threadpool
		    , std::istream& cin
		    , S::Bus& bus
		    ) : pimpl(std::make_unique<Impl>(threadpool, cin, bus)) { }
JsonInput::JsonInput(JsonInput&& o) : pimpl(std::move(o.pimpl)) { }
JsonInput::~JsonInput() { }

Ev::Io<void> JsonInput::run() {
	return pimpl->run();
}

}
