#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Jsmn/Object.hpp"
#include"Jsmn/ParseError.hpp"
#include"Mint/Main.hpp"
#include"Net/Fd.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>

namespace {

struct Run {
	int code;
	std::string out;
	std::string err;
};

Run run( std::vector<std::string> argv
       , std::string const& input = ""
       ) {
	auto cin = std::stringstream(input);
	auto cout = std::stringstream();
	auto cerr = std::stringstream();
	auto main = Mint::Main( std::move(argv), cin, cout, cerr
			      , [](std::string const&, std::string const&) {
		throw std::runtime_error("no lightningd here");
		return Net::Fd();
	});
	auto code = Ev::start(main.run());
	return Run{code, cout.str(), cerr.str()};
}

}

int main() {
	{
		auto r = run({"clmint", "--version"});
		assert(r.code == 0);
		assert(r.out.substr(0, 7) == "clmint ");
		assert(r.err.empty());
	}
	{
		auto r = run({"./clmint", "-h"});
		assert(r.code == 0);
		assert(r.out.find("--plugin=./clmint") != std::string::npos);
	}
	{
		auto r = run({"clmint", "--db=/tmp/x"});
		assert(r.code == 1);
		assert(r.out.empty());
		assert(r.err.find("unrecognized argument: --db=/tmp/x") != std::string::npos);
	}

	/* lightningd closing stdin at once is a clean exit.  */
	{
		auto r = run({"clmint"});
		assert(r.code == 0);
	}
	/* Garbage on stdin is not.  */
	{
		auto r = run({"clmint"}, "{\"id\": 1, \"method\": ?}\n");
		assert(r.code == 1);
		assert(!r.err.empty());
	}

	return 0;
}
