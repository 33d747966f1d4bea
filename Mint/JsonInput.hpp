#ifndef MINT_JSONINPUT_HPP
#define MINT_JSONINPUT_HPP

#include<istream>
#include<memory>

namespace Ev { template<typename a> class Io; }
namespace Ev { class ThreadPool; }
namespace S { class Bus; }

namespace Mint {

/** class Mint::JsonInput
 *
 * @brief reads the JSON-RPC requests and notifications
 * lightningd writes to the plugin's stdin, and raises
 * a `Mint::Msg::JsonCin` for each.
 *
 * @desc Reading blocks, so it happens on the thread
 * pool, one datum at a time.
 * `run` completes when stdin reaches end-of-file,
 * which is how lightningd tells a plugin to exit.
 * A malformed datum fails `run` with
 * `Jsmn::ParseError`.
 */
class JsonInput {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	JsonInput( Ev::ThreadPool& threadpool
		 , std::istream& cin
		 , S::Bus& bus
		 );
	JsonInput(JsonInput&&);
	~JsonInput();

	Ev::Io<void> run();
};

}

#endif /* !defined(MINT_JSONINPUT_HPP) */
