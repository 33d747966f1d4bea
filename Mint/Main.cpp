#include"Ev/Io.hpp"
#include"Ev/ThreadPool.hpp"
#include"Ev/yield.hpp"
#include"Mint/JsonInput.hpp"
#include"Mint/Main.hpp"
#include"Mint/Mod/all.hpp"
#include"Mint/Msg/Begin.hpp"
#include"Mint/Shutdown.hpp"
#include"Net/Fd.hpp"
#include"S/Bus.hpp"
#include<memory>

#ifdef HAVE_CONFIG_H
# include "config.h"
#endif

namespace Mint {

class Main::Impl {
private:
	std::istream& cin;
	std::ostream& cout;
	std::ostream& cerr;
	OpenRpcSocket open_rpc_socket;

	enum Mode { Plugin, Version, Help, BadArgument };
	Mode mode;
	std::string argv0;
	std::string bad_argument;

	/* Declared in construction order; destroyed in reverse,
	 * so modules go before the bus they subscribed to.  */
	std::unique_ptr<S::Bus> bus;
	std::unique_ptr<Ev::ThreadPool> threadpool;
	std::shared_ptr<void> modules;
	std::unique_ptr<Mint::JsonInput> jsoninput;

	int exit_code;

	void usage(std::ostream& os) const {
		os << "Usage: lightningd --plugin=" << argv0 << std::endl
		   << std::endl
		   << "Runs a Cashu ecash mint inside lightningd, backed by" << std::endl
		   << "the node's own channels. Wallets use the clmint-*" << std::endl
		   << "commands; the clmint-* options are listed by" << std::endl
		   << "`lightningd --help` once the plugin is loaded." << std::endl
		   << std::endl
		   << "  -V, --version   print the version and exit" << std::endl
		   << "  -h, --help      print this text and exit" << std::endl
		   << std::endl
		   << "Report bugs to " << PACKAGE_BUGREPORT << std::endl
		   ;
	}

	Ev::Io<int> run_plugin() {
		bus = std::make_unique<S::Bus>();
		threadpool = std::make_unique<Ev::ThreadPool>();
		modules = Mint::Mod::all( cout, *bus, *threadpool
					, open_rpc_socket
					);
		jsoninput = std::make_unique<Mint::JsonInput>(
			*threadpool, cin, *bus
		);

		return Ev::yield().then([this]() {
			return bus->raise(Mint::Msg::Begin());
		}).then([this]() {
			return jsoninput->run();
		}).catching<std::exception>([this](std::exception const& e) {
			cerr << argv0 << ": " << e.what() << std::endl;
			exit_code = 1;
			return Ev::lift();
		}).then([this]() {
			return bus->raise(Mint::Shutdown());
		}).then([this]() {
			return Ev::lift(exit_code);
		});
	}

public:
	Impl( std::vector<std::string> argv
	    , std::istream& cin_
	    , std::ostream& cout_
	    , std::ostream& cerr_
	    , OpenRpcSocket open_rpc_socket_
	    ) : cin(cin_)
	      , cout(cout_)
	      , cerr(cerr_)
	      , open_rpc_socket(std::move(open_rpc_socket_))
	      , mode(Plugin)
	      , argv0(argv.empty() ? PACKAGE_NAME : argv[0])
	      , exit_code(0)
	      {
		for (auto i = std::size_t(1); i < argv.size(); ++i) {
			auto const& arg = argv[i];
			if (arg == "--version" || arg == "-V")
				mode = Version;
			else if (arg == "--help" || arg == "-h" || arg == "-H")
				mode = Help;
			else {
				mode = BadArgument;
				bad_argument = arg;
				break;
			}
		}
	}

	Ev::Io<int> run() {
		switch (mode) {
		case Version:
			cout << PACKAGE_STRING << std::endl;
			return Ev::lift(0);
		case Help:
			usage(cout);
			return Ev::lift(0);
		case BadArgument:
			cerr << argv0 << ": unrecognized argument: "
			     << bad_argument << std::endl
			     << std::endl;
			usage(cerr);
			return Ev::lift(1);
		case Plugin:
			break;
		}
		return run_plugin();
	}
};

Main::Main( std::vector<std::string> argv
	  , std::istream& cin
	  , std::ostream& cout
	  , std::ostream& cerr
	  , OpenRpcSocket open_rpc_socket
	  ) : pimpl(std::make_unique<Impl>( std::move(argv)
					   , cin, cout, cerr
					   , std::move(open_rpc_socket)
					   ))
	    { }
Main::Main(Main&& o) : pimpl(std::move(o.pimpl)) { }
Main::~Main() { }

Ev::Io<int> Main::run() {
	return pimpl->run();
}

}
