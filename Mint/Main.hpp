#ifndef MINT_MAIN_HPP
#define MINT_MAIN_HPP

#include<functional>
#include<istream>
#include<memory>
#include<ostream>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Net { class Fd; }

namespace Mint {

/** class Mint::Main
 *
 * @brief the plugin process as a whole.
 *
 * @desc With no arguments, speaks the lightningd
 * plugin protocol over `cin` and `cout` until `cin`
 * closes, and yields the process exit code.
 * `--version` and `--help` print and exit instead.
 */
class Main {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	typedef std::function< Net::Fd( std::string const& lightning_dir
				      , std::string const& rpc_file
				      )
			     > OpenRpcSocket;

	Main() =delete;
	Main( std::vector<std::string> argv
	    , std::istream& cin
	    , std::ostream& cout
	    , std::ostream& cerr
	    , OpenRpcSocket open_rpc_socket
	    );
	Main(Main&&);
	~Main();

	Ev::Io<int> run();
};

}

#endif /* !defined(MINT_MAIN_HPP) */
