#ifndef MINT_MOD_INITIATOR_HPP
#define MINT_MOD_INITIATOR_HPP

#include<functional>
#include<memory>
#include<string>

namespace Ev { class ThreadPool; }
namespace Net { class Fd; }
namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::Initiator
 *
 * @brief handles the `init` command: hands the
 * options out as `Mint::Msg::Option`, opens the
 * RPC socket and the database, then broadcasts
 * `Mint::Msg::Init`.
 *
 * @desc `init` is answered only after every
 * `Init` handler completes.
 * If one of them fails, the plugin asks
 * lightningd to disable it.
 */
class Initiator {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Initiator() =delete;

	Initiator( S::Bus& bus
		 , Ev::ThreadPool& threadpool
		 , std::function<Net::Fd( std::string const&
					, std::string const&
					)> open_rpc_socket
		 );
	Initiator(Initiator&&);
	~Initiator();
};

}}

#endif /* !defined(MINT_MOD_INITIATOR_HPP) */
