#ifndef MINT_MOD_COMMANDRECEIVER_HPP
#define MINT_MOD_COMMANDRECEIVER_HPP

#include"Ln/CommandId.hpp"
#include<set>

namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::CommandReceiver
 *
 * @brief turns JSON-RPC requests from lightningd
 * into `Msg::CommandRequest`, and the replies to
 * them back into JSON-RPC responses.
 *
 * @desc Only the first reply to a request is
 * sent.
 */
class CommandReceiver {
private:
	S::Bus& bus;

	std::set<Ln::CommandId> pendings;

public:
	explicit
	CommandReceiver(S::Bus& bus_);
};

}}

#endif /* !defined(MINT_MOD_COMMANDRECEIVER_HPP) */
