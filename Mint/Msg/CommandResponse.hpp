#ifndef MINT_MSG_COMMANDRESPONSE_HPP
#define MINT_MSG_COMMANDRESPONSE_HPP

#include"Json/Out.hpp"
#include"Ln/CommandId.hpp"

namespace Mint { namespace Msg {

/** struct Mint::Msg::CommandResponse
 *
 * @brief Emit in response to a Mint::Msg::CommandRequest.
 * If multiple responses for the same ID are emitted, or
 * for a nonexistent ID, the extras/nonexistent are
 * silently ignored.
 */
struct CommandResponse {
	Ln::CommandId id;
	Json::Out response;
};

}}

#endif /* !defined(MINT_MSG_COMMANDRESPONSE_HPP) */
