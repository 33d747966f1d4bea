#ifndef MINT_MSG_COMMANDREQUEST_HPP
#define MINT_MSG_COMMANDREQUEST_HPP

#include"Jsmn/Object.hpp"
#include"Ln/CommandId.hpp"
#include<cstdint>
#include<string>

namespace Mint { namespace Msg {

/** struct Mint::Msg::CommandRequest
 *
 * @brief emitted whenever a command or hook is
 * received on stdin.
 * Respond by Mint::Msg::CommandResponse.
 */
struct CommandRequest {
	std::string command;
	Jsmn::Object params;
	Ln::CommandId id;
};

}}

#endif /* !defined(MINT_MSG_COMMANDREQUEST_HPP) */
