#ifndef MINT_MSG_COMMANDFAIL_HPP
#define MINT_MSG_COMMANDFAIL_HPP

#include"Json/Out.hpp"
#include"Ln/CommandId.hpp"
#include<string>

namespace Mint { namespace Msg {

/** struct Mint::Msg::CommandFail
 *
 * @brief Emit in response to a `Mint::Msg::CommandRequest`,
 * to indicate that the command failed.
 * If multiple responses for the same ID are emitted, or
 * for a nonexistent ID, the extras/nonexistent are
 * silently ignored.
 */
struct CommandFail {
	Ln::CommandId id;
	int code;
	std::string message;
	Json::Out data;
};

}}

#endif /* !defined(MINT_MSG_COMMANDFAIL_HPP) */
