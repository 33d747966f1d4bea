#ifndef MINT_MSG_MANIFESTCOMMAND_HPP
#define MINT_MSG_MANIFESTCOMMAND_HPP

#include<string>

namespace Mint { namespace Msg {

/** struct Mint::Msg::ManifestCommand
 *
 * @brief emitted while handling a Mint::Msg::Manifestation
 * in order to register a command.
 */
struct ManifestCommand {
	std::string name;
	std::string usage;
	std::string description;
	bool deprecated;
};

}}

#endif /* !defined(MINT_MSG_MANIFESTCOMMAND_HPP) */
