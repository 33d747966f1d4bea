#ifndef MINT_MOD_MINTCOMMANDS_HPP
#define MINT_MOD_MINTCOMMANDS_HPP

#include"Mint/ModG/CommandTable.hpp"

namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::MintCommands
 *
 * @brief provides the mint path: `clmint-mint-quote`,
 * `clmint-mint-quote-check` and `clmint-mint`.
 */
class MintCommands {
private:
	ModG::CommandTable table;

public:
	MintCommands() =delete;
	explicit
	MintCommands(S::Bus& bus);
};

}}

#endif /* !defined(MINT_MOD_MINTCOMMANDS_HPP) */
