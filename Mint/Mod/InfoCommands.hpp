#ifndef MINT_MOD_INFOCOMMANDS_HPP
#define MINT_MOD_INFOCOMMANDS_HPP

#include"Mint/ModG/CommandTable.hpp"

namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::InfoCommands
 *
 * @brief provides `clmint-info`, `clmint-keysets`,
 * `clmint-keys` and `clmint-rotate`.
 */
class InfoCommands {
private:
	ModG::CommandTable table;

public:
	InfoCommands() =delete;
	explicit
	InfoCommands(S::Bus& bus);
};

}}

#endif /* !defined(MINT_MOD_INFOCOMMANDS_HPP) */
