#ifndef MINT_MOD_SWAPCOMMANDS_HPP
#define MINT_MOD_SWAPCOMMANDS_HPP

#include"Mint/ModG/CommandTable.hpp"

namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::SwapCommands
 *
 * @brief provides `clmint-swap` and
 * `clmint-checkstate`.
 */
class SwapCommands {
private:
	ModG::CommandTable table;

public:
	SwapCommands() =delete;
	explicit
	SwapCommands(S::Bus& bus);
};

}}

#endif /* !defined(MINT_MOD_SWAPCOMMANDS_HPP) */
