#ifndef MINT_MOD_MELTCOMMANDS_HPP
#define MINT_MOD_MELTCOMMANDS_HPP

#include"Mint/ModG/CommandTable.hpp"

namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::MeltCommands
 *
 * @brief provides the melt path: `clmint-melt-quote`,
 * `clmint-melt-quote-check` and `clmint-melt`.
 *
 * @desc A melt keeps running after its caller
 * goes away; the payment is never abandoned
 * half-way.
 */
class MeltCommands {
private:
	ModG::CommandTable table;

public:
	MeltCommands() =delete;
	explicit
	MeltCommands(S::Bus& bus);
};

}}

#endif /* !defined(MINT_MOD_MELTCOMMANDS_HPP) */
