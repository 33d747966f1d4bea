#ifndef MINT_UNITS_HPP
#define MINT_UNITS_HPP

#include"Ln/Amount.hpp"
#include<cstdint>
#include<string>

namespace Mint {

/* Units that settle over Lightning: "sat" and "msat".  */
bool is_lightning_unit(std::string const& unit);

/* These throw UnsupportedUnit for other units.  */
Ln::Amount to_msat(std::uint64_t amount, std::string const& unit);
/* Rounds up to a whole unit.  */
std::uint64_t from_msat(Ln::Amount amount, std::string const& unit);

}

#endif /* !defined(MINT_UNITS_HPP) */
