#include"Mint/Error.hpp"
#include"Mint/units.hpp"

namespace {

void require(std::string const& unit) {
	if (!Mint::is_lightning_unit(unit))
		throw Mint::Failure( Mint::ErrorCode_UnsupportedUnit
				   , "unit " + unit
				   + " cannot be settled over Lightning"
				   );
}

}

namespace Mint {

bool is_lightning_unit(std::string const& unit) {
	return unit == "sat" || unit == "msat";
}

Ln::Amount to_msat(std::uint64_t amount, std::string const& unit) {
	require(unit);
	if (unit == "msat")
		return Ln::Amount::msat(amount);
	if (amount > std::uint64_t(-1) / 1000)
		throw Mint::Failure( ErrorCode_AmountOutOfLimit
				   , "amount too large"
				   );
	return Ln::Amount::sat(amount);
}

std::uint64_t from_msat(Ln::Amount amount, std::string const& unit) {
	require(unit);
	if (unit == "msat")
		return amount.to_msat();
	return amount.to_sat_ceil();
}

}
