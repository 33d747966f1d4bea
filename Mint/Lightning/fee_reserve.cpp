#include"Mint/Config.hpp"
#include"Mint/Lightning/fee_reserve.hpp"
#include<cmath>

namespace Mint { namespace Lightning {

Ln::Amount fee_reserve(Mint::Config const& config, Ln::Amount amount) {
	auto pct = Ln::Amount::msat(std::uint64_t(std::ceil(
		double(amount.to_msat()) * config.fee_percent / 100.0
	)));
	if (pct < config.reserve_fee_min)
		return config.reserve_fee_min;
	return pct;
}

}}
