#ifndef MINT_CONFIG_HPP
#define MINT_CONFIG_HPP

#include"Ln/Amount.hpp"
#include<cstdint>
#include<string>
#include<utility>
#include<vector>

namespace Mint {

/** struct Mint::Config
 *
 * @brief settings of the mint engine, filled
 * in from the `clmint-*` plugin options.
 */
struct Config {
	/* Hex; empty means generate once and keep in the db.  */
	std::string seed;
	std::vector<std::string> units;
	std::uint32_t max_order;

	/* Fee reserve is max(reserve_fee_min, fee_percent% of amount).  */
	double fee_percent;
	Ln::Amount reserve_fee_min;

	/* Seconds.  */
	double mint_quote_expiry;
	double melt_quote_expiry;
	/* How long a deactivated keyset can still be redeemed.
	 * 0 means forever.  */
	double keyset_retention;

	/* In units of the quote; 0 means no limit.  */
	std::uint64_t mint_min_amount;
	std::uint64_t mint_max_amount;
	std::uint64_t melt_min_amount;
	std::uint64_t melt_max_amount;

	/* "cln" or "fake".  */
	std::string backend;
	double poll_interval;
	double pay_timeout;

	/* Advertised by clmint-info.  */
	std::string name;
	std::string description;
	std::string description_long;
	std::vector<std::pair<std::string, std::string>> contact;
	std::string motd;

	Config() : units{"sat"}
		 , max_order(32)
		 , fee_percent(1.0)
		 , reserve_fee_min(Ln::Amount::sat(4))
		 , mint_quote_expiry(3600)
		 , melt_quote_expiry(1800)
		 , keyset_retention(0)
		 , mint_min_amount(0)
		 , mint_max_amount(0)
		 , melt_min_amount(0)
		 , melt_max_amount(0)
		 , backend("cln")
		 , poll_interval(30)
		 , pay_timeout(120)
		 , name("clmint")
		 { }
};

}

#endif /* !defined(MINT_CONFIG_HPP) */
