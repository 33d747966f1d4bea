#ifndef MINT_MINTQUOTE_HPP
#define MINT_MINTQUOTE_HPP

#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Json { class Out; }

namespace Mint {

enum MintQuoteState {
	MintQuoteState_Unpaid,
	MintQuoteState_Paid,
	MintQuoteState_Issued
};

/* "UNPAID", "PAID", "ISSUED".  */
std::string mint_quote_state_name(MintQuoteState);
/* Throws std::invalid_argument.  */
MintQuoteState mint_quote_state_from_name(std::string const&);

/** struct Mint::MintQuote
 *
 * @brief an offer to issue `amount` of `unit`
 * once the invoice `request` is paid.
 */
struct MintQuote {
	std::string id;
	std::string unit;
	std::uint64_t amount;
	std::string request;
	Sha256::Hash payment_hash;
	MintQuoteState state;
	/* Seconds from the epoch.  */
	double expiry;
	double created;

	/* {quote, request, state, expiry, amount, unit}  */
	Json::Out json() const;
};

}

#endif /* !defined(MINT_MINTQUOTE_HPP) */
