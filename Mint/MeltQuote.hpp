#ifndef MINT_MELTQUOTE_HPP
#define MINT_MELTQUOTE_HPP

#include"Cashu/BlindedMessage.hpp"
#include"Cashu/BlindedSignature.hpp"
#include"Ln/Preimage.hpp"
#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Json { class Out; }

namespace Mint {

enum MeltQuoteState {
	MeltQuoteState_Unpaid,
	MeltQuoteState_Pending,
	MeltQuoteState_Paid
};

/* "UNPAID", "PENDING", "PAID".  */
std::string melt_quote_state_name(MeltQuoteState);
/* Throws std::invalid_argument.  */
MeltQuoteState melt_quote_state_from_name(std::string const&);

/** struct Mint::MeltQuote
 *
 * @brief an offer to pay the invoice `request`
 * in exchange for proofs worth at least
 * `amount + fee_reserve`.
 */
struct MeltQuote {
	std::string id;
	std::string unit;
	std::uint64_t amount;
	std::uint64_t fee_reserve;
	std::string request;
	Sha256::Hash payment_hash;
	MeltQuoteState state;
	double expiry;
	double created;
	/* When the inputs were reserved, or 0 if never.  */
	double pending_since;

	/* Set once Paid.  */
	Ln::Preimage preimage;
	std::uint64_t fee_paid;

	/* Blank outputs for change, kept while the
	 * payment is in flight.  */
	std::vector<Cashu::BlindedMessage> outputs;
	std::vector<Cashu::BlindedSignature> change;

	/* {quote, amount, fee_reserve, state, expiry,
	 * payment_preimage, change, unit, request}  */
	Json::Out json() const;
};

}

#endif /* !defined(MINT_MELTQUOTE_HPP) */
