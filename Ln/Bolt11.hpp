#ifndef LN_BOLT11_HPP
#define LN_BOLT11_HPP

#include"Ln/Amount.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Secp256k1 { class PrivKey; }

namespace Ln {

/* Thrown by Ln::Bolt11::decode on malformed invoices.  */
class Bolt11DecodeError
		: public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	Bolt11DecodeError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(
			"Ln::Bolt11: " + msg
		  ) { }
};

/** struct Ln::Bolt11
 *
 * @brief the fields of a BOLT11 invoice that a
 * payee or payer needs.
 *
 * @desc `decode` recovers the payee from the
 * signature over the invoice, rejects high-S or
 * unrecoverable signatures, and checks it against
 * the `n` field when the invoice carries one.
 */
struct Bolt11 {
	/* "bc", "tb", "bcrt", "tbs" or "sb".  */
	std::string currency;
	bool has_amount;
	Ln::Amount amount;
	std::uint64_t timestamp;
	/* Seconds after timestamp.  */
	std::uint64_t expiry;
	Sha256::Hash payment_hash;
	std::string description;
	/* The node that signed the invoice.  */
	Secp256k1::PubKey payee;

	Bolt11() : currency("bc")
		 , has_amount(false)
		 , timestamp(0)
		 , expiry(3600)
		 { }

	static
	Bolt11 decode(std::string const& invoice);

	/** Ln::Bolt11::encode
	 *
	 * @brief serializes the invoice and signs it
	 * with the given node key.
	 */
	std::string encode(Secp256k1::PrivKey const& node_key) const;

	std::uint64_t expires_at() const { return timestamp + expiry; }
};

}

#endif /* !defined(LN_BOLT11_HPP) */
