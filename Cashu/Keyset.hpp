#ifndef CASHU_KEYSET_HPP
#define CASHU_KEYSET_HPP

#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include<cstdint>
#include<map>
#include<string>
#include<vector>

namespace Cashu { struct BlindedMessage; }
namespace Cashu { struct BlindedSignature; }
namespace Cashu { struct Proof; }
namespace Json { class Out; }
namespace Secp256k1 { class Random; }

namespace Cashu {

/** class Cashu::Keyset
 *
 * @brief one keypair per power-of-two
 * denomination of one unit, derived from the
 * mint seed at `m/0'/unit'/counter'/i'`.
 *
 * @desc The private keys never leave this
 * object; signing and verification are done
 * here.
 */
class Keyset {
private:
	std::string id;
	std::string unit;
	std::uint32_t counter;
	std::uint32_t max_order;
	std::map<std::uint64_t, Secp256k1::PrivKey> privkeys;
	std::map<std::uint64_t, Secp256k1::PubKey> pubkeys;

	Keyset() =default;

public:
	Keyset(Keyset const&) =default;
	Keyset(Keyset&&) =default;
	Keyset& operator=(Keyset const&) =default;
	Keyset& operator=(Keyset&&) =default;
	~Keyset() =default;

	/** Cashu::Keyset::derive
	 *
	 * @brief derives the keyset for the given unit
	 * and rotation counter.
	 * A pure function of its arguments.
	 */
	static
	Keyset derive( std::vector<std::uint8_t> const& seed
		     , std::string const& unit
		     , std::uint32_t counter
		     , std::uint32_t max_order
		     );

	/** Cashu::Keyset::compute_id
	 *
	 * @brief version-0 keyset ID: "00" followed by
	 * the first 14 hex digits of the SHA256 of the
	 * concatenated compressed public keys, ordered
	 * by amount.
	 */
	static
	std::string compute_id(std::map<std::uint64_t, Secp256k1::PubKey> const&);

	std::string const& get_id() const { return id; }
	std::string const& get_unit() const { return unit; }
	std::uint32_t get_counter() const { return counter; }
	std::uint32_t get_max_order() const { return max_order; }
	std::map<std::uint64_t, Secp256k1::PubKey> const&
	get_pubkeys() const { return pubkeys; }

	bool has_amount(std::uint64_t amount) const {
		return pubkeys.count(amount) != 0;
	}
	/* Throws std::out_of_range if there is no key for the amount.  */
	Secp256k1::PubKey const& pubkey(std::uint64_t amount) const;

	/** Cashu::Keyset::sign
	 *
	 * @brief computes `C_ = k * B_` with the key for
	 * the message amount and attaches a DLEQ proof.
	 * Throws std::out_of_range on an unknown amount.
	 */
	BlindedSignature sign( BlindedMessage const& msg
			     , Secp256k1::Random& random
			     ) const;

	/** Cashu::Keyset::verify
	 *
	 * @brief checks `C == k * hash_to_curve(secret)`.
	 * Throws std::out_of_range on an unknown amount.
	 */
	bool verify(Proof const& proof) const;

	/* {"1": "02...", "2": "03...", ...}  */
	Json::Out keys_json() const;
};

}

#endif /* !defined(CASHU_KEYSET_HPP) */
