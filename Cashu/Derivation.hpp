#ifndef CASHU_DERIVATION_HPP
#define CASHU_DERIVATION_HPP

#include"Secp256k1/PrivKey.hpp"
#include<cstdint>
#include<string>
#include<vector>

namespace Cashu {

/** class Cashu::Derivation
 *
 * @brief a BIP32 extended private key,
 * supporting only hardened child derivation.
 *
 * @desc Mint keys never need public derivation,
 * so non-hardened children are not provided.
 */
class Derivation {
private:
	Secp256k1::PrivKey key;
	std::uint8_t chain_code[32];

	Derivation( Secp256k1::PrivKey key_
		  , std::uint8_t const chain_code_[32]
		  );

public:
	Derivation() =delete;
	Derivation(Derivation const&);
	~Derivation();

	/** Cashu::Derivation::master
	 *
	 * @brief derives the master key from the
	 * given seed bytes.
	 */
	static
	Derivation master(std::vector<std::uint8_t> const& seed);

	/** Cashu::Derivation::hardened
	 *
	 * @brief derives the hardened child at the
	 * given index (the hardening bit is added
	 * here, so pass the plain index).
	 */
	Derivation hardened(std::uint32_t index) const;

	Secp256k1::PrivKey const& get_key() const { return key; }
};

/** Cashu::unit_index
 *
 * @brief the derivation path component for a
 * unit: sat=0, msat=1, usd=2, eur=3, and for any
 * other unit the first four bytes of its SHA256,
 * big-endian, with the top bit cleared.
 */
std::uint32_t unit_index(std::string const& unit);

}

#endif /* !defined(CASHU_DERIVATION_HPP) */
