#ifndef CASHU_PROOF_HPP
#define CASHU_PROOF_HPP

#include"Secp256k1/PubKey.hpp"
#include<cstdint>
#include<string>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Cashu {

/** struct Cashu::Proof
 *
 * @brief an unblinded token: the mint's
 * signature `C` on `hash_to_curve(secret)`.
 */
struct Proof {
	std::uint64_t amount;
	std::string id;
	std::string secret;
	Secp256k1::PubKey C;

	/** Cashu::Proof::Y
	 *
	 * @brief the fingerprint under which the
	 * mint tracks this proof, as compressed hex.
	 */
	std::string Y() const;

	static
	Proof object(Jsmn::Object const&);
	Json::Out json() const;
};

/** Cashu::secret_to_Y
 *
 * @brief the fingerprint of a secret.
 */
std::string secret_to_Y(std::string const& secret);

}

#endif /* !defined(CASHU_PROOF_HPP) */
