#ifndef MINT_BLINDSIGNER_HPP
#define MINT_BLINDSIGNER_HPP

#include"Cashu/BlindedSignature.hpp"
#include<vector>

namespace Cashu { struct BlindedMessage; }
namespace Cashu { struct Proof; }
namespace Mint { class KeysetManager; }
namespace Secp256k1 { class Random; }

namespace Mint {

/** class Mint::BlindSigner
 *
 * @brief signs blinded messages with the active
 * keysets and checks unblinded proofs.
 *
 * @desc All failures are thrown as
 * `Mint::Failure`.
 */
class BlindSigner {
private:
	KeysetManager const& keysets;
	Secp256k1::Random& random;

public:
	BlindSigner() =delete;
	BlindSigner( KeysetManager const& keysets_
		   , Secp256k1::Random& random_
		   ) : keysets(keysets_), random(random_) { }

	/* Only active keysets sign.  */
	Cashu::BlindedSignature sign(Cashu::BlindedMessage const&);
	std::vector<Cashu::BlindedSignature>
	sign_all(std::vector<Cashu::BlindedMessage> const&);

	/* Signs with whichever keyset the message names,
	 * even if it has been retired since it was
	 * checked.  */
	Cashu::BlindedSignature
	sign_retained(Cashu::BlindedMessage const&);

	bool verify(Cashu::Proof const&);
	/* Throws `InvalidProof` on the first bad proof.  */
	void verify_all(std::vector<Cashu::Proof> const&);
};

}

#endif /* !defined(MINT_BLINDSIGNER_HPP) */
