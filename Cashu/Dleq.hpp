#ifndef CASHU_DLEQ_HPP
#define CASHU_DLEQ_HPP

#include"Secp256k1/PrivKey.hpp"

namespace Jsmn { class Object; }
namespace Json { class Out; }
namespace Secp256k1 { class PubKey; }
namespace Secp256k1 { class Random; }

namespace Cashu {

/** struct Cashu::Dleq
 *
 * @brief proof that the signing key behind a
 * blind signature is the published key `A`,
 * i.e. that `log_G(A) == log_B_(C_)`.
 */
struct Dleq {
	Secp256k1::PrivKey e;
	Secp256k1::PrivKey s;

	/** Cashu::Dleq::prove
	 *
	 * @brief creates the proof for `C_ = a * B_`.
	 */
	static
	Dleq prove( Secp256k1::PrivKey const& a
		  , Secp256k1::PubKey const& B_
		  , Secp256k1::PubKey const& C_
		  , Secp256k1::Random& random
		  );

	bool verify( Secp256k1::PubKey const& A
		   , Secp256k1::PubKey const& B_
		   , Secp256k1::PubKey const& C_
		   ) const;

	static
	Dleq object(Jsmn::Object const&);
	Json::Out json() const;
};

}

#endif /* !defined(CASHU_DLEQ_HPP) */
