#ifndef CASHU_BLINDEDSIGNATURE_HPP
#define CASHU_BLINDEDSIGNATURE_HPP

#include"Cashu/Dleq.hpp"
#include"Secp256k1/PubKey.hpp"
#include<cstdint>
#include<memory>
#include<string>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Cashu {

/** struct Cashu::BlindedSignature
 *
 * @brief the mint's signature `C_` on a blinded
 * message, with its DLEQ proof.
 */
struct BlindedSignature {
	std::uint64_t amount;
	std::string id;
	Secp256k1::PubKey C_;
	/* Null only when loaded from a peer that omits it.  */
	std::shared_ptr<Dleq> dleq;

	static
	BlindedSignature object(Jsmn::Object const&);
	Json::Out json() const;
};

}

#endif /* !defined(CASHU_BLINDEDSIGNATURE_HPP) */
