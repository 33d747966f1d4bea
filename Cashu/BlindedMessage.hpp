#ifndef CASHU_BLINDEDMESSAGE_HPP
#define CASHU_BLINDEDMESSAGE_HPP

#include"Secp256k1/PubKey.hpp"
#include<cstdint>
#include<string>

namespace Jsmn { class Object; }
namespace Json { class Out; }

namespace Cashu {

/** struct Cashu::BlindedMessage
 *
 * @brief a request to sign the blinded point
 * `B_` with the key for `amount` in keyset
 * `id`.
 */
struct BlindedMessage {
	std::uint64_t amount;
	std::string id;
	Secp256k1::PubKey B_;

	/* Throws std::invalid_argument on malformed input.  */
	static
	BlindedMessage object(Jsmn::Object const&);
	Json::Out json() const;
};

}

#endif /* !defined(CASHU_BLINDEDMESSAGE_HPP) */
