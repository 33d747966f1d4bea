#include"Cashu/hash_to_curve.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>

namespace {

auto const domain_separator = std::string("Secp256k1_HashToCurve_Cashu_");

}

namespace Cashu {

Secp256k1::PubKey hash_to_curve(void const* p, std::size_t len) {
	std::uint8_t msg_hash[32];
	Sha256::Hasher()
		.feed(domain_separator)
		.feed(p, len)
		.finalize().to_buffer(msg_hash);

	for (auto counter = std::uint32_t(0); counter < 0x10000; ++counter) {
		std::uint8_t candidate[33];
		candidate[0] = 0x02;
		Sha256::Hasher()
			.feed(msg_hash, sizeof(msg_hash))
			.feed_le32(counter)
			.finalize().to_buffer(&candidate[1]);
		try {
			return Secp256k1::PubKey::from_buffer(candidate);
		} catch (Secp256k1::InvalidPubKey const&) {
			/* Not on the curve, try the next counter.  */
		}
	}
	throw Util::BacktraceException<std::runtime_error>(
		"Cashu::hash_to_curve: no valid point found"
	);
}

Secp256k1::PubKey hash_to_curve(std::string const& msg) {
	return hash_to_curve(msg.data(), msg.size());
}

}
