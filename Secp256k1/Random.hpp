#ifndef SECP256K1_RANDOM_HPP
#define SECP256K1_RANDOM_HPP

#include<cstddef>
#include<cstdint>
#include<vector>

namespace Secp256k1 {

/** class Secp256k1::Random
 *
 * @brief source of cryptographically secure random
 * bytes, for keys, blinding nonces and the mint seed.
 *
 * @desc Backed by the operating system through
 * libsodium.
 */
class Random {
public:
	Random();
	Random(Random const&) =delete;
	Random& operator=(Random const&) =delete;

	void fill(void* p, std::size_t len);
	std::vector<std::uint8_t> bytes(std::size_t len);
};

}

#endif /* SECP256K1_RANDOM_HPP */
