#include"Secp256k1/Random.hpp"
#include"Util/BacktraceException.hpp"
#include<sodium/core.h>
#include<sodium/randombytes.h>
#include<stdexcept>

namespace Secp256k1 {

Random::Random() {
	/* Returns 1 if already initialized.  */
	if (sodium_init() < 0)
		throw Util::BacktraceException<std::runtime_error>(
			"Secp256k1::Random: libsodium failed to initialize"
		);
}

void Random::fill(void* p, std::size_t len) {
	randombytes_buf(p, len);
}
std::vector<std::uint8_t> Random::bytes(std::size_t len) {
	auto rv = std::vector<std::uint8_t>(len);
	if (len != 0)
		fill(&rv[0], len);
	return rv;
}

}
