#include"Cashu/Derivation.hpp"
#include"Sha256/Hasher.hpp"
#include<sodium/crypto_auth_hmacsha512.h>
#include<sodium/utils.h>
#include<string.h>

namespace {

auto const bip32_seed_key = std::string("Bitcoin seed");

void hmac_sha512( std::uint8_t out[64]
		, std::uint8_t const* key, std::size_t keylen
		, std::uint8_t const* msg, std::size_t msglen
		) {
	crypto_auth_hmacsha512_state st;
	crypto_auth_hmacsha512_init(&st, key, keylen);
	crypto_auth_hmacsha512_update(&st, msg, msglen);
	crypto_auth_hmacsha512_final(&st, out);
	sodium_memzero(&st, sizeof(st));
}

}

namespace Cashu {

Derivation::Derivation( Secp256k1::PrivKey key_
		      , std::uint8_t const chain_code_[32]
		      ) : key(std::move(key_)) {
	memcpy(chain_code, chain_code_, 32);
}
Derivation::Derivation(Derivation const& o) : key(o.key) {
	memcpy(chain_code, o.chain_code, 32);
}
Derivation::~Derivation() {
	sodium_memzero(chain_code, sizeof(chain_code));
}

Derivation Derivation::master(std::vector<std::uint8_t> const& seed) {
	std::uint8_t I[64];
	hmac_sha512( I
		   , reinterpret_cast<std::uint8_t const*>(bip32_seed_key.data())
		   , bip32_seed_key.size()
		   , seed.empty() ? nullptr : &seed[0], seed.size()
		   );
	/* Throws InvalidPrivKey for the astronomically unlikely
	 * out-of-range IL; BIP32 says the seed is then invalid.  */
	auto rv = Derivation(Secp256k1::PrivKey::from_buffer(I), &I[32]);
	sodium_memzero(I, sizeof(I));
	return rv;
}

Derivation Derivation::hardened(std::uint32_t index) const {
	index |= 0x80000000;

	std::uint8_t data[1 + 32 + 4];
	data[0] = 0x00;
	key.to_buffer(&data[1]);
	data[33] = std::uint8_t((index >> 24) & 0xFF);
	data[34] = std::uint8_t((index >> 16) & 0xFF);
	data[35] = std::uint8_t((index >> 8) & 0xFF);
	data[36] = std::uint8_t(index & 0xFF);

	std::uint8_t I[64];
	hmac_sha512(I, chain_code, sizeof(chain_code), data, sizeof(data));
	sodium_memzero(data, sizeof(data));

	auto child = Secp256k1::PrivKey::from_buffer(I) + key;
	auto rv = Derivation(std::move(child), &I[32]);
	sodium_memzero(I, sizeof(I));
	return rv;
}

std::uint32_t unit_index(std::string const& unit) {
	if (unit == "sat")
		return 0;
	if (unit == "msat")
		return 1;
	if (unit == "usd")
		return 2;
	if (unit == "eur")
		return 3;

	std::uint8_t h[32];
	Sha256::digest(unit).to_buffer(h);
	auto rv = (std::uint32_t(h[0]) << 24)
		| (std::uint32_t(h[1]) << 16)
		| (std::uint32_t(h[2]) << 8)
		| std::uint32_t(h[3])
		;
	return rv & 0x7FFFFFFF;
}

}
