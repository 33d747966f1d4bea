#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Util/Str.hpp"
#include<secp256k1.h>
#include<sodium/utils.h>
#include<string.h>
#include<vector>

using Secp256k1::Detail::context;

namespace Secp256k1 {

PrivKey::PrivKey() {
	memset(key, 0, sizeof(key));
	key[31] = 1;
}

PrivKey::PrivKey(std::string const& s) {
	auto buf = std::vector<std::uint8_t>();
	try {
		buf = Util::Str::hexread(s);
	} catch (std::invalid_argument const&) {
		throw InvalidPrivKey();
	}
	if (buf.size() != sizeof(key))
		throw InvalidPrivKey();
	if (!secp256k1_ec_seckey_verify(context(), &buf[0]))
		throw InvalidPrivKey();
	memcpy(key, &buf[0], sizeof(key));
	sodium_memzero(&buf[0], buf.size());
}

PrivKey::PrivKey(Secp256k1::Random& random) {
	do {
		random.fill(key, sizeof(key));
	} while (!secp256k1_ec_seckey_verify(context(), key));
}

PrivKey::PrivKey(PrivKey const& o) {
	memcpy(key, o.key, sizeof(key));
}
PrivKey& PrivKey::operator=(PrivKey const& o) {
	if (this != &o)
		memcpy(key, o.key, sizeof(key));
	return *this;
}
PrivKey::~PrivKey() {
	sodium_memzero(key, sizeof(key));
}

PrivKey PrivKey::from_buffer(std::uint8_t const buffer[32]) {
	if (!secp256k1_ec_seckey_verify(context(), buffer))
		throw InvalidPrivKey();
	auto rv = PrivKey();
	memcpy(rv.key, buffer, sizeof(rv.key));
	return rv;
}
void PrivKey::to_buffer(std::uint8_t buffer[32]) const {
	memcpy(buffer, key, sizeof(key));
}

PrivKey::operator std::string() const {
	return Util::Str::hexdump(key, sizeof(key));
}

PrivKey& PrivKey::negate() {
	/* Cannot fail on a verified key.  */
	secp256k1_ec_seckey_negate(context(), key);
	return *this;
}
PrivKey& PrivKey::operator+=(PrivKey const& o) {
	/* libsecp256k1 zeroes the key on failure, so work on
	 * a copy and leave *this intact.  */
	std::uint8_t tmp[32];
	memcpy(tmp, key, sizeof(tmp));
	auto res = secp256k1_ec_seckey_tweak_add(context(), tmp, o.key);
	if (res)
		memcpy(key, tmp, sizeof(key));
	sodium_memzero(tmp, sizeof(tmp));
	if (!res)
		throw Util::BacktraceException<std::out_of_range>(
			"Secp256k1::PrivKey: sum is zero"
		);
	return *this;
}
PrivKey& PrivKey::operator*=(PrivKey const& o) {
	std::uint8_t tmp[32];
	memcpy(tmp, key, sizeof(tmp));
	auto res = secp256k1_ec_seckey_tweak_mul(context(), tmp, o.key);
	if (res)
		memcpy(key, tmp, sizeof(key));
	sodium_memzero(tmp, sizeof(tmp));
	if (!res)
		throw Util::BacktraceException<std::out_of_range>(
			"Secp256k1::PrivKey: product is zero"
		);
	return *this;
}

bool PrivKey::operator==(PrivKey const& o) const {
	return sodium_memcmp(key, o.key, sizeof(key)) == 0;
}

}

std::ostream& operator<<(std::ostream& os, Secp256k1::PrivKey const& sk) {
	return os << std::string(sk);
}
