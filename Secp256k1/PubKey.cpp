#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/G.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Util/Str.hpp"
#include<secp256k1.h>
#include<string.h>
#include<vector>

using Secp256k1::Detail::context;

namespace {

std::uint8_t const generator[33] = {
	0x02,
	0x79, 0xBE, 0x66, 0x7E, 0xF9, 0xDC, 0xBB, 0xAC,
	0x55, 0xA0, 0x62, 0x95, 0xCE, 0x87, 0x0B, 0x07,
	0x02, 0x9B, 0xFC, 0xDB, 0x2D, 0xCE, 0x28, 0xD9,
	0x59, 0xF2, 0x81, 0x5B, 0x16, 0xF8, 0x17, 0x98
};

secp256k1_pubkey load(std::uint8_t const data[33]) {
	auto pk = secp256k1_pubkey();
	if (!secp256k1_ec_pubkey_parse(context(), &pk, data, 33))
		throw Secp256k1::InvalidPubKey();
	return pk;
}
void store(std::uint8_t data[33], secp256k1_pubkey const& pk) {
	auto len = std::size_t(33);
	secp256k1_ec_pubkey_serialize( context(), data, &len, &pk
				     , SECP256K1_EC_COMPRESSED
				     );
}

}

namespace Secp256k1 {

PubKey const G;

PubKey::PubKey(Trusted, std::uint8_t const buffer[33]) {
	memcpy(data, buffer, sizeof(data));
}

PubKey::PubKey() {
	memcpy(data, generator, sizeof(data));
}

PubKey::PubKey(std::string const& s) {
	auto buf = std::vector<std::uint8_t>();
	try {
		buf = Util::Str::hexread(s);
	} catch (std::invalid_argument const&) {
		throw InvalidPubKey();
	}
	if (buf.size() != sizeof(data))
		throw InvalidPubKey();
	load(&buf[0]);
	memcpy(data, &buf[0], sizeof(data));
}

PubKey::PubKey(Secp256k1::PrivKey const& sk) {
	auto pk = secp256k1_pubkey();
	/* A PrivKey is always a valid scalar.  */
	secp256k1_ec_pubkey_create(context(), &pk, sk.key);
	store(data, pk);
}

PubKey PubKey::from_buffer(std::uint8_t const buffer[33]) {
	load(buffer);
	return PubKey(Trusted(), buffer);
}
void PubKey::to_buffer(std::uint8_t buffer[33]) const {
	memcpy(buffer, data, sizeof(data));
}

PubKey::operator std::string() const {
	return Util::Str::hexdump(data, sizeof(data));
}
std::string PubKey::to_uncompressed_hex() const {
	auto pk = load(data);
	std::uint8_t buf[65];
	auto len = sizeof(buf);
	secp256k1_ec_pubkey_serialize( context(), buf, &len, &pk
				     , SECP256K1_EC_UNCOMPRESSED
				     );
	return Util::Str::hexdump(buf, sizeof(buf));
}

PubKey PubKey::operator-() const {
	auto pk = load(data);
	secp256k1_ec_pubkey_negate(context(), &pk);
	auto rv = *this;
	store(rv.data, pk);
	return rv;
}
PubKey& PubKey::operator+=(PubKey const& o) {
	auto a = load(data);
	auto b = load(o.data);
	secp256k1_pubkey const* terms[2] = {&a, &b};
	auto sum = secp256k1_pubkey();
	if (!secp256k1_ec_pubkey_combine(context(), &sum, terms, 2))
		throw Util::BacktraceException<std::out_of_range>(
			"Secp256k1::PubKey: sum is the point at infinity"
		);
	store(data, sum);
	return *this;
}
PubKey& PubKey::operator*=(PrivKey const& sk) {
	auto pk = load(data);
	if (!secp256k1_ec_pubkey_tweak_mul(context(), &pk, sk.key))
		throw Util::BacktraceException<std::out_of_range>(
			"Secp256k1::PubKey: product out of range"
		);
	store(data, pk);
	return *this;
}

bool PubKey::operator==(PubKey const& o) const {
	return memcmp(data, o.data, sizeof(data)) == 0;
}
bool PubKey::operator<(PubKey const& o) const {
	return memcmp(data, o.data, sizeof(data)) < 0;
}

}

std::ostream& operator<<(std::ostream& os, Secp256k1::PubKey const& pk) {
	return os << std::string(pk);
}
