#include"Cashu/BlindedMessage.hpp"
#include"Cashu/BlindedSignature.hpp"
#include"Cashu/Derivation.hpp"
#include"Cashu/Dleq.hpp"
#include"Cashu/Keyset.hpp"
#include"Cashu/Proof.hpp"
#include"Cashu/hash_to_curve.hpp"
#include"Json/Out.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/BacktraceException.hpp"
#include<sstream>
#include<stdexcept>

namespace Cashu {

Keyset Keyset::derive( std::vector<std::uint8_t> const& seed
		     , std::string const& unit
		     , std::uint32_t counter
		     , std::uint32_t max_order
		     ) {
	if (max_order == 0 || max_order > 64)
		throw Util::BacktraceException<std::invalid_argument>(
			"Cashu::Keyset::derive: max_order must be 1..64"
		);

	auto base = Derivation::master(seed)
		.hardened(0)
		.hardened(unit_index(unit))
		.hardened(counter)
		;

	auto rv = Keyset();
	rv.unit = unit;
	rv.counter = counter;
	rv.max_order = max_order;
	for (auto i = std::uint32_t(0); i < max_order; ++i) {
		auto amount = std::uint64_t(1) << i;
		auto child = base.hardened(i);
		rv.privkeys.emplace(amount, child.get_key());
		rv.pubkeys.emplace(amount, Secp256k1::PubKey(child.get_key()));
	}
	rv.id = compute_id(rv.pubkeys);
	return rv;
}

std::string
Keyset::compute_id(std::map<std::uint64_t, Secp256k1::PubKey> const& keys) {
	auto hasher = Sha256::Hasher();
	for (auto const& k : keys) {
		std::uint8_t buf[33];
		k.second.to_buffer(buf);
		hasher.feed(buf, sizeof(buf));
	}
	auto hex = std::string(std::move(hasher).finalize());
	return "00" + hex.substr(0, 14);
}

Secp256k1::PubKey const& Keyset::pubkey(std::uint64_t amount) const {
	auto it = pubkeys.find(amount);
	if (it == pubkeys.end())
		throw Util::BacktraceException<std::out_of_range>(
			"Cashu::Keyset: no key for amount"
		);
	return it->second;
}

BlindedSignature Keyset::sign( BlindedMessage const& msg
			     , Secp256k1::Random& random
			     ) const {
	auto it = privkeys.find(msg.amount);
	if (it == privkeys.end())
		throw Util::BacktraceException<std::out_of_range>(
			"Cashu::Keyset: no key for amount"
		);
	auto const& k = it->second;
	auto C_ = msg.B_ * k;
	auto dleq = Dleq::prove(k, msg.B_, C_, random);
	return BlindedSignature{ msg.amount
			       , id
			       , std::move(C_)
			       , std::make_shared<Dleq>(std::move(dleq))
			       };
}

bool Keyset::verify(Proof const& proof) const {
	auto it = privkeys.find(proof.amount);
	if (it == privkeys.end())
		throw Util::BacktraceException<std::out_of_range>(
			"Cashu::Keyset: no key for amount"
		);
	return hash_to_curve(proof.secret) * it->second == proof.C;
}

Json::Out Keyset::keys_json() const {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	for (auto const& k : pubkeys) {
		auto os = std::ostringstream();
		os << k.first;
		obj.field(os.str(), std::string(k.second));
	}
	obj.end_object();
	return rv;
}

}
