#undef NDEBUG
#include"Cashu/BlindedMessage.hpp"
#include"Cashu/BlindedSignature.hpp"
#include"Cashu/Derivation.hpp"
#include"Cashu/Keyset.hpp"
#include"Cashu/Proof.hpp"
#include"Cashu/hash_to_curve.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<stdexcept>

int main() {
	auto seed = Util::Str::hexread(
		"000102030405060708090a0b0c0d0e0f"
		"101112131415161718191a1b1c1d1e1f"
	);

	/* Derivation is a pure function.  */
	auto k1 = Cashu::Keyset::derive(seed, "sat", 0, 16);
	auto k2 = Cashu::Keyset::derive(seed, "sat", 0, 16);
	assert(k1.get_id() == k2.get_id());
	assert(k1.get_pubkeys() == k2.get_pubkeys());

	/* Version-0 ids: "00" and 14 hex digits.  */
	auto const& id = k1.get_id();
	assert(id.size() == 16);
	assert(id.substr(0, 2) == "00");
	assert(Util::Str::ishex(id));
	assert(Cashu::Keyset::compute_id(k1.get_pubkeys()) == id);

	assert(k1.get_pubkeys().size() == 16);
	for (auto i = 0; i < 16; ++i)
		assert(k1.has_amount(std::uint64_t(1) << i));
	assert(!k1.has_amount(3));
	assert(!k1.has_amount(std::uint64_t(1) << 16));
	try {
		k1.pubkey(3);
		assert(false);
	} catch (std::out_of_range const&) { }

	/* Counter, unit and seed all change the keys.  */
	auto k3 = Cashu::Keyset::derive(seed, "sat", 1, 16);
	auto k4 = Cashu::Keyset::derive(seed, "msat", 0, 16);
	auto other_seed = seed;
	other_seed[0] ^= 1;
	auto k5 = Cashu::Keyset::derive(other_seed, "sat", 0, 16);
	assert(k3.get_id() != id);
	assert(k4.get_id() != id);
	assert(k5.get_id() != id);
	assert(k1.pubkey(1) != k3.pubkey(1));

	/* Units map to distinct derivation indices.  */
	assert(Cashu::unit_index("sat") != Cashu::unit_index("msat"));
	assert(Cashu::unit_index("sat") == Cashu::unit_index("sat"));
	assert(Cashu::unit_index("sat") < 0x80000000);

	/* Sign and verify a blinded message.  */
	auto random = Secp256k1::Random();
	auto secret = std::string("a test secret");
	auto r = Secp256k1::PrivKey(random);
	auto B_ = Cashu::hash_to_curve(secret) + Secp256k1::PubKey(r);
	auto sig = k1.sign(Cashu::BlindedMessage{8, id, B_}, random);
	assert(sig.amount == 8);
	assert(sig.id == id);
	assert(sig.dleq);
	assert(sig.dleq->verify(k1.pubkey(8), B_, sig.C_));

	auto C = sig.C_ - r * k1.pubkey(8);
	assert(k1.verify(Cashu::Proof{8, id, secret, C}));
	/* Wrong amount, wrong secret, other keyset.  */
	assert(!k1.verify(Cashu::Proof{4, id, secret, C}));
	assert(!k1.verify(Cashu::Proof{8, id, secret + "x", C}));
	assert(!k3.verify(Cashu::Proof{8, k3.get_id(), secret, C}));

	return 0;
}
