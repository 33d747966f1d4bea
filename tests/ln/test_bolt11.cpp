#undef NDEBUG
#include"Ln/Amount.hpp"
#include"Ln/Bolt11.hpp"
#include"Ln/Preimage.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Sha256/Hash.hpp"
#include"Util/Bech32.hpp"
#include<assert.h>
#include<ctype.h>
#include<vector>

namespace {

bool rejects(std::string const& s) {
	try {
		Ln::Bolt11::decode(s);
	} catch (Ln::Bolt11DecodeError const&) {
		return true;
	}
	return false;
}

}

int main() {
	auto random = Secp256k1::Random();
	auto node_key = Secp256k1::PrivKey(random);
	auto preimage = Ln::Preimage(random);

	auto inv = Ln::Bolt11();
	inv.currency = "bcrt";
	inv.has_amount = true;
	inv.amount = Ln::Amount::sat(2500);
	inv.timestamp = 1700000000;
	inv.expiry = 600;
	inv.payment_hash = preimage.sha256();
	inv.description = "clmint: 2500 sat";

	auto s = inv.encode(node_key);
	/* 2500 sat is 25 micro-bitcoin.  */
	assert(s.substr(0, 10) == "lnbcrt25u1");

	auto back = Ln::Bolt11::decode(s);
	assert(back.currency == "bcrt");
	assert(back.has_amount);
	assert(back.amount == Ln::Amount::sat(2500));
	assert(back.timestamp == 1700000000);
	assert(back.expiry == 600);
	assert(back.expires_at() == 1700000600);
	assert(back.payment_hash == preimage.sha256());
	assert(back.description == "clmint: 2500 sat");
	assert(back.payee == Secp256k1::PubKey(node_key));

	/* Amountless, default expiry.  */
	inv.has_amount = false;
	inv.expiry = 3600;
	auto s2 = inv.encode(node_key);
	auto back2 = Ln::Bolt11::decode(s2);
	assert(!back2.has_amount);
	assert(back2.expiry == 3600);

	/* Odd msat amounts use pico-bitcoin.  */
	inv.has_amount = true;
	inv.amount = Ln::Amount::msat(1001);
	auto back3 = Ln::Bolt11::decode(inv.encode(node_key));
	assert(back3.amount == Ln::Amount::msat(1001));

	/* Upper case is accepted.  */
	auto upper = s;
	for (auto& c : upper)
		c = char(toupper(c));
	assert(Ln::Bolt11::decode(upper).payment_hash == preimage.sha256());

	assert(rejects(""));
	assert(rejects("lnbc1"));
	assert(rejects("not an invoice"));
	/* Checksum broken.  */
	auto broken = s;
	broken[broken.size() - 1] = broken[broken.size() - 1] == 'q' ? 'p' : 'q';
	assert(rejects(broken));
	/* Bech32 but not an invoice.  */
	assert(rejects("bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4"));
	/* Bytes outside ASCII.  */
	assert(rejects(s + "\xe9"));
	auto high = s;
	high[5] = '\xff';
	assert(rejects(high));

	/* Valid checksum over an altered invoice.  */
	auto hrp = std::string();
	auto words = std::vector<std::uint8_t>();
	assert(Util::Bech32::decode(hrp, words, s));
	{
		/* Recovery id out of range.  */
		auto w = words;
		w.back() = 31;
		assert(rejects(Util::Bech32::encode(hrp, w)));
	}
	{
		/* A changed timestamp no longer recovers the payee.  */
		auto w = words;
		w[0] ^= 1;
		auto t = Util::Bech32::encode(hrp, w);
		try {
			auto d = Ln::Bolt11::decode(t);
			assert(!(d.payee == Secp256k1::PubKey(node_key)));
		} catch (Ln::Bolt11DecodeError const&) { }
	}

	return 0;
}
