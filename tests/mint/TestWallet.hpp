#ifndef TESTS_MINT_TESTWALLET_HPP
#define TESTS_MINT_TESTWALLET_HPP

#include"Cashu/BlindedMessage.hpp"
#include"Cashu/BlindedSignature.hpp"
#include"Cashu/Keyset.hpp"
#include"Cashu/Proof.hpp"
#include"Cashu/hash_to_curve.hpp"
#include"Cashu/split.hpp"
#include"Secp256k1/G.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<cstdint>
#include<vector>

namespace TestWallet {

/* What the wallet remembers about an output it
 * asked the mint to sign.  */
struct Pending {
	std::string secret;
	Secp256k1::PrivKey r;
	Cashu::BlindedMessage msg;
};

class Wallet {
private:
	Secp256k1::Random random;

	std::string random_secret() {
		auto bytes = random.bytes(32);
		return Util::Str::hexdump(&bytes[0], bytes.size());
	}

public:
	Pending blind(std::uint64_t amount, std::string const& keyset_id) {
		auto secret = random_secret();
		auto r = Secp256k1::PrivKey(random);
		auto Y = Cashu::hash_to_curve(secret);
		auto B_ = Y + r * Secp256k1::G;
		return Pending{ secret, r
			      , Cashu::BlindedMessage{amount, keyset_id, B_}
			      };
	}

	/* One output per denomination of `amount`.  */
	std::vector<Pending> blind_amount( std::uint64_t amount
					 , std::string const& keyset_id
					 ) {
		auto rv = std::vector<Pending>();
		for (auto a : Cashu::split(amount))
			rv.push_back(blind(a, keyset_id));
		return rv;
	}

	/* Blank outputs for melt change; amounts are ignored
	 * by the mint.  */
	std::vector<Pending> blanks( std::size_t count
				   , std::string const& keyset_id
				   ) {
		auto rv = std::vector<Pending>();
		for (auto i = std::size_t(0); i < count; ++i)
			rv.push_back(blind(1, keyset_id));
		return rv;
	}

	static
	std::vector<Cashu::BlindedMessage>
	messages(std::vector<Pending> const& ps) {
		auto rv = std::vector<Cashu::BlindedMessage>();
		for (auto const& p : ps)
			rv.push_back(p.msg);
		return rv;
	}

	/* Checks the DLEQ proof and unblinds.  */
	static
	Cashu::Proof unblind( Pending const& p
			    , Cashu::BlindedSignature const& sig
			    , Cashu::Keyset const& keyset
			    ) {
		auto const& K = keyset.pubkey(sig.amount);
		assert(sig.id == keyset.get_id());
		assert(sig.dleq);
		assert(sig.dleq->verify(K, p.msg.B_, sig.C_));
		auto C = sig.C_ - p.r * K;
		return Cashu::Proof{sig.amount, sig.id, p.secret, C};
	}

	/* Unblinds each signature against the output of
	 * the same position.  */
	static
	std::vector<Cashu::Proof>
	unblind_all( std::vector<Pending> const& ps
		   , std::vector<Cashu::BlindedSignature> const& sigs
		   , Cashu::Keyset const& keyset
		   ) {
		assert(sigs.size() <= ps.size());
		auto rv = std::vector<Cashu::Proof>();
		for (auto i = std::size_t(0); i < sigs.size(); ++i)
			rv.push_back(unblind(ps[i], sigs[i], keyset));
		return rv;
	}

	static
	std::uint64_t total(std::vector<Cashu::Proof> const& proofs) {
		auto rv = std::uint64_t(0);
		for (auto const& p : proofs)
			rv += p.amount;
		return rv;
	}
};

}

#endif /* !defined(TESTS_MINT_TESTWALLET_HPP) */
