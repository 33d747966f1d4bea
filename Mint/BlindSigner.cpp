#include"Cashu/BlindedMessage.hpp"
#include"Cashu/Proof.hpp"
#include"Mint/BlindSigner.hpp"
#include"Mint/Error.hpp"
#include"Mint/KeysetManager.hpp"
#include<sstream>

namespace {

std::string describe(std::string const& id, std::uint64_t amount) {
	auto os = std::ostringstream();
	os << "amount " << amount << " in keyset " << id;
	return os.str();
}

}

namespace Mint {

Cashu::BlindedSignature
BlindSigner::sign(Cashu::BlindedMessage const& msg) {
	/* Throws UnknownKeyset.  */
	keysets.get_by_id(msg.id);
	if (!keysets.is_active(msg.id))
		throw Mint::Failure( ErrorCode_InactiveKeyset
				   , "keyset " + msg.id
				   );
	return sign_retained(msg);
}

std::vector<Cashu::BlindedSignature>
BlindSigner::sign_all(std::vector<Cashu::BlindedMessage> const& msgs) {
	auto rv = std::vector<Cashu::BlindedSignature>();
	for (auto const& m : msgs)
		rv.push_back(sign(m));
	return rv;
}

Cashu::BlindedSignature
BlindSigner::sign_retained(Cashu::BlindedMessage const& msg) {
	auto const& ks = keysets.get_by_id(msg.id);
	if (!ks.has_amount(msg.amount))
		throw Mint::Failure( ErrorCode_UnknownDenomination
				   , describe(msg.id, msg.amount)
				   );
	return ks.sign(msg, random);
}

bool BlindSigner::verify(Cashu::Proof const& proof) {
	auto const& ks = keysets.get_for_verification(proof.id);
	if (!ks.has_amount(proof.amount))
		throw Mint::Failure( ErrorCode_UnknownDenomination
				   , describe(proof.id, proof.amount)
				   );
	return ks.verify(proof);
}

void BlindSigner::verify_all(std::vector<Cashu::Proof> const& proofs) {
	for (auto const& p : proofs)
		if (!verify(p))
			throw Mint::Failure( ErrorCode_InvalidProof
					   , "bad signature on "
					   + describe(p.id, p.amount)
					   );
}

}
