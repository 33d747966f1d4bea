#include"Cashu/Dleq.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Random.hpp"
#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace {

/* e = SHA256(R1 || R2 || A || C_), each point as the hex
 * string of its uncompressed serialization.  */
Secp256k1::PrivKey
hash_e( Secp256k1::PubKey const& R1
      , Secp256k1::PubKey const& R2
      , Secp256k1::PubKey const& A
      , Secp256k1::PubKey const& C_
      ) {
	auto hasher = Sha256::Hasher();
	hasher.feed(R1.to_uncompressed_hex());
	hasher.feed(R2.to_uncompressed_hex());
	hasher.feed(A.to_uncompressed_hex());
	hasher.feed(C_.to_uncompressed_hex());
	std::uint8_t buf[32];
	std::move(hasher).finalize().to_buffer(buf);
	return Secp256k1::PrivKey::from_buffer(buf);
}

}

namespace Cashu {

Dleq Dleq::prove( Secp256k1::PrivKey const& a
		, Secp256k1::PubKey const& B_
		, Secp256k1::PubKey const& C_
		, Secp256k1::Random& random
		) {
	auto r = Secp256k1::PrivKey(random);
	auto R1 = Secp256k1::PubKey(r);
	auto R2 = B_ * r;
	auto A = Secp256k1::PubKey(a);
	auto e = hash_e(R1, R2, A, C_);
	auto s = r + e * a;
	return Dleq{std::move(e), std::move(s)};
}

bool Dleq::verify( Secp256k1::PubKey const& A
		 , Secp256k1::PubKey const& B_
		 , Secp256k1::PubKey const& C_
		 ) const {
	try {
		auto R1 = Secp256k1::PubKey(s) - A * e;
		auto R2 = B_ * s - C_ * e;
		return hash_e(R1, R2, A, C_) == e;
	} catch (std::out_of_range const&) {
		/* R1 or R2 at infinity: cannot be a valid proof.  */
		return false;
	}
}

Dleq Dleq::object(Jsmn::Object const& o) {
	if (!o.is_object() || !o.has("e") || !o.has("s"))
		throw Util::BacktraceException<std::invalid_argument>(
			"dleq needs e and s"
		);
	if (!o["e"].is_string() || !o["s"].is_string())
		throw Jsmn::TypeError();
	return Dleq{ Secp256k1::PrivKey(std::string(o["e"]))
		   , Secp256k1::PrivKey(std::string(o["s"]))
		   };
}

Json::Out Dleq::json() const {
	return Json::Out()
		.start_object()
			.field("e", std::string(e))
			.field("s", std::string(s))
		.end_object()
		;
}

}
