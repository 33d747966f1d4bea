#include"Cashu/Proof.hpp"
#include"Cashu/hash_to_curve.hpp"
#include"Cashu/split.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Cashu {

std::string secret_to_Y(std::string const& secret) {
	return std::string(hash_to_curve(secret));
}

std::string Proof::Y() const {
	return secret_to_Y(secret);
}

Proof Proof::object(Jsmn::Object const& o) {
	if ( !o.is_object()
	  || !o.has("amount") || !o.has("id")
	  || !o.has("secret") || !o.has("C")
	   )
		throw Util::BacktraceException<std::invalid_argument>(
			"Proof needs amount, id, secret and C"
		);
	if ( !o["id"].is_string()
	  || !o["secret"].is_string()
	  || !o["C"].is_string()
	   )
		throw Jsmn::TypeError();
	auto secret = std::string(o["secret"]);
	if (secret.empty())
		throw Util::BacktraceException<std::invalid_argument>(
			"Proof secret is empty"
		);
	return Proof{ amount_from_json(o["amount"])
		    , std::string(o["id"])
		    , std::move(secret)
		    , Secp256k1::PubKey(std::string(o["C"]))
		    };
}

Json::Out Proof::json() const {
	return Json::Out()
		.start_object()
			.field("amount", amount)
			.field("id", id)
			.field("secret", secret)
			.field("C", std::string(C))
		.end_object()
		;
}

}
