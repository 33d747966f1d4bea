#include"Cashu/BlindedSignature.hpp"
#include"Cashu/split.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Cashu {

BlindedSignature BlindedSignature::object(Jsmn::Object const& o) {
	if (!o.is_object() || !o.has("amount") || !o.has("id") || !o.has("C_"))
		throw Util::BacktraceException<std::invalid_argument>(
			"BlindedSignature needs amount, id and C_"
		);
	if (!o["id"].is_string() || !o["C_"].is_string())
		throw Jsmn::TypeError();
	auto rv = BlindedSignature{ amount_from_json(o["amount"])
				  , std::string(o["id"])
				  , Secp256k1::PubKey(std::string(o["C_"]))
				  , nullptr
				  };
	if (o.has("dleq") && !o["dleq"].is_null())
		rv.dleq = std::make_shared<Dleq>(Dleq::object(o["dleq"]));
	return rv;
}

Json::Out BlindedSignature::json() const {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj
		.field("amount", amount)
		.field("id", id)
		.field("C_", std::string(C_))
		;
	if (dleq)
		obj.field("dleq", dleq->json());
	obj.end_object();
	return rv;
}

}
