#include"Cashu/BlindedMessage.hpp"
#include"Cashu/split.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Cashu {

BlindedMessage BlindedMessage::object(Jsmn::Object const& o) {
	if (!o.is_object() || !o.has("amount") || !o.has("id") || !o.has("B_"))
		throw Util::BacktraceException<std::invalid_argument>(
			"BlindedMessage needs amount, id and B_"
		);
	if (!o["id"].is_string() || !o["B_"].is_string())
		throw Jsmn::TypeError();
	return BlindedMessage{ amount_from_json(o["amount"])
			     , std::string(o["id"])
			     , Secp256k1::PubKey(std::string(o["B_"]))
			     };
}

Json::Out BlindedMessage::json() const {
	return Json::Out()
		.start_object()
			.field("amount", amount)
			.field("id", id)
			.field("B_", std::string(B_))
		.end_object()
		;
}

}
