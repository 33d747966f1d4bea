#include"Json/Out.hpp"
#include"Mint/MeltQuote.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Mint {

std::string melt_quote_state_name(MeltQuoteState s) {
	switch (s) {
	case MeltQuoteState_Unpaid: return "UNPAID";
	case MeltQuoteState_Pending: return "PENDING";
	case MeltQuoteState_Paid: return "PAID";
	}
	return "UNPAID";
}
MeltQuoteState melt_quote_state_from_name(std::string const& s) {
	if (s == "UNPAID")
		return MeltQuoteState_Unpaid;
	if (s == "PENDING")
		return MeltQuoteState_Pending;
	if (s == "PAID")
		return MeltQuoteState_Paid;
	throw Util::BacktraceException<std::invalid_argument>(
		"Unknown melt quote state: " + s
	);
}

Json::Out MeltQuote::json() const {
	auto rv = Json::Out();
	auto obj = rv.start_object();
	obj
		.field("quote", id)
		.field("amount", amount)
		.field("fee_reserve", fee_reserve)
		.field("state", melt_quote_state_name(state))
		.field("expiry", std::uint64_t(expiry))
		;
	if (preimage)
		obj.field("payment_preimage", std::string(preimage));
	else
		obj.field("payment_preimage", nullptr);
	auto arr = obj.start_array("change");
	for (auto const& c : change)
		arr.entry(c.json());
	arr.end_array();
	obj
		.field("unit", unit)
		.field("request", request)
		;
	obj.end_object();
	return rv;
}

}
