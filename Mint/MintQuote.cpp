#include"Json/Out.hpp"
#include"Mint/MintQuote.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Mint {

std::string mint_quote_state_name(MintQuoteState s) {
	switch (s) {
	case MintQuoteState_Unpaid: return "UNPAID";
	case MintQuoteState_Paid: return "PAID";
	case MintQuoteState_Issued: return "ISSUED";
	}
	return "UNPAID";
}
MintQuoteState mint_quote_state_from_name(std::string const& s) {
	if (s == "UNPAID")
		return MintQuoteState_Unpaid;
	if (s == "PAID")
		return MintQuoteState_Paid;
	if (s == "ISSUED")
		return MintQuoteState_Issued;
	throw Util::BacktraceException<std::invalid_argument>(
		"Unknown mint quote state: " + s
	);
}

Json::Out MintQuote::json() const {
	return Json::Out()
		.start_object()
			.field("quote", id)
			.field("request", request)
			.field("state", mint_quote_state_name(state))
			.field("expiry", std::uint64_t(expiry))
			.field("amount", amount)
			.field("unit", unit)
		.end_object()
		;
}

}
