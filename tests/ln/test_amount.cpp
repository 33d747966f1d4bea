#undef NDEBUG
#include"Jsmn/Object.hpp"
#include"Jsmn/Parser.hpp"
#include"Ln/Amount.hpp"
#include<assert.h>
#include<cstdint>
#include<sstream>
#include<stdexcept>

namespace {

Jsmn::Object parse(std::string const& text) {
	auto is = std::istringstream(text);
	auto rv = Jsmn::Object();
	is >> rv;
	return rv;
}

bool rejects(std::string const& json) {
	try {
		(void) Ln::Amount::object(parse(json));
	} catch (std::invalid_argument const&) {
		return true;
	}
	return false;
}

}

int main() {
	assert(Ln::Amount::msat(42) == Ln::Amount("42msat"));
	assert(Ln::Amount::sat(42) == Ln::Amount::msat(42000));
	assert(std::string(Ln::Amount::sat(547)) == "547000msat");

	/* Melt quotes round partial satoshi up.  */
	assert(Ln::Amount::msat(1001).to_sat() == 1);
	assert(Ln::Amount::msat(1001).to_sat_ceil() == 2);
	assert(Ln::Amount::msat(1000).to_sat_ceil() == 1);
	assert(Ln::Amount().to_sat_ceil() == 0);

	/* Routing fee from a pay result.  */
	{
		auto res = parse(R"JSON(
		{ "amount_msat": 100000000
		, "amount_sent_msat": 100000201
		}
		)JSON");
		auto fee = Ln::Amount::object(res["amount_sent_msat"])
			 - Ln::Amount::object(res["amount_msat"])
			 ;
		assert(fee == Ln::Amount::msat(201));
		assert(fee.to_sat_ceil() == 1);
	}
	/* Older lightningd wrote strings.  */
	assert(Ln::Amount::object(parse("\"2500000msat\"")) == Ln::Amount::sat(2500));
	/* Above 2^53, where a double would lose the last digit.  */
	assert( Ln::Amount::object(parse("9007199254740993"))
	     == Ln::Amount::msat(9007199254740993ULL)
	      );

	assert(rejects("-5"));
	assert(rejects("1.5"));
	assert(rejects("1e3"));
	assert(rejects("\"100sat\""));
	assert(rejects("\"msat\""));
	assert(rejects("\"99999999999999999999999msat\""));
	assert(rejects("null"));

	/* Differences floor at zero.  */
	assert(Ln::Amount::sat(1) - Ln::Amount::sat(2) == Ln::Amount());
	assert(Ln::Amount::sat(1) + Ln::Amount::msat(1) > Ln::Amount::sat(1));

	auto overflowed = false;
	try {
		(void) (Ln::Amount::msat(UINT64_MAX) + Ln::Amount::msat(1));
	} catch (std::overflow_error const&) {
		overflowed = true;
	}
	assert(overflowed);
	overflowed = false;
	try {
		(void) Ln::Amount::sat(UINT64_MAX / 1000 + 1);
	} catch (std::overflow_error const&) {
		overflowed = true;
	}
	assert(overflowed);

	{
		auto os = std::ostringstream();
		os << Ln::Amount::msat(7);
		assert(os.str() == "7msat");
	}

	return 0;
}
