#undef NDEBUG
#include"Cashu/split.hpp"
#include"Jsmn/Object.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>

namespace {

Jsmn::Object parse(std::string const& s) {
	auto is = std::istringstream(s);
	auto rv = Jsmn::Object();
	is >> rv;
	return rv;
}

bool rejects(std::string const& s) {
	try {
		Cashu::amount_from_json(parse(s));
	} catch (std::invalid_argument const&) {
		return true;
	}
	return false;
}

}

int main() {
	assert(Cashu::split(0).empty());
	assert((Cashu::split(1) == std::vector<std::uint64_t>{1}));
	assert((Cashu::split(13) == std::vector<std::uint64_t>{1, 4, 8}));
	assert((Cashu::split(64) == std::vector<std::uint64_t>{64}));

	auto big = Cashu::split(UINT64_MAX);
	assert(big.size() == 64);
	auto sum = std::uint64_t(0);
	for (auto a : big) {
		assert(Cashu::is_power_of_two(a));
		sum += a;
	}
	assert(sum == UINT64_MAX);

	assert(!Cashu::is_power_of_two(0));
	assert(Cashu::is_power_of_two(1));
	assert(!Cashu::is_power_of_two(3));
	assert(Cashu::is_power_of_two(std::uint64_t(1) << 63));

	assert(Cashu::amount_from_json(parse("0")) == 0);
	assert(Cashu::amount_from_json(parse("21")) == 21);
	assert(Cashu::amount_from_json(parse("18446744073709551615")) == UINT64_MAX);
	assert(rejects("18446744073709551616"));
	assert(rejects("-1"));
	assert(rejects("1.5"));
	assert(rejects("\"21\""));

	return 0;
}
