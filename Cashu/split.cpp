#include"Cashu/split.hpp"
#include"Jsmn/Object.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Cashu {

std::vector<std::uint64_t> split(std::uint64_t amount) {
	auto rv = std::vector<std::uint64_t>();
	for (auto bit = 0; bit < 64; ++bit) {
		auto denom = std::uint64_t(1) << bit;
		if (amount & denom)
			rv.push_back(denom);
	}
	return rv;
}

std::uint64_t amount_from_json(Jsmn::Object const& o) {
	if (!o.is_number())
		throw Util::BacktraceException<std::invalid_argument>(
			"amount is not a number"
		);
	auto t = o.direct_text();
	auto len = t.size();
	if (len == 0 || len > 20)
		throw Util::BacktraceException<std::invalid_argument>(
			"amount out of range"
		);

	auto rv = std::uint64_t(0);
	for (auto i = std::size_t(0); i < len; ++i) {
		auto c = t[i];
		if (c < '0' || c > '9')
			throw Util::BacktraceException<std::invalid_argument>(
				"amount is not a non-negative integer"
			);
		auto digit = std::uint64_t(c - '0');
		if (rv > (UINT64_MAX - digit) / 10)
			throw Util::BacktraceException<std::invalid_argument>(
				"amount out of range"
			);
		rv = rv * 10 + digit;
	}
	return rv;
}

}
