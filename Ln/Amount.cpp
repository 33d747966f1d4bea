#include"Jsmn/Object.hpp"
#include"Ln/Amount.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace {

/* Plain decimal digits only; no sign, exponent or
 * fraction.  */
bool parse_digits(std::string const& s, std::uint64_t& out) {
	if (s.empty() || s.size() > 20)
		return false;
	auto v = std::uint64_t(0);
	for (auto c : s) {
		if (c < '0' || c > '9')
			return false;
		auto d = std::uint64_t(c - '0');
		if (v > (UINT64_MAX - d) / 10)
			return false;
		v = v * 10 + d;
	}
	out = v;
	return true;
}

}

namespace Ln {

Amount::Amount(std::string const& s) : v(0) {
	auto const suffix = std::string("msat");
	if ( s.size() <= suffix.size()
	  || s.compare(s.size() - suffix.size(), suffix.size(), suffix) != 0
	  || !parse_digits(s.substr(0, s.size() - suffix.size()), v)
	   )
		throw Util::BacktraceException<std::invalid_argument>(
			"Ln::Amount: not an msat amount: " + s
		);
}
Amount::operator std::string() const {
	return std::to_string(v) + "msat";
}

Amount Amount::object(Jsmn::Object const& o) {
	if (o.is_string())
		return Amount(std::string(o));
	auto v = std::uint64_t();
	if (!o.is_number() || !parse_digits(o.direct_text(), v))
		throw Util::BacktraceException<std::invalid_argument>(
			"Ln::Amount: not an msat amount: " + o.direct_text()
		);
	return Amount(v);
}

Amount Amount::sat(std::uint64_t v) {
	if (v > UINT64_MAX / 1000)
		throw Util::BacktraceException<std::overflow_error>(
			"Ln::Amount: too many satoshi"
		);
	return Amount(v * 1000);
}

Amount& Amount::operator+=(Amount const& o) {
	if (v > UINT64_MAX - o.v)
		throw Util::BacktraceException<std::overflow_error>(
			"Ln::Amount: sum overflows"
		);
	v += o.v;
	return *this;
}

}
