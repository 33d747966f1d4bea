#ifndef LN_AMOUNT_HPP
#define LN_AMOUNT_HPP

#include<cstdint>
#include<ostream>
#include<string>

namespace Jsmn { class Object; }

namespace Ln {

/** class Ln::Amount
 *
 * @brief an exact amount of millisatoshi, as used by
 * invoices and by lightningd's RPC.
 *
 * @desc Addition throws `std::overflow_error` rather
 * than wrap.
 * Subtraction floors at zero; lightningd reports a
 * routing fee as `amount_sent_msat - amount_msat`,
 * which is never negative on a sane node.
 */
class Amount {
private:
	std::uint64_t v;

	explicit Amount(std::uint64_t msat) : v(msat) { }

public:
	Amount() : v(0) { }

	/* "<digits>msat".  */
	explicit Amount(std::string const&);
	explicit operator std::string() const;

	/* A JSON number of millisatoshi, or a string as
	 * above (older lightningd).  */
	static Amount object(Jsmn::Object const&);

	static Amount msat(std::uint64_t v) {
		return Amount(v);
	}
	/* Throws std::overflow_error.  */
	static Amount sat(std::uint64_t v);

	std::uint64_t to_msat() const { return v; }
	std::uint64_t to_sat() const { return v / 1000; }
	std::uint64_t to_sat_ceil() const {
		return v / 1000 + ((v % 1000) ? 1 : 0);
	}

	Amount& operator+=(Amount const&);
	Amount operator+(Amount const& o) const {
		auto tmp = *this;
		return tmp += o;
	}
	Amount& operator-=(Amount const& o) {
		v = (o.v > v) ? 0 : v - o.v;
		return *this;
	}
	Amount operator-(Amount const& o) const {
		auto tmp = *this;
		return tmp -= o;
	}

	bool operator==(Amount const& o) const { return v == o.v; }
	bool operator!=(Amount const& o) const { return v != o.v; }
	bool operator<(Amount const& o) const { return v < o.v; }
	bool operator>(Amount const& o) const { return v > o.v; }
	bool operator<=(Amount const& o) const { return v <= o.v; }
	bool operator>=(Amount const& o) const { return v >= o.v; }
};

inline
std::ostream& operator<<(std::ostream& os, Amount const& a) {
	return os << std::string(a);
}

}

#endif /* !defined(LN_AMOUNT_HPP) */
