#ifndef UUID_HPP
#define UUID_HPP

#include<cstdint>
#include<ostream>
#include<string>

/** class Uuid
 *
 * @brief an RFC 4122 version 4 (random) UUID.
 *
 * @desc Names mint and melt quotes and labels the
 * invoices the mint creates.
 * The text form is the canonical lowercase
 * `8-4-4-4-12` hex grouping; parsing also accepts
 * uppercase digits.
 */
class Uuid {
private:
	std::uint8_t data[16];

public:
	/* The nil UUID.  */
	Uuid();
	/* Throws std::invalid_argument.  */
	explicit Uuid(std::string const&);

	static Uuid random();

	explicit operator std::string() const;

	bool operator==(Uuid const&) const;
	bool operator!=(Uuid const& o) const {
		return !(*this == o);
	}
	bool operator<(Uuid const&) const;
};

inline
std::ostream& operator<<(std::ostream& os, Uuid const& i) {
	return os << std::string(i);
}

#endif /* !defined(UUID_HPP) */
