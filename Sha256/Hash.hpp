#ifndef SHA256_HASH_HPP
#define SHA256_HASH_HPP

#include<cstdint>
#include<ostream>
#include<string>

namespace Sha256 {

/** class Sha256::Hash
 *
 * @brief a 32-byte SHA-256 digest, such as a
 * Lightning payment hash.
 *
 * @desc Default-constructs to all zeroes, which
 * tests false.
 */
class Hash {
private:
	std::uint8_t d[32];

public:
	Hash();
	/* 64 hex digits.  */
	explicit Hash(std::string const&);

	static Hash from_buffer(std::uint8_t const buffer[32]);
	void to_buffer(std::uint8_t buffer[32]) const;

	explicit operator std::string() const;

	explicit operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	bool operator==(Hash const&) const;
	bool operator!=(Hash const& o) const {
		return !(*this == o);
	}
	bool operator<(Hash const&) const;
};

inline
std::ostream& operator<<(std::ostream& os, Hash const& h) {
	return os << std::string(h);
}

}

#endif /* !defined(SHA256_HASH_HPP) */
