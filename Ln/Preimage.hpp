#ifndef LN_PREIMAGE_HPP
#define LN_PREIMAGE_HPP

#include"Sha256/Hash.hpp"
#include<cstdint>
#include<string>

namespace Secp256k1 { class Random; }

namespace Ln {

/** class Ln::Preimage
 *
 * @brief the 32-byte secret whose SHA-256 is a
 * payment hash.
 *
 * @desc A default-constructed preimage is absent and
 * tests false; a melt quote holds one until its
 * payment succeeds.
 */
class Preimage {
private:
	std::uint8_t data[32];

public:
	Preimage();
	explicit Preimage(Secp256k1::Random&);
	/* 64 hex digits.  */
	explicit Preimage(std::string const&);

	explicit operator std::string() const;

	explicit operator bool() const;
	bool operator!() const {
		return !bool(*this);
	}

	bool operator==(Preimage const&) const;
	bool operator!=(Preimage const& o) const {
		return !(*this == o);
	}

	Sha256::Hash sha256() const;
};

}

#endif /* !defined(LN_PREIMAGE_HPP) */
