#ifndef SECP256K1_PRIVKEY_HPP
#define SECP256K1_PRIVKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<ostream>
#include<stdexcept>
#include<string>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class PubKey; }
namespace Secp256k1 { class Random; }

std::ostream& operator<<(std::ostream&, Secp256k1::PrivKey const&);

namespace Secp256k1 {

/* Bytes that are not a scalar in [1, n).  */
class InvalidPrivKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPrivKey()
		: Util::BacktraceException<std::invalid_argument>(
			"Invalid private key."
		  ) { }
};

/** class Secp256k1::PrivKey
 *
 * @brief a nonzero scalar modulo the group order.
 *
 * @desc Used for the mint's per-amount keys `k`,
 * the blinding factors `r` of test wallets, and
 * the `e` and `s` of DLEQ proofs.
 * The bytes are wiped on destruction.
 * Arithmetic that would reach zero throws
 * `std::out_of_range`.
 */
class PrivKey {
private:
	std::uint8_t key[32];

public:
	/* The scalar 1.  */
	PrivKey();
	/* 64 hex digits.  */
	explicit PrivKey(std::string const&);
	explicit PrivKey(Secp256k1::Random&);
	PrivKey(PrivKey const&);
	PrivKey& operator=(PrivKey const&);
	~PrivKey();

	static PrivKey from_buffer(std::uint8_t const buffer[32]);
	void to_buffer(std::uint8_t buffer[32]) const;

	explicit operator std::string() const;

	PrivKey& negate();
	PrivKey operator-() const {
		auto tmp = *this;
		return tmp.negate();
	}
	PrivKey& operator+=(PrivKey const&);
	PrivKey& operator*=(PrivKey const&);

	PrivKey operator+(PrivKey const& o) const {
		auto tmp = *this;
		return tmp += o;
	}
	PrivKey operator-(PrivKey const& o) const {
		auto tmp = -o;
		return tmp += *this;
	}
	PrivKey operator*(PrivKey const& o) const {
		auto tmp = *this;
		return tmp *= o;
	}

	/* Constant-time.  */
	bool operator==(PrivKey const&) const;
	bool operator!=(PrivKey const& o) const {
		return !(*this == o);
	}

	friend class PubKey;
};

}

#endif /* SECP256K1_PRIVKEY_HPP */
