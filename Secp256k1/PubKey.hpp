#ifndef SECP256K1_PUBKEY_HPP
#define SECP256K1_PUBKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<ostream>
#include<stdexcept>
#include<string>

namespace Secp256k1 { class PrivKey; }
namespace Secp256k1 { class PubKey; }

std::ostream& operator<<(std::ostream&, Secp256k1::PubKey const&);

namespace Secp256k1 {

/* Bytes that are not a point on the curve.  */
class InvalidPubKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPubKey()
		: Util::BacktraceException<std::invalid_argument>(
			"Invalid public key."
		  ) { }
};

/** class Secp256k1::PubKey
 *
 * @brief a point on the curve, other than the point
 * at infinity.
 *
 * @desc Held as its 33-byte compressed encoding, which
 * is also the form it takes on the wire (`B_`, `C_`,
 * `C`, `Y`, keyset keys).
 * Arithmetic that would reach infinity throws
 * `std::out_of_range`.
 */
class PubKey {
private:
	std::uint8_t data[33];

	struct Trusted {};
	PubKey(Trusted, std::uint8_t const buffer[33]);

public:
	/* The generator G.  */
	PubKey();
	/* 66 hex digits, compressed.  */
	explicit PubKey(std::string const&);
	/* sk * G.  */
	explicit PubKey(Secp256k1::PrivKey const& sk);
	PubKey(PubKey const&) =default;
	PubKey& operator=(PubKey const&) =default;

	/* Throws InvalidPubKey if not on the curve.  */
	static PubKey from_buffer(std::uint8_t const buffer[33]);
	void to_buffer(std::uint8_t buffer[33]) const;

	explicit operator std::string() const;
	/* 130 hex digits, 04-prefixed.  */
	std::string to_uncompressed_hex() const;

	PubKey operator-() const;
	PubKey& operator+=(PubKey const&);
	PubKey& operator-=(PubKey const& o) {
		return *this += -o;
	}
	PubKey& operator*=(PrivKey const&);

	PubKey operator+(PubKey const& o) const {
		auto tmp = *this;
		return tmp += o;
	}
	PubKey operator-(PubKey const& o) const {
		auto tmp = *this;
		return tmp -= o;
	}
	PubKey operator*(PrivKey const& o) const {
		auto tmp = *this;
		return tmp *= o;
	}

	bool operator==(PubKey const&) const;
	bool operator!=(PubKey const& o) const {
		return !(*this == o);
	}
	/* Byte order of the compressed encoding.  */
	bool operator<(PubKey const&) const;
};

inline
PubKey operator*(PrivKey const& a, PubKey const& B) {
	return B * a;
}

}

#endif /* SECP256K1_PUBKEY_HPP */
