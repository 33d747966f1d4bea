#ifndef CASHU_HASH_TO_CURVE_HPP
#define CASHU_HASH_TO_CURVE_HPP

#include<cstddef>
#include<string>

namespace Secp256k1 { class PubKey; }

namespace Cashu {

/** Cashu::hash_to_curve
 *
 * @brief deterministically maps a message to a
 * point on the curve with unknown discrete log.
 *
 * @desc The message is hashed together with the
 * domain separator `Secp256k1_HashToCurve_Cashu_`.
 * A little-endian 32-bit counter is then appended
 * and hashed again until the result, prefixed with
 * `0x02`, is a valid compressed point.
 * Throws `std::runtime_error` if no point is found
 * in 2^16 tries.
 */
Secp256k1::PubKey hash_to_curve(void const* p, std::size_t len);
Secp256k1::PubKey hash_to_curve(std::string const& msg);

}

#endif /* !defined(CASHU_HASH_TO_CURVE_HPP) */
