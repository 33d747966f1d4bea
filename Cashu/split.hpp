#ifndef CASHU_SPLIT_HPP
#define CASHU_SPLIT_HPP

#include<cstdint>
#include<vector>

namespace Jsmn { class Object; }

namespace Cashu {

/** Cashu::split
 *
 * @brief returns the binary expansion of the
 * given amount as powers of two, smallest
 * first.
 * An amount of 0 splits into nothing.
 */
std::vector<std::uint64_t> split(std::uint64_t amount);

/** Cashu::is_power_of_two
 *
 * @brief true if the amount is a valid
 * denomination.
 */
inline
bool is_power_of_two(std::uint64_t amount) {
	return amount != 0 && (amount & (amount - 1)) == 0;
}

/** Cashu::amount_from_json
 *
 * @brief reads a non-negative integer amount
 * from a JSON number, without going through
 * `double`.
 *
 * @desc Throws `std::invalid_argument` if the
 * object is not an integer that fits in 64
 * bits.
 */
std::uint64_t amount_from_json(Jsmn::Object const&);

}

#endif /* !defined(CASHU_SPLIT_HPP) */
