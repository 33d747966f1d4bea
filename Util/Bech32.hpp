#ifndef UTIL_BECH32_HPP
#define UTIL_BECH32_HPP

#include<cstdint>
#include<string>
#include<vector>

namespace Util { namespace Bech32 {

/** Util::Bech32::decode
 *
 * @brief decode a bech32 string into its
 * human-readable part and its 5-bit data
 * words, with the checksum removed.
 *
 * @return true if decoding succeeded and the
 * checksum matched.
 *
 * @desc Unlike BIP173 this does not limit the
 * length of the input, as BOLT11 invoices
 * routinely exceed 90 characters.
 */
bool decode( std::string& hrp
	   , std::vector<std::uint8_t>& words
	   , std::string const& bech32
	   );

/** Util::Bech32::encode
 *
 * @brief encode the given human-readable part
 * and 5-bit data words, appending the checksum.
 */
std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& words
		  );

/** Util::Bech32::words_to_bytes
 *
 * @brief pack 5-bit words into bytes.
 * Trailing bits that do not fill a byte are
 * dropped.
 */
std::vector<std::uint8_t>
words_to_bytes( std::vector<std::uint8_t>::const_iterator b
	      , std::vector<std::uint8_t>::const_iterator e
	      );

/** Util::Bech32::bytes_to_words
 *
 * @brief unpack bytes into 5-bit words, padding
 * the last word with 0 bits.
 */
std::vector<std::uint8_t>
bytes_to_words(std::vector<std::uint8_t> const& bytes);

}}

#endif /* !defined(UTIL_BECH32_HPP) */
