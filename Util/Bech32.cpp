#include"Util/Bech32.hpp"
#include<algorithm>
#include<ctype.h>

namespace {

auto const bech32_chars = std::string("qpzry9x8gf2tvdw0s3jn54khce6mua7l");

int decode_char(char c) {
	auto it = std::find( bech32_chars.begin(), bech32_chars.end()
			   , char(tolower((unsigned char) c))
			   );
	if (it == bech32_chars.end()) {
		return -1;
	}
	return it - bech32_chars.begin();
}

std::uint32_t polymod(std::vector<std::uint8_t> const& values) {
	auto const gen = std::vector<std::uint32_t>
	{ 0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3 };
	auto chk = std::uint32_t(1);
	for (auto v : values) {
		auto top = chk >> 25;
		chk = ((chk & 0x1ffffff) << 5) ^ v;
		for (auto i = 0; i < 5; ++i)
			if ((top >> i) & 1)
				chk ^= gen[i];
	}
	return chk;
}

std::vector<std::uint8_t> expand_hrp(std::string const& hrp) {
	auto rv = std::vector<std::uint8_t>();
	for (auto c : hrp)
		rv.push_back(std::uint8_t(c) >> 5);
	rv.push_back(0);
	for (auto c : hrp)
		rv.push_back(std::uint8_t(c) & 31);
	return rv;
}

}

namespace Util { namespace Bech32 {

bool decode( std::string& hrp
	   , std::vector<std::uint8_t>& words
	   , std::string const& bech32
	   ) {
	/* The last `1` character is the separator, so
	 * do the scan in reverse order.
	 */
	auto rit = std::find(bech32.rbegin(), bech32.rend(), '1');
	if (rit == bech32.rend())
		return false;
	auto it = rit.base();
	if (it == bech32.begin() + 1)
		return false;
	/* Data part must at least hold the checksum.  */
	if (bech32.end() - it < 6)
		return false;

	auto has_lower = false;
	auto has_upper = false;
	for (auto c : bech32) {
		auto u = (unsigned char) c;
		/* Printable US-ASCII only.  */
		if (u < 33 || u > 126)
			return false;
		if (islower(u))
			has_lower = true;
		if (isupper(u))
			has_upper = true;
	}
	if (has_lower && has_upper)
		return false;

	hrp.resize(it - 1 - bech32.begin());
	std::transform( bech32.begin(), it - 1
		      , hrp.begin()
		      , [](char c) {
		return char(tolower((unsigned char) c));
	});

	auto all = std::vector<std::uint8_t>();
	for (auto p = it; p != bech32.end(); ++p) {
		auto val = decode_char(*p);
		if (val < 0)
			return false;
		all.push_back(std::uint8_t(val));
	}

	auto check = expand_hrp(hrp);
	check.insert(check.end(), all.begin(), all.end());
	if (polymod(check) != 1)
		return false;

	words.assign(all.begin(), all.end() - 6);
	return true;
}

std::string encode( std::string const& hrp
		  , std::vector<std::uint8_t> const& words
		  ) {
	auto check = expand_hrp(hrp);
	check.insert(check.end(), words.begin(), words.end());
	check.insert(check.end(), 6, 0);
	auto mod = polymod(check) ^ 1;

	auto rv = hrp;
	rv.push_back('1');
	for (auto w : words)
		rv.push_back(bech32_chars[w & 31]);
	for (auto i = 0; i < 6; ++i)
		rv.push_back(bech32_chars[(mod >> (5 * (5 - i))) & 31]);
	return rv;
}

std::vector<std::uint8_t>
words_to_bytes( std::vector<std::uint8_t>::const_iterator b
	      , std::vector<std::uint8_t>::const_iterator e
	      ) {
	auto rv = std::vector<std::uint8_t>();
	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (; b != e; ++b) {
		acc = (acc << 5) | (*b & 31);
		bits += 5;
		if (bits >= 8) {
			bits -= 8;
			rv.push_back(std::uint8_t((acc >> bits) & 0xFF));
		}
	}
	return rv;
}

std::vector<std::uint8_t>
bytes_to_words(std::vector<std::uint8_t> const& bytes) {
	auto rv = std::vector<std::uint8_t>();
	auto acc = std::uint32_t(0);
	auto bits = 0;
	for (auto by : bytes) {
		acc = (acc << 8) | by;
		bits += 8;
		while (bits >= 5) {
			bits -= 5;
			rv.push_back(std::uint8_t((acc >> bits) & 31));
		}
	}
	if (bits > 0)
		rv.push_back(std::uint8_t((acc << (5 - bits)) & 31));
	return rv;
}

}}
