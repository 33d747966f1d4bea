#include"Sha256/Hash.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<sodium/utils.h>
#include<stdexcept>
#include<string.h>

namespace Sha256 {

Hash::Hash() {
	memset(d, 0, sizeof(d));
}
Hash::Hash(std::string const& s) {
	auto bytes = Util::Str::hexread(s);
	if (bytes.size() != sizeof(d))
		throw Util::BacktraceException<std::invalid_argument>(
			"Sha256::Hash: need 64 hex digits, got: " + s
		);
	memcpy(d, &bytes[0], sizeof(d));
}

Hash Hash::from_buffer(std::uint8_t const buffer[32]) {
	auto rv = Hash();
	memcpy(rv.d, buffer, sizeof(rv.d));
	return rv;
}
void Hash::to_buffer(std::uint8_t buffer[32]) const {
	memcpy(buffer, d, sizeof(d));
}

Hash::operator std::string() const {
	return Util::Str::hexdump(d, sizeof(d));
}
Hash::operator bool() const {
	return !sodium_is_zero(d, sizeof(d));
}

bool Hash::operator==(Hash const& o) const {
	return sodium_memcmp(d, o.d, sizeof(d)) == 0;
}
bool Hash::operator<(Hash const& o) const {
	return memcmp(d, o.d, sizeof(d)) < 0;
}

}
