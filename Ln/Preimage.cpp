#include"Ln/Preimage.hpp"
#include"Secp256k1/Random.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<sodium/utils.h>
#include<stdexcept>
#include<string.h>

namespace Ln {

Preimage::Preimage() {
	memset(data, 0, sizeof(data));
}
Preimage::Preimage(Secp256k1::Random& random) {
	random.fill(data, sizeof(data));
}
Preimage::Preimage(std::string const& s) {
	auto buf = Util::Str::hexread(s);
	if (buf.size() != sizeof(data))
		throw Util::BacktraceException<std::invalid_argument>(
			"Ln::Preimage: need 64 hex digits, got: " + s
		);
	memcpy(data, &buf[0], sizeof(data));
}

Preimage::operator std::string() const {
	return Util::Str::hexdump(data, sizeof(data));
}
Preimage::operator bool() const {
	return !sodium_is_zero(data, sizeof(data));
}

bool Preimage::operator==(Preimage const& o) const {
	return sodium_memcmp(data, o.data, sizeof(data)) == 0;
}

Sha256::Hash Preimage::sha256() const {
	return Sha256::digest(data, sizeof(data));
}

}
