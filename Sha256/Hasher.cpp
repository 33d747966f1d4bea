#include"Sha256/Hasher.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<sodium/crypto_hash_sha256.h>
#include<sodium/utils.h>
#include<stdexcept>

namespace Sha256 {

class Hasher::Impl {
public:
	crypto_hash_sha256_state st;

	Impl() {
		crypto_hash_sha256_init(&st);
	}
	~Impl() {
		sodium_memzero(&st, sizeof(st));
	}
};

Hasher::Hasher() : pimpl(std::make_unique<Impl>()) { }
Hasher::Hasher(Hasher&&) =default;
Hasher& Hasher::operator=(Hasher&&) =default;
Hasher::~Hasher() =default;

Hasher& Hasher::feed(void const* p, std::size_t len) {
	if (!pimpl)
		throw Util::BacktraceException<std::logic_error>(
			"Sha256::Hasher: fed after finalize"
		);
	crypto_hash_sha256_update( &pimpl->st
				 , static_cast<unsigned char const*>(p)
				 , len
				 );
	return *this;
}
Hasher& Hasher::feed(std::string const& s) {
	return feed(s.data(), s.size());
}
Hasher& Hasher::feed_le32(std::uint32_t v) {
	std::uint8_t buf[4] = { std::uint8_t(v)
			      , std::uint8_t(v >> 8)
			      , std::uint8_t(v >> 16)
			      , std::uint8_t(v >> 24)
			      };
	return feed(buf, sizeof(buf));
}

Hash Hasher::finalize() {
	if (!pimpl)
		throw Util::BacktraceException<std::logic_error>(
			"Sha256::Hasher: finalized twice"
		);
	std::uint8_t buf[32];
	crypto_hash_sha256_final(&pimpl->st, buf);
	pimpl = nullptr;
	auto rv = Hash::from_buffer(buf);
	sodium_memzero(buf, sizeof(buf));
	return rv;
}

Hash digest(void const* p, std::size_t len) {
	return Hasher().feed(p, len).finalize();
}
Hash digest(std::string const& s) {
	return digest(s.data(), s.size());
}

}
