#ifndef SHA256_HASHER_HPP
#define SHA256_HASHER_HPP

#include"Sha256/Hash.hpp"
#include<cstddef>
#include<cstdint>
#include<memory>
#include<string>

namespace Sha256 {

/** class Sha256::Hasher
 *
 * @brief streams bytes into a SHA-256 computation.
 *
 * @desc `finalize` consumes the hasher; feeding a
 * finalized hasher throws `std::logic_error`.
 */
class Hasher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Hasher();
	Hasher(Hasher&&);
	Hasher& operator=(Hasher&&);
	~Hasher();

	Hasher& feed(void const* p, std::size_t size);
	Hasher& feed(std::string const& s);
	/* Four bytes, little-endian.  */
	Hasher& feed_le32(std::uint32_t v);

	Hash finalize();
};

/* One-shot digests.  */
Hash digest(void const* p, std::size_t len);
Hash digest(std::string const& s);

}

#endif /* !defined(SHA256_HASHER_HPP) */
