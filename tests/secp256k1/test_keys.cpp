#undef NDEBUG
#include"Secp256k1/G.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Secp256k1/Random.hpp"
#include<assert.h>
#include<set>
#include<stdexcept>
#include<string>

namespace {

auto const g_hex = std::string("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
auto const two_g_hex = std::string("02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5");
/* The group order n.  */
auto const order_hex = std::string("fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");

template<typename E, typename F>
bool throws(F f) {
	try {
		f();
	} catch (E const&) {
		return true;
	}
	return false;
}

}

int main() {
	auto random = Secp256k1::Random();

	assert(std::string(Secp256k1::G) == g_hex);
	assert(Secp256k1::PubKey() == Secp256k1::G);
	assert(Secp256k1::G.to_uncompressed_hex().substr(0, 66) == "04" + g_hex.substr(2));
	assert(Secp256k1::G.to_uncompressed_hex().size() == 130);

	auto one = Secp256k1::PrivKey();
	auto two = one + one;
	assert(Secp256k1::PubKey(one) == Secp256k1::G);
	assert(std::string(Secp256k1::PubKey(two)) == two_g_hex);
	assert(Secp256k1::G + Secp256k1::G == Secp256k1::PubKey(two));
	assert(two - one == one);

	/* k*(a*G) == a*(k*G), the identity blind signing rests on.  */
	{
		auto k = Secp256k1::PrivKey(random);
		auto a = Secp256k1::PrivKey(random);
		auto r = Secp256k1::PrivKey(random);
		auto K = Secp256k1::PubKey(k);
		auto Y = Secp256k1::PubKey(a);
		auto B_ = Y + r * Secp256k1::G;
		auto C_ = k * B_;
		auto C = C_ - r * K;
		assert(C == k * Y);
		assert(C != C_);
	}

	/* Text round trips, as keys travel in JSON.  */
	{
		auto k = Secp256k1::PrivKey(random);
		assert(Secp256k1::PrivKey(std::string(k)) == k);
		auto K = Secp256k1::PubKey(k);
		assert(Secp256k1::PubKey(std::string(K)) == K);
		assert(-(-K) == K);
		assert(-K != K);
	}

	assert(throws<Secp256k1::InvalidPrivKey>([]() {
		(void) Secp256k1::PrivKey(std::string(64, '0'));
	}));
	assert(throws<Secp256k1::InvalidPrivKey>([]() {
		(void) Secp256k1::PrivKey(order_hex);
	}));
	assert(throws<Secp256k1::InvalidPrivKey>([]() {
		(void) Secp256k1::PrivKey("not hex at all");
	}));
	/* No point has x = 0.  */
	assert(throws<Secp256k1::InvalidPubKey>([]() {
		(void) Secp256k1::PubKey("02" + std::string(64, '0'));
	}));
	assert(throws<Secp256k1::InvalidPubKey>([]() {
		(void) Secp256k1::PubKey(g_hex.substr(0, 64));
	}));
	assert(throws<Secp256k1::InvalidPubKey>([]() {
		(void) Secp256k1::PubKey("05" + g_hex.substr(2));
	}));

	/* Reaching zero or infinity throws and leaves the
	 * operand as it was.  */
	{
		auto k = Secp256k1::PrivKey(random);
		auto minus_k = -k;
		assert(throws<std::out_of_range>([&]() {
			minus_k += k;
		}));
		assert(minus_k == -k);

		auto K = Secp256k1::PubKey(k);
		assert(throws<std::out_of_range>([&]() {
			(void) (K - K);
		}));
		assert(K == Secp256k1::PubKey(k));
	}

	/* Ordered by encoding, so spent-Y sets work.  */
	{
		auto ys = std::set<Secp256k1::PubKey>();
		ys.insert(Secp256k1::G);
		ys.insert(Secp256k1::PubKey(two));
		ys.insert(Secp256k1::PubKey(one));
		assert(ys.size() == 2);
	}

	return 0;
}
