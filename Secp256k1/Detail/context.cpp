#include"Secp256k1/Detail/context.hpp"
#include"Util/BacktraceException.hpp"
#include<memory>
#include<secp256k1.h>
#include<sodium/core.h>
#include<sodium/randombytes.h>
#include<stdexcept>
#include<string>

namespace {

void illegal_callback(char const* msg, void*) {
	throw Util::BacktraceException<std::invalid_argument>(
		std::string("libsecp256k1: ") + msg
	);
}

struct Destroyer {
	void operator()(secp256k1_context* ctx) const {
		secp256k1_context_destroy(ctx);
	}
};

std::unique_ptr<secp256k1_context, Destroyer> create() {
	auto ctx = std::unique_ptr<secp256k1_context, Destroyer>(
		secp256k1_context_create( SECP256K1_CONTEXT_SIGN
					| SECP256K1_CONTEXT_VERIFY
					)
	);
	if (!ctx)
		throw std::runtime_error("libsecp256k1: cannot create context");
	secp256k1_context_set_illegal_callback( ctx.get()
					      , &illegal_callback
					      , nullptr
					      );
	/* Blinding against side channels on the mint's keys.  */
	if (sodium_init() < 0)
		throw std::runtime_error("libsodium failed to initialize");
	unsigned char seed[32];
	randombytes_buf(seed, sizeof(seed));
	if (!secp256k1_context_randomize(ctx.get(), seed))
		throw std::runtime_error("libsecp256k1: cannot randomize context");
	return ctx;
}

}

namespace Secp256k1 { namespace Detail {

secp256k1_context_struct* context() {
	static auto const ctx = create();
	return ctx.get();
}

}}
