#ifndef SECP256K1_DETAIL_CONTEXT_HPP
#define SECP256K1_DETAIL_CONTEXT_HPP

extern "C" {
struct secp256k1_context_struct;
}

namespace Secp256k1 { namespace Detail {

/* The process-wide signing and verification context.
 * Created on first use, so it is safe to call during
 * static initialization of other translation units.
 * Illegal arguments to libsecp256k1 throw
 * std::invalid_argument out of the offending call.
 */
secp256k1_context_struct* context();

}}

#endif /* SECP256K1_DETAIL_CONTEXT_HPP */
