#ifndef SECP256K1_G_HPP
#define SECP256K1_G_HPP

#include"Secp256k1/PubKey.hpp"

namespace Secp256k1 {

/* The generator point.  */
extern PubKey const G;

}

#endif /* SECP256K1_G_HPP */
