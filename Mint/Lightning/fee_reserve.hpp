#ifndef MINT_LIGHTNING_FEE_RESERVE_HPP
#define MINT_LIGHTNING_FEE_RESERVE_HPP

#include"Ln/Amount.hpp"

namespace Mint { struct Config; }

namespace Mint { namespace Lightning {

/** Mint::Lightning::fee_reserve
 *
 * @brief the routing fee budget for paying the
 * given amount: `fee_percent` of it, but never
 * less than `reserve_fee_min`.
 */
Ln::Amount fee_reserve(Mint::Config const& config, Ln::Amount amount);

}}

#endif /* !defined(MINT_LIGHTNING_FEE_RESERVE_HPP) */
