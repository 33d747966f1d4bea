#ifndef MINT_SHUTDOWN_HPP
#define MINT_SHUTDOWN_HPP

namespace Mint {

/** struct Mint::Shutdown
 *
 * @brief broadcast on the bus when lightningd
 * closes our stdin, and thrown by any pending
 * wait, RPC call or timer it interrupts.
 *
 * @desc Deliberately not a `std::exception`, so
 * handlers for real failures do not catch it.
 */
struct Shutdown {};

}

#endif /* !defined(MINT_SHUTDOWN_HPP) */
