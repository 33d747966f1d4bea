#ifndef MINT_CONCURRENT_HPP
#define MINT_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Mint {

/** Mint::concurrent
 *
 * @brief launches `io` as its own greenthread and
 * returns at once.
 *
 * @desc A `Mint::Shutdown` ending the greenthread
 * is normal and ignored.
 * Any other `std::exception` is logged at `Error`
 * under `who`.
 */
Ev::Io<void> concurrent(S::Bus& bus, char const* who, Ev::Io<void> io);

}

#endif /* !defined(MINT_CONCURRENT_HPP) */
