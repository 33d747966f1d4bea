#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief starts `io` as a new greenthread once the
 * current one yields, and returns at once.
 *
 * @desc An exception that escapes `io` is printed
 * to stderr; the loop keeps running.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* EV_CONCURRENT_HPP */
