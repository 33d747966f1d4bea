#ifndef EV_NOW_HPP
#define EV_NOW_HPP

#include<cstdint>

namespace Ev {

/** Ev::now
 *
 * @brief the loop's idea of the current time, in
 * seconds from the epoch.
 *
 * @desc Updated once per loop iteration, so every
 * callback in one iteration sees the same time.
 */
double now();

/* `now`, rounded down to whole seconds, as quote
 * and invoice timestamps are kept.  */
std::uint64_t now_seconds();

}

#endif /* !defined(EV_NOW_HPP) */
