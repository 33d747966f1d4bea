#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

#include<cstddef>

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief lets every other ready greenthread run
 * before this one continues.
 *
 * @desc Anything shared with other greenthreads
 * may have changed when this returns.
 * The counted form yields repeatedly; tests use it
 * to let modules settle.
 */
Ev::Io<void> yield();
Ev::Io<void> yield(std::size_t num_yields);

}

#endif /* !defined(EV_YIELD_HPP) */
