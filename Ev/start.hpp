#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the given action in the default
 * libev loop until the loop has nothing more to
 * do, then returns the exit code the action
 * yielded.
 *
 * @desc If the action fails with an exception,
 * the exception is printed to stderr and the
 * return value is 254.
 */
int start(Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
