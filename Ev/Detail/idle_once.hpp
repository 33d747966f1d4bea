#ifndef EV_DETAIL_IDLE_ONCE_HPP
#define EV_DETAIL_IDLE_ONCE_HPP

#include<exception>
#include<functional>
#include<string>

namespace Ev { namespace Detail {

/* Calls `f` once, from the default loop, the next
 * time the loop has nothing else pending.  */
void idle_once(std::function<void()> f);

/* Text for an exception that escaped a greenthread.  */
std::string describe(std::exception_ptr e);

}}

#endif /* !defined(EV_DETAIL_IDLE_ONCE_HPP) */
