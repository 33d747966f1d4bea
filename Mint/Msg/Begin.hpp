#ifndef MINT_MSG_BEGIN_HPP
#define MINT_MSG_BEGIN_HPP

namespace Mint { namespace Msg {

/** struct Mint::Msg::Begin
 *
 * @brief broadcast once, after all modules have
 * been constructed and before stdin is read.
 */
struct Begin {};

}}

#endif /* !defined(MINT_MSG_BEGIN_HPP) */
