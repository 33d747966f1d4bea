#ifndef MINT_MSG_MANIFESTATION_HPP
#define MINT_MSG_MANIFESTATION_HPP

namespace Mint { namespace Msg {

/** struct Mint::Msg::Manifestation
 *
 * @brief emitted during `getmanifest`.
 * Modules triggering on this message should emit
 * Mint::Msg::Manifest* messages.
 */
struct Manifestation {};

}}

#endif /* MINT_MSG_MANIFESTATION_HPP */
