#ifndef MINT_MSG_JSONCIN_HPP
#define MINT_MSG_JSONCIN_HPP

#include"Jsmn/Object.hpp"

namespace Mint { namespace Msg {

/** struct Mint::Msg::JsonCin
 *
 * @brief emitted for each JSON object read
 * from stdin.
 */
struct JsonCin {
	Jsmn::Object obj;
};

}}

#endif /* !defined(MINT_MSG_JSONCIN_HPP) */
