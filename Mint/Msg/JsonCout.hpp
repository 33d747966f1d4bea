#ifndef MINT_MSG_JSONCOUT_HPP
#define MINT_MSG_JSONCOUT_HPP

#include"Json/Out.hpp"

namespace Mint { namespace Msg {

/** struct Mint::Msg::JsonCout
 *
 * @brief emit to write a JSON object to stdout,
 * i.e. to `lightningd`.
 */
struct JsonCout {
	Json::Out obj;
};

}}

#endif /* !defined(MINT_MSG_JSONCOUT_HPP) */
