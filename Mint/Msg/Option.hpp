#ifndef MINT_MSG_OPTION_HPP
#define MINT_MSG_OPTION_HPP

#include"Jsmn/Object.hpp"
#include<string>

namespace Mint { namespace Msg {

/** struct Mint::Msg::Option
 *
 * @brief emitted during `init` handling, providing the value
 * of an option that we registered.
 */
struct Option {
	std::string name;
	Jsmn::Object value;
};

}}

#endif /* !defined(MINT_MSG_OPTION_HPP) */
