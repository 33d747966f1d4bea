#ifndef MINT_MSG_OPTIONTYPE_HPP
#define MINT_MSG_OPTIONTYPE_HPP

namespace Mint { namespace Msg {

/** enum Mint::Msg::OptionType
 *
 * @brief the types that a `lightningd` option can have.
 */
enum OptionType {
	OptionType_String,
	OptionType_Bool,
	OptionType_Int,
	OptionType_Flag
};

}}

#endif /* !defined(MINT_MSG_OPTIONTYPE_HPP) */
