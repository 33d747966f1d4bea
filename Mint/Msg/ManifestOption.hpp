#ifndef MINT_MSG_MANIFESTOPTION_HPP
#define MINT_MSG_MANIFESTOPTION_HPP

#include"Mint/Msg/OptionType.hpp"
#include"Json/Out.hpp"
#include<string>

namespace Mint { namespace Msg {

/** struct Mint::Msg::ManifestOption
 *
 * @brief emit in response to `Mint::Msg::Manifestation` to
 * register an option.
 */
struct ManifestOption {
	std::string name;
	OptionType type;
	Json::Out default_value;
	std::string description;
};

}}

#endif /* !defined(MINT_MSG_MANIFESTOPTION_HPP) */
