#ifndef MINT_MOD_JSONOUTPUTTER_HPP
#define MINT_MOD_JSONOUTPUTTER_HPP

#include<ostream>

namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::JsonOutputter
 *
 * @brief writes each `Mint::Msg::JsonCout` to the
 * plugin's stdout, for lightningd.
 *
 * @desc Each datum is written whole, followed by a
 * blank line, and flushed, in the order raised.
 * If stdout has failed, raising `JsonCout` fails
 * with `std::runtime_error`.
 */
class JsonOutputter {
private:
	std::ostream& cout;
	unsigned long written;

public:
	JsonOutputter(std::ostream& cout, S::Bus& bus);
};

}}

#endif /* !defined(MINT_MOD_JSONOUTPUTTER_HPP) */
