#ifndef MINT_MOD_MANIFESTER_HPP
#define MINT_MOD_MANIFESTER_HPP

#include"Mint/Msg/ManifestCommand.hpp"
#include"Mint/Msg/ManifestOption.hpp"
#include<map>
#include<memory>
#include<string>

namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::Manifester
 *
 * @brief answers lightningd's `getmanifest`.
 *
 * @desc Raises `Mint::Msg::Manifestation`, collects
 * the `ManifestCommand` and `ManifestOption`
 * registrations other modules raise in response,
 * and replies with them.
 * Two registrations of one name are a programming
 * error and fail the `getmanifest`.
 */
class Manifester {
private:
	S::Bus& bus;

	struct Collected {
		std::map<std::string, Mint::Msg::ManifestCommand> commands;
		std::map<std::string, Mint::Msg::ManifestOption> options;
	};
	/* Non-null while a Manifestation is being raised.  */
	std::shared_ptr<Collected> collecting;

	void start();

public:
	explicit
	Manifester(S::Bus& bus_) : bus(bus_) { start(); }
};

}}

#endif /* !defined(MINT_MOD_MANIFESTER_HPP) */
