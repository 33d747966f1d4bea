#ifndef MINT_MOD_ENGINELOADER_HPP
#define MINT_MOD_ENGINELOADER_HPP

#include<memory>

namespace Mint { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::EngineLoader
 *
 * @brief registers the `clmint-*` options and,
 * at `init`, builds the Lightning backend and the
 * mint engine from them.
 *
 * @desc Broadcasts `Mint::Msg::EngineReady` once
 * the keysets are loaded.
 * A bad option value makes `init` fail, which
 * disables the plugin.
 */
class EngineLoader {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	EngineLoader() =delete;
	EngineLoader(S::Bus& bus, Waiter& waiter);
	EngineLoader(EngineLoader&&);
	~EngineLoader();
};

}}

#endif /* !defined(MINT_MOD_ENGINELOADER_HPP) */
