#ifndef MINT_MSG_ENGINEREADY_HPP
#define MINT_MSG_ENGINEREADY_HPP

namespace Mint { class Engine; }

namespace Mint { namespace Msg {

/** struct Mint::Msg::EngineReady
 *
 * @brief emitted once the keysets are loaded and
 * the engine can serve requests.
 * The engine outlives every module.
 */
struct EngineReady {
	Mint::Engine& engine;
};

}}

#endif /* !defined(MINT_MSG_ENGINEREADY_HPP) */
