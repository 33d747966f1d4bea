#ifndef MINT_ENGINE_HPP
#define MINT_ENGINE_HPP

#include"Mint/BlindSigner.hpp"
#include"Mint/Config.hpp"
#include"Mint/InfoProvider.hpp"
#include"Mint/KeysetManager.hpp"
#include"Mint/MeltQuoteManager.hpp"
#include"Mint/MintQuoteManager.hpp"
#include"Mint/ProofTracker.hpp"
#include"Mint/SwapEngine.hpp"
#include"Secp256k1/Random.hpp"
#include<functional>

namespace Ev { template<typename a> class Io; }
namespace Mint { namespace Lightning { class BackendIF; }}
namespace S { class Bus; }
namespace Sqlite3 { class Db; }

namespace Mint {

/** class Mint::Engine
 *
 * @brief one of each mint component, wired
 * together over a single database and
 * Lightning backend.
 *
 * @desc `init` must complete before anything
 * else is used.
 * The backend must outlive the engine.
 */
class Engine {
private:
	Mint::Config config;
	Secp256k1::Random random;
	KeysetManager keyset_manager;
	BlindSigner blind_signer;
	ProofTracker proof_tracker;
	MintQuoteManager mint_quote_manager;
	MeltQuoteManager melt_quote_manager;
	SwapEngine swap_engine;
	InfoProvider info_provider;

public:
	Engine() =delete;
	Engine(Engine const&) =delete;

	Engine( S::Bus& bus
	      , Sqlite3::Db db
	      , Mint::Config config
	      , Lightning::BackendIF& backend
	      , std::function<double()> get_now
	      );

	Ev::Io<void> init();

	Mint::Config const& get_config() const { return config; }
	KeysetManager& keysets() { return keyset_manager; }
	BlindSigner& signer() { return blind_signer; }
	ProofTracker& proofs() { return proof_tracker; }
	MintQuoteManager& mint_quotes() { return mint_quote_manager; }
	MeltQuoteManager& melt_quotes() { return melt_quote_manager; }
	SwapEngine& swaps() { return swap_engine; }
	InfoProvider const& info() const { return info_provider; }
};

}

#endif /* !defined(MINT_ENGINE_HPP) */
