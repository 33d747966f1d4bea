#include"Ev/Io.hpp"
#include"Mint/Engine.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"

namespace Mint {

Engine::Engine( S::Bus& bus
	      , Sqlite3::Db db
	      , Mint::Config config_
	      , Lightning::BackendIF& backend
	      , std::function<double()> get_now
	      ) : config(std::move(config_))
		, random()
		, keyset_manager(bus, db, config, get_now)
		, blind_signer(keyset_manager, random)
		, proof_tracker(db, get_now)
		, mint_quote_manager( bus, db, config
				    , keyset_manager, blind_signer
				    , backend, get_now
				    )
		, melt_quote_manager( bus, db, config
				    , keyset_manager, blind_signer
				    , proof_tracker
				    , backend, get_now
				    )
		, swap_engine( bus, db
			     , keyset_manager, blind_signer
			     , proof_tracker
			     )
		, info_provider(config, keyset_manager)
		{ }

Ev::Io<void> Engine::init() {
	return keyset_manager.load().then([this]() {
		return proof_tracker.init();
	}).then([this]() {
		return mint_quote_manager.init();
	}).then([this]() {
		return melt_quote_manager.init();
	});
}

}
