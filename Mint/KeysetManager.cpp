#include"Cashu/Derivation.hpp"
#include"Ev/Io.hpp"
#include"Mint/Config.hpp"
#include"Mint/Error.hpp"
#include"Mint/KeysetManager.hpp"
#include"Mint/log.hpp"
#include"S/Bus.hpp"
#include"Secp256k1/Random.hpp"
#include"Sqlite3.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<memory>
#include<algorithm>
#include<map>
#include<stdexcept>
#include<sodium/utils.h>

namespace Mint {

class KeysetManager::Impl {
private:
	S::Bus& bus;
	Sqlite3::Db db;
	Mint::Config const& config;
	std::function<double()> get_now;

	std::vector<std::uint8_t> seed;

	struct Entry {
		Cashu::Keyset keyset;
		bool active;
		/* Time it stopped being active.  */
		double deactivated;
	};
	std::map<std::string, Entry> keysets;
	/* unit -> id of the active keyset.  */
	std::map<std::string, std::string> actives;

	void create_tables(Sqlite3::Tx& tx) {
		tx.query_execute(R"QRY(
		CREATE TABLE IF NOT EXISTS "MintSeed"
		     ( id INTEGER PRIMARY KEY
		     , seed TEXT NOT NULL
		     );
		CREATE TABLE IF NOT EXISTS "MintKeysets"
		     ( id TEXT PRIMARY KEY
		     , unit TEXT NOT NULL
		     , counter INTEGER NOT NULL
		     , max_order INTEGER NOT NULL
		     , active INTEGER NOT NULL
		     , created REAL NOT NULL
		     , deactivated REAL NOT NULL
		     );
		CREATE INDEX IF NOT EXISTS "MintKeysets_unit_idx"
		    ON "MintKeysets"(unit, counter);
		)QRY");
	}

	void load_seed(Sqlite3::Tx& tx) {
		if (!config.seed.empty()) {
			seed = Util::Str::hexread(config.seed);
			return;
		}
		auto fetch = tx.query(R"QRY(
		SELECT seed FROM "MintSeed" WHERE id = 0;
		)QRY").execute();
		for (auto& r : fetch) {
			seed = Util::Str::hexread(r.get<std::string>(0));
			return;
		}

		auto random = Secp256k1::Random();
		seed = random.bytes(32);
		tx.query(R"QRY(
		INSERT INTO "MintSeed" VALUES(0, :seed);
		)QRY")
			.bind(":seed", Util::Str::hexdump(&seed[0], seed.size()))
			.execute()
			;
	}

	void load_keysets(Sqlite3::Tx& tx) {
		auto fetch = tx.query(R"QRY(
		SELECT id, unit, counter, max_order, active, deactivated
		  FROM "MintKeysets"
		 ORDER BY unit, counter;
		)QRY").execute();
		for (auto& r : fetch) {
			auto id = r.get<std::string>(0);
			auto unit = r.get<std::string>(1);
			auto counter = r.get<std::uint32_t>(2);
			auto max_order = r.get<std::uint32_t>(3);
			auto active = r.get<bool>(4);
			auto deactivated = r.get<double>(5);

			auto keyset = Cashu::Keyset::derive( seed, unit
							   , counter, max_order
							   );
			if (keyset.get_id() != id)
				throw Util::BacktraceException<std::runtime_error>(
					"KeysetManager: keyset " + id +
					" does not match the seed (derived " +
					keyset.get_id() + " instead)"
				);
			keysets.emplace(id, Entry{ std::move(keyset)
						 , active, deactivated
						 });
			if (active)
				actives[unit] = id;
		}
	}

	std::uint32_t next_counter(std::string const& unit) const {
		auto rv = std::uint32_t(0);
		for (auto const& e : keysets) {
			auto const& ks = e.second.keyset;
			if (ks.get_unit() == unit && ks.get_counter() >= rv)
				rv = ks.get_counter() + 1;
		}
		return rv;
	}

	void insert(Sqlite3::Tx& tx, Cashu::Keyset const& ks, double now) {
		tx.query(R"QRY(
		INSERT INTO "MintKeysets"
		VALUES(:id, :unit, :counter, :max_order, 1, :now, 0);
		)QRY")
			.bind(":id", ks.get_id())
			.bind(":unit", ks.get_unit())
			.bind(":counter", ks.get_counter())
			.bind(":max_order", ks.get_max_order())
			.bind(":now", now)
			.execute()
			;
	}
	void deactivate(Sqlite3::Tx& tx, std::string const& id, double now) {
		tx.query(R"QRY(
		UPDATE "MintKeysets"
		   SET active = 0
		     , deactivated = :now
		 WHERE id = :id;
		)QRY")
			.bind(":id", id)
			.bind(":now", now)
			.execute()
			;
	}

	/* Records a newly-derived active keyset in memory.  */
	void activate(Cashu::Keyset ks, double now) {
		auto unit = ks.get_unit();
		auto it = actives.find(unit);
		if (it != actives.end()) {
			auto& old = keysets.at(it->second);
			old.active = false;
			old.deactivated = now;
		}
		auto id = ks.get_id();
		keysets.emplace(id, Entry{std::move(ks), true, 0});
		actives[unit] = id;
	}

	Entry const& find(std::string const& id) const {
		auto it = keysets.find(id);
		if (it == keysets.end())
			throw Mint::Failure( ErrorCode_UnknownKeyset
					   , "keyset " + id
					   );
		return it->second;
	}

public:
	Impl( S::Bus& bus_
	    , Sqlite3::Db db_
	    , Mint::Config const& config_
	    , std::function<double()> get_now_
	    ) : bus(bus_)
	      , db(std::move(db_))
	      , config(config_)
	      , get_now(std::move(get_now_))
	      { }
	~Impl() {
		if (!seed.empty())
			sodium_memzero(&seed[0], seed.size());
	}

	Ev::Io<void> load() {
		return db.transact().then([this](Sqlite3::Tx tx) {
			create_tables(tx);
			load_seed(tx);
			load_keysets(tx);

			auto now = get_now();
			auto created = std::vector<std::string>();
			for (auto const& unit : config.units) {
				if (actives.count(unit) != 0)
					continue;
				auto ks = derive(unit, next_counter(unit));
				insert(tx, ks, now);
				created.push_back(ks.get_id());
				activate(std::move(ks), now);
			}
			tx.commit();

			auto act = Mint::log( bus, Info
					    , "KeysetManager: %zu keysets, "
					      "%zu active."
					    , keysets.size(), actives.size()
					    );
			for (auto const& id : created)
				act += Mint::log( bus, Info
						, "KeysetManager: derived "
						  "keyset %s for %s."
						, id.c_str()
						, keysets.at(id).keyset
							.get_unit().c_str()
						);
			return act;
		});
	}

	Cashu::Keyset derive( std::string const& unit
			    , std::uint32_t counter
			    ) const {
		return Cashu::Keyset::derive( seed, unit, counter
					    , config.max_order
					    );
	}

	Cashu::Keyset const& get_active(std::string const& unit) const {
		auto it = actives.find(unit);
		if (it == actives.end())
			throw Mint::Failure( ErrorCode_UnsupportedUnit
					   , "unit " + unit
					   );
		return keysets.at(it->second).keyset;
	}
	Cashu::Keyset const& get_by_id(std::string const& id) const {
		return find(id).keyset;
	}
	Cashu::Keyset const& get_for_verification(std::string const& id) const {
		auto const& e = find(id);
		if ( !e.active
		  && config.keyset_retention > 0
		  && get_now() - e.deactivated > config.keyset_retention
		   )
			throw Mint::Failure( ErrorCode_InactiveKeyset
					   , "keyset " + id
					   + " is past its retention"
					   );
		return e.keyset;
	}
	bool is_active(std::string const& id) const {
		auto it = keysets.find(id);
		return it != keysets.end() && it->second.active;
	}

	Ev::Io<Cashu::Keyset> rotate(std::string const& unit) {
		return db.transact().then([this, unit](Sqlite3::Tx tx) {
			auto it = actives.find(unit);
			if (it == actives.end())
				throw Mint::Failure( ErrorCode_UnsupportedUnit
						   , "unit " + unit
						   );
			auto old_id = it->second;
			auto ks = derive(unit, next_counter(unit));
			auto now = get_now();
			deactivate(tx, old_id, now);
			insert(tx, ks, now);
			tx.commit();

			activate(ks, now);
			return Mint::log( bus, Info
					, "KeysetManager: rotated %s: "
					  "%s -> %s."
					, unit.c_str()
					, old_id.c_str()
					, ks.get_id().c_str()
					).then([ks]() {
				return Ev::lift(ks);
			});
		});
	}

	std::vector<KeysetInfo> list() const {
		auto rv = std::vector<KeysetInfo>();
		for (auto const& e : keysets) {
			auto const& ks = e.second.keyset;
			rv.push_back(KeysetInfo{ ks.get_id(), ks.get_unit()
					       , ks.get_counter()
					       , e.second.active
					       });
		}
		std::sort( rv.begin(), rv.end()
			 , [](KeysetInfo const& a, KeysetInfo const& b) {
			if (a.unit != b.unit)
				return a.unit < b.unit;
			return a.counter < b.counter;
		});
		return rv;
	}
	std::vector<std::string> units() const {
		auto rv = std::vector<std::string>();
		for (auto const& a : actives)
			rv.push_back(a.first);
		return rv;
	}

	Secp256k1::PubKey mint_pubkey() const {
		return Secp256k1::PubKey(
			Cashu::Derivation::master(seed).get_key()
		);
	}
};

KeysetManager::KeysetManager( S::Bus& bus
			    , Sqlite3::Db db
			    , Mint::Config const& config
			    , std::function<double()> get_now
			    ) : pimpl(std::make_unique<Impl>( bus
							     , std::move(db)
							     , config
							     , std::move(get_now)
							     ))
			      { }
KeysetManager::~KeysetManager() { }

Ev::Io<void> KeysetManager::load() {
	return pimpl->load();
}
Cashu::Keyset KeysetManager::derive_keyset( std::string const& unit
					  , std::uint32_t counter
					  ) const {
	return pimpl->derive(unit, counter);
}
Cashu::Keyset const&
KeysetManager::get_active(std::string const& unit) const {
	return pimpl->get_active(unit);
}
Cashu::Keyset const&
KeysetManager::get_by_id(std::string const& id) const {
	return pimpl->get_by_id(id);
}
Cashu::Keyset const&
KeysetManager::get_for_verification(std::string const& id) const {
	return pimpl->get_for_verification(id);
}
bool KeysetManager::is_active(std::string const& id) const {
	return pimpl->is_active(id);
}
Ev::Io<Cashu::Keyset> KeysetManager::rotate(std::string const& unit) {
	return pimpl->rotate(unit);
}
std::vector<KeysetInfo> KeysetManager::list() const {
	return pimpl->list();
}
std::vector<std::string> KeysetManager::units() const {
	return pimpl->units();
}
Secp256k1::PubKey KeysetManager::mint_pubkey() const {
	return pimpl->mint_pubkey();
}

}
