#ifndef MINT_KEYSETMANAGER_HPP
#define MINT_KEYSETMANAGER_HPP

#include"Cashu/Keyset.hpp"
#include"Secp256k1/PubKey.hpp"
#include<cstdint>
#include<functional>
#include<memory>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Mint { struct Config; }
namespace S { class Bus; }
namespace Sqlite3 { class Db; }

namespace Mint {

/* One row of `list()`.  */
struct KeysetInfo {
	std::string id;
	std::string unit;
	std::uint32_t counter;
	bool active;
};

/** class Mint::KeysetManager
 *
 * @brief owns every keyset this mint ever
 * derived, and which one of each unit is the
 * active one.
 *
 * @desc Keysets are re-derived from the seed at
 * `load`, only the derivation parameters are
 * stored.
 * `load` must complete before any other member
 * is used.
 */
class KeysetManager {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	KeysetManager() =delete;
	KeysetManager(KeysetManager const&) =delete;

	KeysetManager( S::Bus& bus
		     , Sqlite3::Db db
		     , Mint::Config const& config
		     , std::function<double()> get_now
		     );
	~KeysetManager();

	/** Mint::KeysetManager::load
	 *
	 * @brief creates the tables, loads or creates
	 * the seed, re-derives every stored keyset and
	 * derives counter 0 of each configured unit
	 * that has no active keyset yet.
	 *
	 * @desc Fails with a `std::runtime_error` if a
	 * stored keyset does not match what the seed
	 * derives.
	 */
	Ev::Io<void> load();

	/* Pure function of the seed, unit, counter and
	 * the configured max order.  */
	Cashu::Keyset derive_keyset( std::string const& unit
				   , std::uint32_t counter
				   ) const;

	/* These throw Mint::Failure.  */
	Cashu::Keyset const& get_active(std::string const& unit) const;
	Cashu::Keyset const& get_by_id(std::string const& id) const;
	/** Mint::KeysetManager::get_for_verification
	 *
	 * @brief like `get_by_id`, but an inactive
	 * keyset is refused (`InactiveKeyset`) once
	 * it has been inactive longer than the
	 * configured retention.
	 */
	Cashu::Keyset const& get_for_verification(std::string const& id) const;

	bool is_active(std::string const& id) const;

	/** Mint::KeysetManager::rotate
	 *
	 * @brief derives the next keyset of the unit,
	 * makes it active and retires the previous
	 * one, in a single transaction.
	 */
	Ev::Io<Cashu::Keyset> rotate(std::string const& unit);

	/* Ordered by unit, then counter.  */
	std::vector<KeysetInfo> list() const;
	/* Units with an active keyset.  */
	std::vector<std::string> units() const;

	/* Public key of the seed's master key, the
	 * identity this mint advertises.  */
	Secp256k1::PubKey mint_pubkey() const;
};

}

#endif /* !defined(MINT_KEYSETMANAGER_HPP) */
