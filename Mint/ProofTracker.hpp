#ifndef MINT_PROOFTRACKER_HPP
#define MINT_PROOFTRACKER_HPP

#include"Cashu/Proof.hpp"
#include"Cashu/ProofState.hpp"
#include"Sqlite3/Db.hpp"
#include<functional>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Sqlite3 { class Tx; }

namespace Mint {

/** class Mint::ProofTracker
 *
 * @brief the ledger of every proof the mint has
 * seen, keyed by its fingerprint `Y`.
 *
 * @desc A fingerprint never seen is Unspent.
 * Every state change is a compare-and-set made
 * inside a transaction the caller owns, so that
 * it commits or rolls back together with the
 * rest of the operation.
 */
class ProofTracker {
private:
	Sqlite3::Db db;
	std::function<double()> get_now;

	bool cas( Sqlite3::Tx& tx
		, std::string const& Y
		, Cashu::Proof const* proof
		, Cashu::ProofState from
		, Cashu::ProofState to
		, std::string const& melt_quote
		);

public:
	ProofTracker() =delete;
	ProofTracker( Sqlite3::Db db_
		    , std::function<double()> get_now_
		    ) : db(std::move(db_))
		      , get_now(std::move(get_now_))
		      { }

	Ev::Io<void> init();

	/* One state per fingerprint, in the same order.  */
	Ev::Io<std::vector<Cashu::ProofState>>
	check_state(std::vector<std::string> const& Ys);

	/** Mint::ProofTracker::transition
	 *
	 * @brief moves the fingerprint from `from` to
	 * `to` if it is currently in `from`.
	 * Returns false, changing nothing, otherwise.
	 */
	bool transition( Sqlite3::Tx& tx
		       , std::string const& Y
		       , Cashu::ProofState from
		       , Cashu::ProofState to
		       );

	/** Mint::ProofTracker::reserve
	 *
	 * @brief moves every proof from Unspent to
	 * `to`, tagging them with the melt quote if
	 * any.
	 * Throws `ProofNotUnspent` on the first proof
	 * that is not Unspent; the caller must then
	 * drop the transaction.
	 */
	void reserve( Sqlite3::Tx& tx
		    , std::vector<Cashu::Proof> const& proofs
		    , Cashu::ProofState to
		    , std::string const& melt_quote = ""
		    );

	/** Mint::ProofTracker::settle
	 *
	 * @brief moves every proof reserved by the
	 * melt quote from `from` to `to`.
	 * Moving back to Unspent releases them from
	 * the quote.
	 * Returns the number of proofs moved.
	 */
	std::size_t settle( Sqlite3::Tx& tx
			  , std::string const& melt_quote
			  , Cashu::ProofState from
			  , Cashu::ProofState to
			  );

	/* Proofs currently Pending for the melt quote.  */
	std::vector<Cashu::Proof>
	pending_for_quote( Sqlite3::Tx& tx
			 , std::string const& melt_quote
			 );
};

}

#endif /* !defined(MINT_PROOFTRACKER_HPP) */
