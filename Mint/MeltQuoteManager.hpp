#ifndef MINT_MELTQUOTEMANAGER_HPP
#define MINT_MELTQUOTEMANAGER_HPP

#include"Cashu/BlindedMessage.hpp"
#include"Cashu/Proof.hpp"
#include"Ln/Amount.hpp"
#include"Ln/Preimage.hpp"
#include"Mint/MeltQuote.hpp"
#include"Sqlite3/Db.hpp"
#include<functional>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Mint { class BlindSigner; }
namespace Mint { class KeysetManager; }
namespace Mint { class ProofTracker; }
namespace Mint { namespace Lightning { class BackendIF; }}
namespace Mint { namespace Lightning { struct PaymentResult; }}
namespace Mint { struct Config; }
namespace S { class Bus; }
namespace Sqlite3 { class Tx; }

namespace Mint {

/** class Mint::MeltQuoteManager
 *
 * @brief the melt path: quote an invoice, then
 * take proofs, pay the invoice and return change.
 *
 * @desc A melt runs in three steps.
 * The quote and its inputs are first reserved
 * (Pending) in one transaction.
 * The invoice is then paid with no transaction
 * held.
 * Finally the result is committed: inputs Spent
 * and quote Paid, or everything back to Unspent
 * and Unpaid if the payment definitely failed.
 * If the outcome is not known, everything stays
 * Pending until `get_melt_quote` learns it from
 * the backend.
 */
class MeltQuoteManager {
private:
	S::Bus& bus;
	Sqlite3::Db db;
	Mint::Config const& config;
	KeysetManager const& keysets;
	BlindSigner& signer;
	ProofTracker& tracker;
	Lightning::BackendIF& backend;
	std::function<double()> get_now;

	Ev::Io<MeltQuote> settle_paid( std::string const& id
				     , Ln::Preimage const& preimage
				     , Ln::Amount fee_paid
				     );
	Ev::Io<MeltQuote> settle_failed(std::string const& id);
	Ev::Io<MeltQuote> reload(std::string const& id);

public:
	MeltQuoteManager() =delete;
	MeltQuoteManager( S::Bus& bus_
			, Sqlite3::Db db_
			, Mint::Config const& config_
			, KeysetManager const& keysets_
			, BlindSigner& signer_
			, ProofTracker& tracker_
			, Lightning::BackendIF& backend_
			, std::function<double()> get_now_
			) : bus(bus_)
			  , db(std::move(db_))
			  , config(config_)
			  , keysets(keysets_)
			  , signer(signer_)
			  , tracker(tracker_)
			  , backend(backend_)
			  , get_now(std::move(get_now_))
			  { }

	Ev::Io<void> init();

	Ev::Io<MeltQuote> create_melt_quote( std::string const& request
					   , std::string const& unit
					   );

	/** Mint::MeltQuoteManager::get_melt_quote
	 *
	 * @brief returns the quote, first settling it
	 * if it is Pending and the backend now knows
	 * how the payment ended.
	 */
	Ev::Io<MeltQuote> get_melt_quote(std::string const& id);

	/** Mint::MeltQuoteManager::melt
	 *
	 * @brief spends the inputs to pay the quoted
	 * invoice.
	 * Change is signed onto the given blank
	 * outputs, largest denominations first.
	 *
	 * @desc Fails with `PaymentFailed` after the
	 * inputs are released, or `PaymentUncertain`
	 * with the inputs still Pending.
	 */
	Ev::Io<MeltQuote> melt( std::string const& id
			      , std::vector<Cashu::Proof> const& inputs
			      , std::vector<Cashu::BlindedMessage> const& outputs
			      );

	/* Ids of Pending quotes.  */
	Ev::Io<std::vector<std::string>> pending();
	/* Deletes Unpaid quotes that expired before
	 * the given time; returns how many.  */
	Ev::Io<std::size_t> prune(double before);

	/* Throws QuoteNotFound.  */
	static
	MeltQuote load(Sqlite3::Tx& tx, std::string const& id);
	static
	void save(Sqlite3::Tx& tx, MeltQuote const& q);
};

}

#endif /* !defined(MINT_MELTQUOTEMANAGER_HPP) */
