#ifndef MINT_MINTQUOTEMANAGER_HPP
#define MINT_MINTQUOTEMANAGER_HPP

#include"Cashu/BlindedMessage.hpp"
#include"Cashu/BlindedSignature.hpp"
#include"Mint/MintQuote.hpp"
#include"Sqlite3/Db.hpp"
#include<functional>
#include<string>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Mint { class BlindSigner; }
namespace Mint { class KeysetManager; }
namespace Mint { namespace Lightning { class BackendIF; }}
namespace Mint { struct Config; }
namespace S { class Bus; }
namespace Sqlite3 { class Tx; }

namespace Mint {

/** class Mint::MintQuoteManager
 *
 * @brief the mint path: quote, wait for the
 * invoice to be paid, issue blind signatures
 * exactly once.
 */
class MintQuoteManager {
private:
	S::Bus& bus;
	Sqlite3::Db db;
	Mint::Config const& config;
	KeysetManager const& keysets;
	BlindSigner& signer;
	Lightning::BackendIF& backend;
	std::function<double()> get_now;

	Ev::Io<void> mark_paid(std::string const& id);
	Ev::Io<bool> prune_one(std::string const& id);

public:
	MintQuoteManager() =delete;
	MintQuoteManager( S::Bus& bus_
			, Sqlite3::Db db_
			, Mint::Config const& config_
			, KeysetManager const& keysets_
			, BlindSigner& signer_
			, Lightning::BackendIF& backend_
			, std::function<double()> get_now_
			) : bus(bus_)
			  , db(std::move(db_))
			  , config(config_)
			  , keysets(keysets_)
			  , signer(signer_)
			  , backend(backend_)
			  , get_now(std::move(get_now_))
			  { }

	Ev::Io<void> init();

	Ev::Io<MintQuote> create_mint_quote( std::uint64_t amount
					   , std::string const& unit
					   );

	/** Mint::MintQuoteManager::poll_mint_quote
	 *
	 * @brief returns the quote, first asking the
	 * backend about it if it is still Unpaid and
	 * moving it to Paid if the invoice was paid.
	 */
	Ev::Io<MintQuote> poll_mint_quote(std::string const& id);

	/** Mint::MintQuoteManager::issue
	 *
	 * @brief signs the outputs against a Paid
	 * quote and marks it Issued in the same
	 * transaction.
	 * A quote is issued at most once.
	 */
	Ev::Io<std::vector<Cashu::BlindedSignature>>
	issue( std::string const& id
	     , std::vector<Cashu::BlindedMessage> const& outputs
	     );

	/* Ids of Unpaid quotes not yet expired.  */
	Ev::Io<std::vector<std::string>> unpaid();
	/* Deletes Unpaid quotes that expired before
	 * the given time, once the backend confirms
	 * the invoice was never paid; a paid one moves
	 * to Paid instead.  Returns how many were
	 * deleted.  */
	Ev::Io<std::size_t> prune(double before);

	/* Throws QuoteNotFound.  */
	static
	MintQuote load(Sqlite3::Tx& tx, std::string const& id);
};

}

#endif /* !defined(MINT_MINTQUOTEMANAGER_HPP) */
