#ifndef MINT_SWAPENGINE_HPP
#define MINT_SWAPENGINE_HPP

#include"Cashu/BlindedMessage.hpp"
#include"Cashu/BlindedSignature.hpp"
#include"Cashu/Proof.hpp"
#include"Sqlite3/Db.hpp"
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Mint { class BlindSigner; }
namespace Mint { class KeysetManager; }
namespace Mint { class ProofTracker; }
namespace S { class Bus; }

namespace Mint {

/** class Mint::SwapEngine
 *
 * @brief exchanges proofs for fresh blind
 * signatures of the same total, spending the
 * proofs and signing the outputs in one
 * transaction.
 */
class SwapEngine {
private:
	S::Bus& bus;
	Sqlite3::Db db;
	KeysetManager const& keysets;
	BlindSigner& signer;
	ProofTracker& tracker;

public:
	SwapEngine() =delete;
	SwapEngine( S::Bus& bus_
		  , Sqlite3::Db db_
		  , KeysetManager const& keysets_
		  , BlindSigner& signer_
		  , ProofTracker& tracker_
		  ) : bus(bus_)
		    , db(std::move(db_))
		    , keysets(keysets_)
		    , signer(signer_)
		    , tracker(tracker_)
		    { }

	Ev::Io<std::vector<Cashu::BlindedSignature>>
	swap( std::vector<Cashu::Proof> const& inputs
	    , std::vector<Cashu::BlindedMessage> const& outputs
	    );
};

}

#endif /* !defined(MINT_SWAPENGINE_HPP) */
