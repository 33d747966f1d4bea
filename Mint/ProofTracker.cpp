#include"Ev/Io.hpp"
#include"Mint/Error.hpp"
#include"Mint/ProofTracker.hpp"
#include"Sqlite3.hpp"

namespace Mint {

Ev::Io<void> ProofTracker::init() {
	return db.transact().then([](Sqlite3::Tx tx) {
		tx.query_execute(R"QRY(
		CREATE TABLE IF NOT EXISTS "MintProofs"
		     ( y TEXT PRIMARY KEY
		     , amount INTEGER NOT NULL
		     , keyset_id TEXT NOT NULL
		     , secret TEXT NOT NULL
		     , c TEXT NOT NULL
		     , state TEXT NOT NULL
		     , melt_quote TEXT NOT NULL
		     , updated REAL NOT NULL
		     );
		CREATE INDEX IF NOT EXISTS "MintProofs_quote_idx"
		    ON "MintProofs"(melt_quote, state);
		)QRY");
		tx.commit();
		return Ev::lift();
	});
}

Ev::Io<std::vector<Cashu::ProofState>>
ProofTracker::check_state(std::vector<std::string> const& Ys) {
	return db.transact().then([Ys](Sqlite3::Tx tx) {
		auto rv = std::vector<Cashu::ProofState>();
		for (auto const& Y : Ys) {
			auto state = Cashu::ProofState_Unspent;
			auto fetch = tx.query(R"QRY(
			SELECT state FROM "MintProofs" WHERE y = :y;
			)QRY")
				.bind(":y", Y)
				.execute()
				;
			for (auto& r : fetch)
				state = Cashu::proof_state_from_name(
					r.get<std::string>(0)
				);
			rv.push_back(state);
		}
		tx.commit();
		return Ev::lift(std::move(rv));
	});
}

bool ProofTracker::cas( Sqlite3::Tx& tx
		      , std::string const& Y
		      , Cashu::Proof const* proof
		      , Cashu::ProofState from
		      , Cashu::ProofState to
		      , std::string const& melt_quote
		      ) {
	auto found = false;
	auto state = Cashu::ProofState_Unspent;
	auto fetch = tx.query(R"QRY(
	SELECT state FROM "MintProofs" WHERE y = :y;
	)QRY")
		.bind(":y", Y)
		.execute()
		;
	for (auto& r : fetch) {
		found = true;
		state = Cashu::proof_state_from_name(r.get<std::string>(0));
	}
	if (state != from)
		return false;
	if (from == to)
		return true;
	/* Spent is final.  */
	if (from == Cashu::ProofState_Spent)
		return false;

	if (found) {
		tx.query(R"QRY(
		UPDATE "MintProofs"
		   SET state = :state
		     , melt_quote = :quote
		     , updated = :now
		 WHERE y = :y
		   AND state = :from;
		)QRY")
			.bind(":y", Y)
			.bind(":from", Cashu::proof_state_name(from))
			.bind(":state", Cashu::proof_state_name(to))
			.bind(":quote", melt_quote)
			.bind(":now", get_now())
			.execute()
			;
		return tx.changes() == 1;
	} else {
		auto q = tx.query(R"QRY(
		INSERT INTO "MintProofs"
		VALUES(:y, :amount, :id, :secret, :c, :state, :quote, :now);
		)QRY");
		q.bind(":y", Y);
		if (proof) {
			q.bind(":amount", proof->amount);
			q.bind(":id", proof->id);
			q.bind(":secret", proof->secret);
			q.bind(":c", std::string(proof->C));
		} else {
			/* Only the fingerprint is known.  */
			q.bind(":amount", 0);
			q.bind(":id", "");
			q.bind(":secret", "");
			q.bind(":c", "");
		}
		q.bind(":state", Cashu::proof_state_name(to));
		q.bind(":quote", melt_quote);
		q.bind(":now", get_now());
		q.execute();
	}
	return true;
}

bool ProofTracker::transition( Sqlite3::Tx& tx
			     , std::string const& Y
			     , Cashu::ProofState from
			     , Cashu::ProofState to
			     ) {
	return cas(tx, Y, nullptr, from, to, "");
}

void ProofTracker::reserve( Sqlite3::Tx& tx
			  , std::vector<Cashu::Proof> const& proofs
			  , Cashu::ProofState to
			  , std::string const& melt_quote
			  ) {
	for (auto const& p : proofs) {
		auto Y = p.Y();
		if (!cas( tx, Y, &p
			, Cashu::ProofState_Unspent, to
			, melt_quote
			))
			throw Mint::Failure( ErrorCode_ProofNotUnspent
					   , "proof " + Y
					   );
	}
}

std::size_t ProofTracker::settle( Sqlite3::Tx& tx
				, std::string const& melt_quote
				, Cashu::ProofState from
				, Cashu::ProofState to
				) {
	auto Ys = std::vector<std::string>();
	auto fetch = tx.query(R"QRY(
	SELECT y FROM "MintProofs"
	 WHERE melt_quote = :quote
	   AND state = :state;
	)QRY")
		.bind(":quote", melt_quote)
		.bind(":state", Cashu::proof_state_name(from))
		.execute()
		;
	for (auto& r : fetch)
		Ys.push_back(r.get<std::string>(0));

	auto tag = (to == Cashu::ProofState_Unspent) ? std::string()
						      : melt_quote
						      ;
	auto count = std::size_t(0);
	for (auto const& Y : Ys)
		if (cas(tx, Y, nullptr, from, to, tag))
			++count;
	return count;
}

std::vector<Cashu::Proof>
ProofTracker::pending_for_quote( Sqlite3::Tx& tx
			       , std::string const& melt_quote
			       ) {
	auto rv = std::vector<Cashu::Proof>();
	auto fetch = tx.query(R"QRY(
	SELECT amount, keyset_id, secret, c FROM "MintProofs"
	 WHERE melt_quote = :quote
	   AND state = 'PENDING';
	)QRY")
		.bind(":quote", melt_quote)
		.execute()
		;
	for (auto& r : fetch)
		rv.push_back(Cashu::Proof{ r.get<std::uint64_t>(0)
					 , r.get<std::string>(1)
					 , r.get<std::string>(2)
					 , Secp256k1::PubKey(r.get<std::string>(3))
					 });
	return rv;
}

}
