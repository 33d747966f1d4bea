#include"Ev/Io.hpp"
#include"Mint/BlindSigner.hpp"
#include"Mint/Config.hpp"
#include"Mint/Error.hpp"
#include"Mint/KeysetManager.hpp"
#include"Mint/Lightning/BackendIF.hpp"
#include"Mint/MintQuoteManager.hpp"
#include"Mint/log.hpp"
#include"Mint/units.hpp"
#include"Mint/validate.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Uuid.hpp"
#include<memory>
#include<sstream>

namespace {

void check_limits( Mint::Config const& config
		 , std::uint64_t amount
		 ) {
	auto os = std::ostringstream();
	if (amount == 0)
		os << "amount must be positive";
	else if (config.mint_min_amount != 0 && amount < config.mint_min_amount)
		os << "amount " << amount << " below minimum "
		   << config.mint_min_amount;
	else if (config.mint_max_amount != 0 && amount > config.mint_max_amount)
		os << "amount " << amount << " above maximum "
		   << config.mint_max_amount;
	else
		return;
	throw Mint::Failure(Mint::ErrorCode_AmountOutOfLimit, os.str());
}

}

namespace Mint {

Ev::Io<void> MintQuoteManager::init() {
	return db.transact().then([](Sqlite3::Tx tx) {
		tx.query_execute(R"QRY(
		CREATE TABLE IF NOT EXISTS "MintQuotes"
		     ( id TEXT PRIMARY KEY
		     , unit TEXT NOT NULL
		     , amount INTEGER NOT NULL
		     , request TEXT NOT NULL
		     , payment_hash TEXT NOT NULL
		     , state TEXT NOT NULL
		     , expiry REAL NOT NULL
		     , created REAL NOT NULL
		     );
		CREATE INDEX IF NOT EXISTS "MintQuotes_state_idx"
		    ON "MintQuotes"(state, expiry);
		)QRY");
		tx.commit();
		return Ev::lift();
	});
}

MintQuote MintQuoteManager::load(Sqlite3::Tx& tx, std::string const& id) {
	auto fetch = tx.query(R"QRY(
	SELECT unit, amount, request, payment_hash, state, expiry, created
	  FROM "MintQuotes"
	 WHERE id = :id;
	)QRY")
		.bind(":id", id)
		.execute()
		;
	for (auto& r : fetch) {
		auto q = MintQuote();
		q.id = id;
		q.unit = r.get<std::string>(0);
		q.amount = r.get<std::uint64_t>(1);
		q.request = r.get<std::string>(2);
		q.payment_hash = Sha256::Hash(r.get<std::string>(3));
		q.state = mint_quote_state_from_name(r.get<std::string>(4));
		q.expiry = r.get<double>(5);
		q.created = r.get<double>(6);
		return q;
	}
	throw Mint::Failure(ErrorCode_QuoteNotFound, "mint quote " + id);
}

Ev::Io<MintQuote>
MintQuoteManager::create_mint_quote( std::uint64_t amount
				   , std::string const& unit
				   ) {
	return Ev::lift().then([this, amount, unit]() {
		/* Throws UnsupportedUnit.  */
		keysets.get_active(unit);
		auto msat = to_msat(amount, unit);
		check_limits(config, amount);

		auto os = std::ostringstream();
		os << "clmint: " << amount << " " << unit;
		return backend.create_invoice( msat, os.str()
					     , config.mint_quote_expiry
					     );
	}).then([this, amount, unit](Lightning::Invoice inv) {
		auto q = MintQuote();
		q.id = std::string(Uuid::random());
		q.unit = unit;
		q.amount = amount;
		q.request = inv.request;
		q.payment_hash = inv.payment_hash;
		q.state = MintQuoteState_Unpaid;
		q.expiry = inv.expiry;
		q.created = get_now();
		return db.transact().then([this, q](Sqlite3::Tx tx) {
			tx.query(R"QRY(
			INSERT INTO "MintQuotes"
			VALUES( :id, :unit, :amount, :request
			      , :payment_hash, :state, :expiry, :created
			      );
			)QRY")
				.bind(":id", q.id)
				.bind(":unit", q.unit)
				.bind(":amount", q.amount)
				.bind(":request", q.request)
				.bind(":payment_hash", std::string(q.payment_hash))
				.bind(":state", mint_quote_state_name(q.state))
				.bind(":expiry", q.expiry)
				.bind(":created", q.created)
				.execute()
				;
			tx.commit();
			return Mint::log( bus, Debug
					, "MintQuoteManager: %s: UNPAID, "
					  "%llu %s."
					, q.id.c_str()
					, (unsigned long long) q.amount
					, q.unit.c_str()
					);
		}).then([q]() {
			return Ev::lift(q);
		});
	});
}

Ev::Io<void> MintQuoteManager::mark_paid(std::string const& id) {
	return db.transact().then([this, id](Sqlite3::Tx tx) {
		auto q = load(tx, id);
		if (q.state != MintQuoteState_Unpaid) {
			tx.commit();
			return Ev::lift();
		}
		tx.query(R"QRY(
		UPDATE "MintQuotes"
		   SET state = 'PAID'
		 WHERE id = :id
		   AND state = 'UNPAID';
		)QRY")
			.bind(":id", id)
			.execute()
			;
		tx.commit();
		return Mint::log( bus, Debug
				, "MintQuoteManager: %s: UNPAID -> PAID."
				, id.c_str()
				);
	});
}

Ev::Io<MintQuote>
MintQuoteManager::poll_mint_quote(std::string const& id) {
	return db.transact().then([id](Sqlite3::Tx tx) {
		auto q = load(tx, id);
		tx.commit();
		return Ev::lift(q);
	}).then([this, id](MintQuote q) {
		if (q.state != MintQuoteState_Unpaid)
			return Ev::lift(q);
		return backend.invoice_status(q.payment_hash
					     ).then([this, id](Lightning::InvoiceStatus s) {
			if (s != Lightning::InvoiceStatus_Paid)
				return Ev::lift();
			return mark_paid(id);
		}).then([this, id]() {
			return db.transact();
		}).then([id](Sqlite3::Tx tx) {
			auto q = load(tx, id);
			tx.commit();
			return Ev::lift(q);
		});
	});
}

Ev::Io<std::vector<Cashu::BlindedSignature>>
MintQuoteManager::issue( std::string const& id
		       , std::vector<Cashu::BlindedMessage> const& outputs
		       ) {
	return poll_mint_quote(id).then([this](MintQuote) {
		return db.transact();
	}).then([this, id, outputs](Sqlite3::Tx tx) {
		auto q = load(tx, id);
		if (q.state == MintQuoteState_Issued)
			throw Mint::Failure( ErrorCode_QuoteAlreadyIssued
					   , "mint quote " + id
					   );
		if (q.state == MintQuoteState_Unpaid) {
			if (get_now() >= q.expiry)
				throw Mint::Failure( ErrorCode_QuoteExpired
						   , "mint quote " + id
						   );
			throw Mint::Failure( ErrorCode_QuoteNotPaid
					   , "mint quote " + id
					   );
		}

		auto total = check_outputs(keysets, outputs, q.unit);
		if (total != q.amount) {
			auto os = std::ostringstream();
			os << "outputs total " << total
			   << ", quote is for " << q.amount;
			throw Mint::Failure(ErrorCode_AmountMismatch, os.str());
		}

		auto sigs = signer.sign_all(outputs);

		tx.query(R"QRY(
		UPDATE "MintQuotes"
		   SET state = 'ISSUED'
		 WHERE id = :id
		   AND state = 'PAID';
		)QRY")
			.bind(":id", id)
			.execute()
			;
		tx.commit();

		return Mint::log( bus, Debug
				, "MintQuoteManager: %s: PAID -> ISSUED, "
				  "%zu signatures."
				, id.c_str(), sigs.size()
				).then([sigs]() {
			return Ev::lift(sigs);
		});
	});
}

Ev::Io<std::vector<std::string>> MintQuoteManager::unpaid() {
	return db.transact().then([this](Sqlite3::Tx tx) {
		auto rv = std::vector<std::string>();
		auto fetch = tx.query(R"QRY(
		SELECT id FROM "MintQuotes"
		 WHERE state = 'UNPAID'
		   AND expiry > :now;
		)QRY")
			.bind(":now", get_now())
			.execute()
			;
		for (auto& r : fetch)
			rv.push_back(r.get<std::string>(0));
		tx.commit();
		return Ev::lift(std::move(rv));
	});
}

Ev::Io<bool> MintQuoteManager::prune_one(std::string const& id) {
	return poll_mint_quote(id).then([this, id](MintQuote q) {
		if (q.state != MintQuoteState_Unpaid)
			return Ev::lift(false);
		return db.transact().then([id](Sqlite3::Tx tx) {
			tx.query(R"QRY(
			DELETE FROM "MintQuotes"
			 WHERE id = :id
			   AND state = 'UNPAID';
			)QRY")
				.bind(":id", id)
				.execute()
				;
			auto deleted = tx.changes() == 1;
			tx.commit();
			return Ev::lift(deleted);
		});
	}).catching<std::exception>([this, id](std::exception const& e) {
		return Mint::log( bus, Warn
				, "MintQuoteManager: keeping expired %s: %s"
				, id.c_str(), e.what()
				).then([]() {
			return Ev::lift(false);
		});
	});
}

Ev::Io<std::size_t> MintQuoteManager::prune(double before) {
	return db.transact().then([this, before](Sqlite3::Tx tx) {
		auto ids = std::vector<std::string>();
		auto fetch = tx.query(R"QRY(
		SELECT id FROM "MintQuotes"
		 WHERE state = 'UNPAID'
		   AND expiry < :before;
		)QRY")
			.bind(":before", before)
			.execute()
			;
		for (auto& r : fetch)
			ids.push_back(r.get<std::string>(0));
		tx.commit();

		auto count = std::make_shared<std::size_t>(0);
		auto act = Ev::lift();
		for (auto const& id : ids)
			act += prune_one(id).then([count](bool deleted) {
				if (deleted)
					++*count;
				return Ev::lift();
			});
		return act.then([count]() {
			return Ev::lift(*count);
		});
	});
}

}
