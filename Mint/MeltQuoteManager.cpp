#include"Cashu/split.hpp"
#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/Bolt11.hpp"
#include"Mint/BlindSigner.hpp"
#include"Mint/Config.hpp"
#include"Mint/Error.hpp"
#include"Mint/KeysetManager.hpp"
#include"Mint/Lightning/BackendIF.hpp"
#include"Mint/MeltQuoteManager.hpp"
#include"Mint/ProofTracker.hpp"
#include"Mint/log.hpp"
#include"Mint/units.hpp"
#include"Mint/validate.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"Uuid.hpp"
#include<algorithm>
#include<sstream>

namespace {

Jsmn::Object parse(std::string const& text) {
	auto is = std::istringstream(text);
	auto rv = Jsmn::Object();
	is >> rv;
	return rv;
}

template<typename a>
std::string to_text(std::vector<a> const& items) {
	auto rv = Json::Out();
	auto arr = rv.start_array();
	for (auto const& i : items)
		arr.entry(i.json());
	arr.end_array();
	return rv.output();
}

void check_limits( Mint::Config const& config
		 , std::uint64_t amount
		 ) {
	auto os = std::ostringstream();
	if (amount == 0)
		os << "amount must be positive";
	else if (config.melt_min_amount != 0 && amount < config.melt_min_amount)
		os << "amount " << amount << " below minimum "
		   << config.melt_min_amount;
	else if (config.melt_max_amount != 0 && amount > config.melt_max_amount)
		os << "amount " << amount << " above maximum "
		   << config.melt_max_amount;
	else
		return;
	throw Mint::Failure(Mint::ErrorCode_AmountOutOfLimit, os.str());
}

}

namespace Mint {

Ev::Io<void> MeltQuoteManager::init() {
	return db.transact().then([](Sqlite3::Tx tx) {
		tx.query_execute(R"QRY(
		CREATE TABLE IF NOT EXISTS "MeltQuotes"
		     ( id TEXT PRIMARY KEY
		     , unit TEXT NOT NULL
		     , amount INTEGER NOT NULL
		     , fee_reserve INTEGER NOT NULL
		     , request TEXT NOT NULL
		     , payment_hash TEXT NOT NULL
		     , state TEXT NOT NULL
		     , expiry REAL NOT NULL
		     , created REAL NOT NULL
		     , preimage TEXT NOT NULL
		     , fee_paid INTEGER NOT NULL
		     , outputs TEXT NOT NULL
		     , change TEXT NOT NULL
		     , pending_since REAL NOT NULL
		     );
		CREATE INDEX IF NOT EXISTS "MeltQuotes_state_idx"
		    ON "MeltQuotes"(state, expiry);
		)QRY");
		tx.commit();
		return Ev::lift();
	});
}

MeltQuote MeltQuoteManager::load(Sqlite3::Tx& tx, std::string const& id) {
	auto fetch = tx.query(R"QRY(
	SELECT unit, amount, fee_reserve, request, payment_hash
	     , state, expiry, created, preimage, fee_paid
	     , outputs, change, pending_since
	  FROM "MeltQuotes"
	 WHERE id = :id;
	)QRY")
		.bind(":id", id)
		.execute()
		;
	for (auto& r : fetch) {
		auto q = MeltQuote();
		q.id = id;
		q.unit = r.get<std::string>(0);
		q.amount = r.get<std::uint64_t>(1);
		q.fee_reserve = r.get<std::uint64_t>(2);
		q.request = r.get<std::string>(3);
		q.payment_hash = Sha256::Hash(r.get<std::string>(4));
		q.state = melt_quote_state_from_name(r.get<std::string>(5));
		q.expiry = r.get<double>(6);
		q.created = r.get<double>(7);
		auto preimage = r.get<std::string>(8);
		if (!preimage.empty())
			q.preimage = Ln::Preimage(preimage);
		q.fee_paid = r.get<std::uint64_t>(9);
		for (auto o : parse(r.get<std::string>(10)))
			q.outputs.push_back(Cashu::BlindedMessage::object(o));
		for (auto c : parse(r.get<std::string>(11)))
			q.change.push_back(Cashu::BlindedSignature::object(c));
		q.pending_since = r.get<double>(12);
		return q;
	}
	throw Mint::Failure(ErrorCode_QuoteNotFound, "melt quote " + id);
}

void MeltQuoteManager::save(Sqlite3::Tx& tx, MeltQuote const& q) {
	tx.query(R"QRY(
	INSERT OR REPLACE INTO "MeltQuotes"
	VALUES( :id, :unit, :amount, :fee_reserve, :request
	      , :payment_hash, :state, :expiry, :created
	      , :preimage, :fee_paid, :outputs, :change
	      , :pending_since
	      );
	)QRY")
		.bind(":id", q.id)
		.bind(":unit", q.unit)
		.bind(":amount", q.amount)
		.bind(":fee_reserve", q.fee_reserve)
		.bind(":request", q.request)
		.bind(":payment_hash", std::string(q.payment_hash))
		.bind(":state", melt_quote_state_name(q.state))
		.bind(":expiry", q.expiry)
		.bind(":created", q.created)
		.bind(":preimage", q.preimage ? std::string(q.preimage)
					      : std::string()
		     )
		.bind(":fee_paid", q.fee_paid)
		.bind(":outputs", to_text(q.outputs))
		.bind(":change", to_text(q.change))
		.bind(":pending_since", q.pending_since)
		.execute()
		;
}

Ev::Io<MeltQuote>
MeltQuoteManager::create_melt_quote( std::string const& request
				   , std::string const& unit
				   ) {
	return Ev::lift().then([this, request, unit]() {
		keysets.get_active(unit);
		if (!is_lightning_unit(unit))
			throw Mint::Failure( ErrorCode_UnsupportedUnit
					   , "unit " + unit
					   );

		auto invoice = Ln::Bolt11();
		try {
			invoice = Ln::Bolt11::decode(request);
		} catch (Ln::Bolt11DecodeError const& e) {
			throw Mint::Failure(ErrorCode_InvalidRequest, e.what());
		}
		if (!invoice.has_amount)
			throw Mint::Failure( ErrorCode_InvalidRequest
					   , "invoice has no amount"
					   );
		if (double(invoice.expires_at()) <= get_now())
			throw Mint::Failure( ErrorCode_InvalidRequest
					   , "invoice has expired"
					   );
		auto amount = from_msat(invoice.amount, unit);
		check_limits(config, amount);

		return backend.estimate_fee(request, invoice.amount
					   ).then([ this, request, unit
						  , invoice, amount
						  ](Ln::Amount fee) {
			auto q = MeltQuote();
			q.id = std::string(Uuid::random());
			q.unit = unit;
			q.amount = amount;
			q.fee_reserve = from_msat(fee, unit);
			q.request = request;
			q.payment_hash = invoice.payment_hash;
			q.state = MeltQuoteState_Unpaid;
			q.created = get_now();
			q.expiry = q.created + config.melt_quote_expiry;
			q.fee_paid = 0;
			q.pending_since = 0;
			return db.transact().then([this, q](Sqlite3::Tx tx) {
				save(tx, q);
				tx.commit();
				return Mint::log( bus, Debug
						, "MeltQuoteManager: %s: UNPAID, "
						  "%llu + %llu %s."
						, q.id.c_str()
						, (unsigned long long) q.amount
						, (unsigned long long) q.fee_reserve
						, q.unit.c_str()
						);
			}).then([q]() {
				return Ev::lift(q);
			});
		});
	});
}

Ev::Io<MeltQuote> MeltQuoteManager::reload(std::string const& id) {
	return db.transact().then([id](Sqlite3::Tx tx) {
		auto q = load(tx, id);
		tx.commit();
		return Ev::lift(q);
	});
}

Ev::Io<MeltQuote> MeltQuoteManager::get_melt_quote(std::string const& id) {
	return reload(id).then([this, id](MeltQuote q) {
		if (q.state != MeltQuoteState_Pending)
			return Ev::lift(q);
		auto reserved = q.pending_since;
		return backend.payment_status(q.payment_hash
					     ).then([this, id, reserved](Lightning::PaymentResult r) {
			switch (r.status) {
			case Lightning::PaymentStatus_Succeeded:
				return settle_paid(id, r.preimage, r.fee_paid);
			case Lightning::PaymentStatus_Failed:
				return settle_failed(id);
			case Lightning::PaymentStatus_Unknown:
				/* The node never heard of the payment.
				 * Past the pay timeout it will not start
				 * one on our behalf.  */
				if (get_now() - reserved < config.pay_timeout)
					return reload(id);
				return Mint::log( bus, Warn
						, "MeltQuoteManager: %s: node has no "
						  "record of the payment after %.0fs."
						, id.c_str(), config.pay_timeout
						).then([this, id]() {
					return settle_failed(id);
				});
			default:
				return reload(id);
			}
		}).catching<Mint::Failure>([this, id](Mint::Failure const& e) {
			if (e.get_code() != ErrorCode_BackendUnavailable)
				throw e;
			return Mint::log( bus, Warn
					, "MeltQuoteManager: %s: cannot check "
					  "payment: %s"
					, id.c_str(), e.what()
					).then([this, id]() {
				return reload(id);
			});
		});
	});
}

Ev::Io<MeltQuote>
MeltQuoteManager::melt( std::string const& id
		      , std::vector<Cashu::Proof> const& inputs
		      , std::vector<Cashu::BlindedMessage> const& outputs
		      ) {
	return db.transact().then([ this, id
				  , inputs, outputs
				  ](Sqlite3::Tx tx) {
		auto q = load(tx, id);
		if (q.state == MeltQuoteState_Pending)
			throw Mint::Failure(ErrorCode_QuotePending, "melt quote " + id);
		if (q.state == MeltQuoteState_Paid)
			throw Mint::Failure(ErrorCode_QuoteAlreadyPaid, "melt quote " + id);
		if (get_now() >= q.expiry)
			throw Mint::Failure(ErrorCode_QuoteExpired, "melt quote " + id);

		auto in = check_inputs(signer, keysets, inputs);
		if (in.unit != q.unit)
			throw Mint::Failure( ErrorCode_UnitMismatch
					   , "inputs are " + in.unit
					   + ", quote is " + q.unit
					   );
		if (in.amount < q.amount + q.fee_reserve) {
			auto os = std::ostringstream();
			os << "inputs total " << in.amount << ", need "
			   << q.amount << " + " << q.fee_reserve
			   << " fee reserve";
			throw Mint::Failure(ErrorCode_AmountMismatch, os.str());
		}
		check_blank_outputs(keysets, outputs, q.unit);

		tracker.reserve(tx, inputs, Cashu::ProofState_Pending, id);
		q.state = MeltQuoteState_Pending;
		q.pending_since = get_now();
		q.outputs = outputs;
		save(tx, q);
		tx.commit();

		return Mint::log( bus, Debug
				, "MeltQuoteManager: %s: UNPAID -> PENDING, "
				  "%zu inputs."
				, id.c_str(), inputs.size()
				).then([q]() {
			return Ev::lift(q);
		});
	}).then([this](MeltQuote q) {
		auto invoice = Ln::Bolt11::decode(q.request);
		return backend.pay( q.request, invoice.amount
				  , to_msat(q.fee_reserve, q.unit)
				  ).catching<Mint::Failure>([](Mint::Failure const& e) {
			/* We cannot tell whether the node started
			 * the payment.  */
			if (e.get_code() != ErrorCode_BackendUnavailable)
				throw e;
			auto r = Lightning::PaymentResult();
			r.status = Lightning::PaymentStatus_Uncertain;
			return Ev::lift(r);
		}).then([this, q](Lightning::PaymentResult r) {
			switch (r.status) {
			case Lightning::PaymentStatus_Succeeded:
				return settle_paid(q.id, r.preimage, r.fee_paid);
			case Lightning::PaymentStatus_Failed:
				return settle_failed(q.id
						    ).then([q](MeltQuote) -> Ev::Io<MeltQuote> {
					throw Mint::Failure( ErrorCode_PaymentFailed
							   , "melt quote " + q.id
							   );
				});
			default:
				return Mint::log( bus, Warn
						, "MeltQuoteManager: %s: payment "
						  "outcome unknown, left PENDING."
						, q.id.c_str()
						).then([q]() -> Ev::Io<MeltQuote> {
					throw Mint::Failure( ErrorCode_PaymentUncertain
							   , "melt quote " + q.id
							   );
				});
			}
		});
	});
}

Ev::Io<MeltQuote>
MeltQuoteManager::settle_paid( std::string const& id
			     , Ln::Preimage const& preimage
			     , Ln::Amount fee
			     ) {
	return db.transact().then([ this, id
				  , preimage, fee
				  ](Sqlite3::Tx tx) {
		auto q = load(tx, id);
		if (q.state != MeltQuoteState_Pending) {
			/* Someone else settled it.  */
			tx.commit();
			return Ev::lift(q);
		}

		auto inputs = tracker.pending_for_quote(tx, id);
		auto total = std::uint64_t(0);
		for (auto const& p : inputs)
			total += p.amount;
		tracker.settle( tx, id
			      , Cashu::ProofState_Pending
			      , Cashu::ProofState_Spent
			      );

		q.fee_paid = from_msat(fee, q.unit);
		auto spent = q.amount + q.fee_paid;
		auto change = (total > spent) ? (total - spent) : 0;
		auto denoms = Cashu::split(change);
		std::reverse(denoms.begin(), denoms.end());
		q.change.clear();
		for ( auto i = std::size_t(0)
		    ; i < denoms.size() && i < q.outputs.size()
		    ; ++i
		    ) {
			auto msg = q.outputs[i];
			msg.amount = denoms[i];
			if (!keysets.get_by_id(msg.id).has_amount(msg.amount))
				continue;
			q.change.push_back(signer.sign_retained(msg));
		}

		q.state = MeltQuoteState_Paid;
		q.preimage = preimage;
		q.outputs.clear();
		save(tx, q);
		tx.commit();

		return Mint::log( bus, Debug
				, "MeltQuoteManager: %s: PENDING -> PAID, "
				  "fee %llu, %zu change signatures."
				, id.c_str()
				, (unsigned long long) q.fee_paid
				, q.change.size()
				).then([q]() {
			return Ev::lift(q);
		});
	});
}

Ev::Io<MeltQuote> MeltQuoteManager::settle_failed(std::string const& id) {
	return db.transact().then([this, id](Sqlite3::Tx tx) {
		auto q = load(tx, id);
		if (q.state != MeltQuoteState_Pending) {
			tx.commit();
			return Ev::lift(q);
		}
		auto count = tracker.settle( tx, id
					   , Cashu::ProofState_Pending
					   , Cashu::ProofState_Unspent
					   );
		q.state = MeltQuoteState_Unpaid;
		q.outputs.clear();
		save(tx, q);
		tx.commit();

		return Mint::log( bus, Warn
				, "MeltQuoteManager: %s: payment failed, "
				  "PENDING -> UNPAID, %zu inputs released."
				, id.c_str(), count
				).then([q]() {
			return Ev::lift(q);
		});
	});
}

Ev::Io<std::vector<std::string>> MeltQuoteManager::pending() {
	return db.transact().then([](Sqlite3::Tx tx) {
		auto rv = std::vector<std::string>();
		auto fetch = tx.query(R"QRY(
		SELECT id FROM "MeltQuotes" WHERE state = 'PENDING';
		)QRY").execute();
		for (auto& r : fetch)
			rv.push_back(r.get<std::string>(0));
		tx.commit();
		return Ev::lift(std::move(rv));
	});
}

Ev::Io<std::size_t> MeltQuoteManager::prune(double before) {
	return db.transact().then([before](Sqlite3::Tx tx) {
		auto count = std::size_t(0);
		auto fetch = tx.query(R"QRY(
		SELECT COUNT(*) FROM "MeltQuotes"
		 WHERE state = 'UNPAID'
		   AND expiry < :before;
		)QRY")
			.bind(":before", before)
			.execute()
			;
		for (auto& r : fetch)
			count = r.get<std::size_t>(0);
		tx.query(R"QRY(
		DELETE FROM "MeltQuotes"
		 WHERE state = 'UNPAID'
		   AND expiry < :before;
		)QRY")
			.bind(":before", before)
			.execute()
			;
		tx.commit();
		return Ev::lift(count);
	});
}

}
