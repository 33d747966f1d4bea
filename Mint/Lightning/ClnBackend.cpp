#include"Ev/Io.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Ln/Bolt11.hpp"
#include"Mint/Error.hpp"
#include"Mint/Lightning/ClnBackend.hpp"
#include"Mint/Lightning/fee_reserve.hpp"
#include"Mint/Mod/Rpc.hpp"
#include"Mint/Mod/Waiter.hpp"
#include"Mint/log.hpp"
#include"Util/Str.hpp"
#include"Uuid.hpp"

namespace {

Mint::Failure backend_unavailable( char const* command
			       , Jsmn::Object const& res
			       ) {
	return Mint::Failure( Mint::ErrorCode_BackendUnavailable
			  , std::string("unexpected `") + command + "` result: "
			  + Util::Str::show(res)
			  );
}

}

namespace Mint { namespace Lightning {

Ev::Io<Invoice>
ClnBackend::create_invoice( Ln::Amount amount
			  , std::string const& description
			  , double expiry
			  ) {
	auto label = "clmint-" + std::string(Uuid::random());
	auto parms = Json::Out()
		.start_object()
			.field("amount_msat", amount.to_msat())
			.field("label", label)
			.field("description", description)
			.field("expiry", std::uint64_t(expiry))
		.end_object()
		;
	return rpc.command("invoice", std::move(parms)
			  ).then([](Jsmn::Object res) {
		try {
			auto rv = Invoice();
			rv.request = std::string(res["bolt11"]);
			rv.payment_hash = Sha256::Hash(std::string(
				res["payment_hash"]
			));
			rv.expiry = double(res["expires_at"]);
			return Ev::lift(std::move(rv));
		} catch (std::invalid_argument const&) {
			throw backend_unavailable("invoice", res);
		}
	}).catching<Mint::Mod::RpcError>([](Mint::Mod::RpcError const& e) {
		throw Mint::Failure(ErrorCode_BackendUnavailable, e.what());
		return Ev::lift(Invoice());
	});
}

Ev::Io<InvoiceStatus>
ClnBackend::invoice_status(Sha256::Hash const& payment_hash) {
	auto parms = Json::Out()
		.start_object()
			.field("payment_hash", std::string(payment_hash))
		.end_object()
		;
	return rpc.command("listinvoices", std::move(parms)
			  ).then([](Jsmn::Object res) {
		try {
			auto invoices = res["invoices"];
			if (!invoices.is_array())
				throw Jsmn::TypeError();
			/* Deleted under us: it can no longer be paid.  */
			if (invoices.size() == 0)
				return Ev::lift(InvoiceStatus_Expired);
			auto status = std::string(invoices[0]["status"]);
			if (status == "paid")
				return Ev::lift(InvoiceStatus_Paid);
			if (status == "expired")
				return Ev::lift(InvoiceStatus_Expired);
			return Ev::lift(InvoiceStatus_Unpaid);
		} catch (std::invalid_argument const&) {
			throw backend_unavailable("listinvoices", res);
		}
	}).catching<Mint::Mod::RpcError>([](Mint::Mod::RpcError const& e) {
		throw Mint::Failure(ErrorCode_BackendUnavailable, e.what());
		return Ev::lift(InvoiceStatus_Unpaid);
	});
}

Ev::Io<Ln::Amount>
ClnBackend::estimate_fee( std::string const& request
			, Ln::Amount amount
			) {
	return Ev::lift(fee_reserve(config, amount));
}

Ev::Io<PaymentResult>
ClnBackend::pay( std::string const& request
	       , Ln::Amount amount
	       , Ln::Amount max_fee
	       ) {
	auto payment_hash = Ln::Bolt11::decode(request).payment_hash;
	auto parms = Json::Out()
		.start_object()
			.field("bolt11", request)
			.field("maxfee", max_fee.to_msat())
			.field("retry_for", std::uint64_t(config.pay_timeout))
		.end_object()
		;
	auto act = rpc.command("pay", std::move(parms)
			      ).then([this, payment_hash](Jsmn::Object res) {
		try {
			auto status = std::string(res["status"]);
			if (status != "complete")
				return payment_status(payment_hash);
			auto rv = PaymentResult();
			rv.status = PaymentStatus_Succeeded;
			rv.preimage = Ln::Preimage(std::string(
				res["payment_preimage"]
			));
			rv.fee_paid = Ln::Amount::object(res["amount_sent_msat"])
				    - Ln::Amount::object(res["amount_msat"])
				    ;
			return Ev::lift(rv);
		} catch (std::invalid_argument const&) {
			return Mint::log( bus, Warn
					, "ClnBackend: unexpected `pay` "
					  "result: %s"
					, Util::Str::show(res).c_str()
					).then([this, payment_hash]() {
				return payment_status(payment_hash);
			});
		}
	}).catching<Mint::Mod::RpcError>([ this
					 , payment_hash
					 ](Mint::Mod::RpcError const& e) {
		return Mint::log( bus, Warn
				, "ClnBackend: pay %s: %s"
				, std::string(payment_hash).c_str()
				, e.what()
				).then([this, payment_hash]() {
			return payment_status(payment_hash);
		}).then([](PaymentResult r) {
			/* `pay` has returned, so nothing is in flight
			 * unless listpays says so.  */
			if (r.status == PaymentStatus_Unknown)
				r.status = PaymentStatus_Failed;
			if (r.status == PaymentStatus_InFlight)
				r.status = PaymentStatus_Uncertain;
			return Ev::lift(r);
		});
	});

	return waiter.timed( config.pay_timeout, std::move(act)
			   ).catching<Mint::Mod::Waiter::TimedOut>([ this
								   , payment_hash
								   ](Mint::Mod::Waiter::TimedOut const&) {
		return Mint::log( bus, Warn
				, "ClnBackend: pay %s: timed out"
				, std::string(payment_hash).c_str()
				).then([]() {
			auto rv = PaymentResult();
			rv.status = PaymentStatus_Uncertain;
			return Ev::lift(rv);
		});
	});
}

Ev::Io<PaymentResult>
ClnBackend::payment_status(Sha256::Hash const& payment_hash) {
	auto parms = Json::Out()
		.start_object()
			.field("payment_hash", std::string(payment_hash))
		.end_object()
		;
	return rpc.command("listpays", std::move(parms)
			  ).then([](Jsmn::Object res) {
		auto rv = PaymentResult();
		rv.status = PaymentStatus_Unknown;
		try {
			auto pays = res["pays"];
			if (!pays.is_array())
				throw Jsmn::TypeError();
			auto any_pending = false;
			auto any_failed = false;
			for (auto pay : pays) {
				auto status = std::string(pay["status"]);
				if (status == "complete") {
					rv.status = PaymentStatus_Succeeded;
					rv.preimage = Ln::Preimage(std::string(
						pay["preimage"]
					));
					rv.fee_paid = Ln::Amount::object(pay["amount_sent_msat"])
						    - Ln::Amount::object(pay["amount_msat"])
						    ;
					return Ev::lift(rv);
				} else if (status == "pending")
					any_pending = true;
				else if (status == "failed")
					any_failed = true;
			}
			if (any_pending)
				rv.status = PaymentStatus_InFlight;
			else if (any_failed)
				rv.status = PaymentStatus_Failed;
			return Ev::lift(rv);
		} catch (std::invalid_argument const&) {
			throw backend_unavailable("listpays", res);
		}
	}).catching<Mint::Mod::RpcError>([](Mint::Mod::RpcError const& e) {
		throw Mint::Failure(ErrorCode_BackendUnavailable, e.what());
		return Ev::lift(PaymentResult());
	});
}

}}
