#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Ev/yield.hpp"
#include"Ln/Bolt11.hpp"
#include"Mint/Error.hpp"
#include"Mint/Lightning/FakeBackend.hpp"
#include"Mint/Lightning/fee_reserve.hpp"
#include"Secp256k1/PrivKey.hpp"
#include"Secp256k1/Random.hpp"
#include<memory>
#include<cstdint>

namespace Mint { namespace Lightning {

class FakeBackend::Impl {
public:
	Mint::Config config;
	bool auto_settle;

	Secp256k1::Random random;
	Secp256k1::PrivKey node_key;

	struct IncomingInvoice {
		Ln::Preimage preimage;
		Ln::Amount amount;
		double expiry;
		bool paid;
	};
	std::map<Sha256::Hash, IncomingInvoice> incoming;

	struct OutgoingPayment {
		PaymentResult result;
		unsigned int count = 0;
	};
	std::map<Sha256::Hash, OutgoingPayment> outgoing;

	PaymentStatus next_status;
	Ln::Amount next_fee;
	bool unreachable;

	Impl( Mint::Config const& config_
	    , bool auto_settle_
	    ) : config(config_)
	      , auto_settle(auto_settle_)
	      , node_key(random)
	      , next_status(PaymentStatus_Succeeded)
	      , next_fee(Ln::Amount::sat(0))
	      , unreachable(false)
	      { }

	std::string encode( Ln::Amount amount
			  , std::string const& description
			  , std::uint64_t expiry
			  , Ln::Preimage const& preimage
			  ) {
		auto inv = Ln::Bolt11();
		inv.currency = "bcrt";
		inv.has_amount = true;
		inv.amount = amount;
		inv.timestamp = Ev::now_seconds();
		inv.expiry = expiry;
		inv.payment_hash = preimage.sha256();
		inv.description = description;
		return inv.encode(node_key);
	}
};

FakeBackend::FakeBackend( Mint::Config const& config
			, bool auto_settle
			) : pimpl(std::make_unique<Impl>(config, auto_settle))
			  { }
FakeBackend::~FakeBackend() { }

Ev::Io<Invoice>
FakeBackend::create_invoice( Ln::Amount amount
			   , std::string const& description
			   , double expiry
			   ) {
	return Ev::lift().then([this, amount, description, expiry]() {
		auto preimage = Ln::Preimage(pimpl->random);
		auto request = pimpl->encode( amount, description
					    , std::uint64_t(expiry)
					    , preimage
					    );
		auto hash = preimage.sha256();
		auto abs_expiry = Ev::now() + expiry;
		pimpl->incoming[hash] = Impl::IncomingInvoice{
			preimage, amount, abs_expiry, pimpl->auto_settle
		};
		return Ev::lift(Invoice{request, hash, abs_expiry});
	});
}

Ev::Io<InvoiceStatus>
FakeBackend::invoice_status(Sha256::Hash const& payment_hash) {
	auto key = payment_hash;
	return Ev::yield().then([this, key]() {
		auto it = pimpl->incoming.find(key);
		if (it == pimpl->incoming.end())
			throw Mint::Failure( ErrorCode_BackendUnavailable
					 , "no invoice " + std::string(key)
					 );
		auto const& inv = it->second;
		if (inv.paid)
			return Ev::lift(InvoiceStatus_Paid);
		if (inv.expiry < Ev::now())
			return Ev::lift(InvoiceStatus_Expired);
		return Ev::lift(InvoiceStatus_Unpaid);
	});
}

Ev::Io<Ln::Amount>
FakeBackend::estimate_fee( std::string const& request
			 , Ln::Amount amount
			 ) {
	return Ev::lift(fee_reserve(pimpl->config, amount));
}

Ev::Io<PaymentResult>
FakeBackend::pay( std::string const& request
		, Ln::Amount amount
		, Ln::Amount max_fee
		) {
	/* Yield so that other greenthreads get to run while the
	 * "payment" is in flight.  */
	return Ev::yield(4).then([this, request, max_fee]() {
		if (pimpl->unreachable)
			throw Mint::Failure( ErrorCode_BackendUnavailable
					   , "fake node unreachable"
					   );
		auto inv = Ln::Bolt11::decode(request);
		auto key = inv.payment_hash;

		auto& out = pimpl->outgoing[key];
		++out.count;

		auto result = PaymentResult();
		result.status = pimpl->next_status;
		result.fee_paid = pimpl->next_fee;
		if (result.fee_paid > max_fee)
			result.status = PaymentStatus_Failed;
		if (result.status == PaymentStatus_Succeeded)
			result.preimage = Ln::Preimage(pimpl->random);
		out.result = result;
		return Ev::lift(result);
	});
}

Ev::Io<PaymentResult>
FakeBackend::payment_status(Sha256::Hash const& payment_hash) {
	auto key = payment_hash;
	return Ev::yield().then([this, key]() {
		auto it = pimpl->outgoing.find(key);
		if (it == pimpl->outgoing.end()) {
			auto rv = PaymentResult();
			rv.status = PaymentStatus_Unknown;
			return Ev::lift(rv);
		}
		auto rv = it->second.result;
		if (rv.status == PaymentStatus_Uncertain)
			rv.status = PaymentStatus_InFlight;
		return Ev::lift(rv);
	});
}

void FakeBackend::settle_invoice(Sha256::Hash const& payment_hash) {
	auto it = pimpl->incoming.find(payment_hash);
	if (it != pimpl->incoming.end())
		it->second.paid = true;
}

void FakeBackend::set_unreachable(bool unreachable) {
	pimpl->unreachable = unreachable;
}

void FakeBackend::set_next_pay(PaymentStatus status, Ln::Amount fee) {
	pimpl->next_status = status;
	pimpl->next_fee = fee;
}

void FakeBackend::resolve_payment( Sha256::Hash const& payment_hash
				 , PaymentStatus status
				 ) {
	auto it = pimpl->outgoing.find(payment_hash);
	if (it == pimpl->outgoing.end())
		return;
	auto& result = it->second.result;
	result.status = status;
	if (status == PaymentStatus_Succeeded)
		result.preimage = Ln::Preimage(pimpl->random);
}

unsigned int FakeBackend::pay_count(Sha256::Hash const& payment_hash) const {
	auto it = pimpl->outgoing.find(payment_hash);
	if (it == pimpl->outgoing.end())
		return 0;
	return it->second.count;
}

std::string FakeBackend::make_invoice( Ln::Amount amount
				     , Sha256::Hash& payment_hash
				     ) {
	auto preimage = Ln::Preimage(pimpl->random);
	payment_hash = preimage.sha256();
	return pimpl->encode(amount, "external", 3600, preimage);
}

}}
