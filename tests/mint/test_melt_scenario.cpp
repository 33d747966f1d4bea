#undef NDEBUG
#include"Cashu/ProofState.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"tests/mint/MintFixture.hpp"
#include"tests/mint/expect_failure.hpp"
#include<assert.h>
#include<functional>
#include<memory>
#include<utility>

using Mint::Lightning::PaymentStatus_Failed;
using Mint::Lightning::PaymentStatus_Succeeded;
using Mint::Lightning::PaymentStatus_Uncertain;

namespace {

Ev::Io<void> wait_until(std::function<bool()> done) {
	return Ev::yield().then([done]() {
		if (done())
			return Ev::lift();
		return wait_until(done);
	});
}

std::vector<std::string> Ys(std::vector<Cashu::Proof> const& proofs) {
	auto rv = std::vector<std::string>();
	for (auto const& p : proofs)
		rv.push_back(p.Y());
	return rv;
}

void assert_all(std::vector<Cashu::ProofState> const& states, Cashu::ProofState s) {
	for (auto st : states)
		assert(st == s);
}

}

int main() {
	MintFixture f;
	auto& melts = f.engine->melt_quotes();

	auto hash = Sha256::Hash();
	auto quote = Mint::MeltQuote();
	auto proofs = std::vector<Cashu::Proof>();
	auto blanks = std::vector<TestWallet::Pending>();

	auto code = f.init().then([&]() {
		auto invoice = f.backend->make_invoice(Ln::Amount::sat(500), hash);
		return melts.create_melt_quote(invoice, "sat");
	}).then([&](Mint::MeltQuote q) {
		assert(q.state == Mint::MeltQuoteState_Unpaid);
		assert(q.amount == 500);
		assert(q.fee_reserve == 2);
		assert(q.payment_hash == hash);
		quote = q;
		return f.mint(502);
	}).then([&](std::vector<Cashu::Proof> ps) {
		proofs = ps;

		/* One short of amount + fee reserve.  */
		auto few = std::vector<Cashu::Proof>(ps.begin(), ps.end() - 1);
		return expect_failure( melts.melt(quote.id, few, {})
				     , Mint::ErrorCode_AmountMismatch
				     );
	}).then([&]() {
		return f.engine->proofs().check_state(Ys(proofs));
	}).then([&](std::vector<Cashu::ProofState> states) {
		assert_all(states, Cashu::ProofState_Unspent);

		/* Payment goes through for a 1 sat routing fee.  */
		f.backend->set_next_pay(PaymentStatus_Succeeded, Ln::Amount::sat(1));
		blanks = f.wallet.blanks(2, f.keyset().get_id());
		return melts.melt( quote.id, proofs
				 , TestWallet::Wallet::messages(blanks)
				 );
	}).then([&](Mint::MeltQuote q) {
		assert(q.state == Mint::MeltQuoteState_Paid);
		assert(q.preimage);
		assert(q.fee_paid == 1);
		assert(q.change.size() == 1);
		auto change = TestWallet::Wallet::unblind_all(blanks, q.change, f.keyset());
		assert(change[0].amount == 1);
		assert(f.engine->signer().verify(change[0]));
		assert(f.backend->pay_count(hash) == 1);

		return f.engine->proofs().check_state(Ys(proofs));
	}).then([&](std::vector<Cashu::ProofState> states) {
		assert_all(states, Cashu::ProofState_Spent);

		return expect_failure( melts.melt(quote.id, proofs, {})
				     , Mint::ErrorCode_QuoteAlreadyPaid
				     );
	}).then([&]() {
		/* Reading a settled quote returns the same change.  */
		return melts.get_melt_quote(quote.id);
	}).then([&](Mint::MeltQuote q) {
		assert(q.state == Mint::MeltQuoteState_Paid);
		assert(q.change.size() == 1);

		/* Failed payment releases the inputs.  */
		auto invoice = f.backend->make_invoice(Ln::Amount::sat(100), hash);
		return melts.create_melt_quote(invoice, "sat");
	}).then([&](Mint::MeltQuote q) {
		quote = q;
		return f.mint(102);
	}).then([&](std::vector<Cashu::Proof> ps) {
		proofs = ps;
		f.backend->set_next_pay(PaymentStatus_Failed, Ln::Amount::sat(0));
		return expect_failure( melts.melt(quote.id, proofs, {})
				     , Mint::ErrorCode_PaymentFailed
				     );
	}).then([&]() {
		return f.engine->proofs().check_state(Ys(proofs));
	}).then([&](std::vector<Cashu::ProofState> states) {
		assert_all(states, Cashu::ProofState_Unspent);
		return melts.get_melt_quote(quote.id);
	}).then([&](Mint::MeltQuote q) {
		assert(q.state == Mint::MeltQuoteState_Unpaid);

		/* A routing fee above the reserve is refused
		 * by the node.  */
		f.backend->set_next_pay(PaymentStatus_Succeeded, Ln::Amount::sat(3));
		return expect_failure( melts.melt(quote.id, proofs, {})
				     , Mint::ErrorCode_PaymentFailed
				     );
	}).then([&]() {
		/* Second attempt succeeds with no change outputs:
		 * the overpaid fee reserve is forfeit.  */
		f.backend->set_next_pay(PaymentStatus_Succeeded, Ln::Amount::sat(0));
		return melts.melt(quote.id, proofs, {});
	}).then([&](Mint::MeltQuote q) {
		assert(q.state == Mint::MeltQuoteState_Paid);
		assert(q.change.empty());
		assert(f.backend->pay_count(hash) == 3);

		/* Uncertain outcome keeps everything pending.  */
		auto invoice = f.backend->make_invoice(Ln::Amount::sat(200), hash);
		return melts.create_melt_quote(invoice, "sat");
	}).then([&](Mint::MeltQuote q) {
		quote = q;
		return f.mint(202);
	}).then([&](std::vector<Cashu::Proof> ps) {
		proofs = ps;
		f.backend->set_next_pay(PaymentStatus_Uncertain, Ln::Amount::sat(0));
		return expect_failure( melts.melt(quote.id, proofs, {})
				     , Mint::ErrorCode_PaymentUncertain
				     );
	}).then([&]() {
		return melts.get_melt_quote(quote.id);
	}).then([&](Mint::MeltQuote q) {
		assert(q.state == Mint::MeltQuoteState_Pending);
		return melts.pending();
	}).then([&](std::vector<std::string> ids) {
		assert(ids.size() == 1);
		assert(ids[0] == quote.id);
		return f.engine->proofs().check_state(Ys(proofs));
	}).then([&](std::vector<Cashu::ProofState> states) {
		assert_all(states, Cashu::ProofState_Pending);

		return expect_failure( melts.melt(quote.id, proofs, {})
				     , Mint::ErrorCode_QuotePending
				     );
	}).then([&]() {
		auto outs = f.wallet.blind_amount(202, f.keyset().get_id());
		return expect_failure( f.engine->swaps().swap( proofs
							     , TestWallet::Wallet::messages(outs)
							     )
				     , Mint::ErrorCode_ProofNotUnspent
				     );
	}).then([&]() {
		f.backend->resolve_payment(hash, PaymentStatus_Succeeded);
		return melts.get_melt_quote(quote.id);
	}).then([&](Mint::MeltQuote q) {
		assert(q.state == Mint::MeltQuoteState_Paid);
		assert(q.preimage);
		return f.engine->proofs().check_state(Ys(proofs));
	}).then([&](std::vector<Cashu::ProofState> states) {
		assert_all(states, Cashu::ProofState_Spent);

		/* The node never saw the payment: pending until
		 * the pay timeout, then released.  */
		auto invoice = f.backend->make_invoice(Ln::Amount::sat(40), hash);
		return melts.create_melt_quote(invoice, "sat");
	}).then([&](Mint::MeltQuote q) {
		quote = q;
		return f.mint(42);
	}).then([&](std::vector<Cashu::Proof> ps) {
		proofs = ps;
		f.backend->set_unreachable(true);
		return expect_failure( melts.melt(quote.id, proofs, {})
				     , Mint::ErrorCode_PaymentUncertain
				     );
	}).then([&]() {
		f.backend->set_unreachable(false);
		assert(f.backend->pay_count(hash) == 0);
		return melts.get_melt_quote(quote.id);
	}).then([&](Mint::MeltQuote q) {
		assert(q.state == Mint::MeltQuoteState_Pending);
		f.now += f.config.pay_timeout;
		return melts.get_melt_quote(quote.id);
	}).then([&](Mint::MeltQuote q) {
		assert(q.state == Mint::MeltQuoteState_Unpaid);
		return f.engine->proofs().check_state(Ys(proofs));
	}).then([&](std::vector<Cashu::ProofState> states) {
		assert_all(states, Cashu::ProofState_Unspent);
		return melts.pending();
	}).then([&](std::vector<std::string> ids) {
		assert(ids.empty());

		/* Two melts racing over a shared proof: only
		 * one payment is ever attempted.  */
		auto invoice = f.backend->make_invoice(Ln::Amount::sat(60), hash);
		return melts.create_melt_quote(invoice, "sat");
	}).then([&](Mint::MeltQuote q) {
		quote = q;
		return f.mint(62);
	}).then([&](std::vector<Cashu::Proof> ps) {
		proofs = ps;
		auto other_hash = std::make_shared<Sha256::Hash>();
		auto invoice = f.backend->make_invoice(Ln::Amount::sat(60), *other_hash);
		return melts.create_melt_quote(invoice, "sat"
					      ).then([other_hash](Mint::MeltQuote q) {
			return Ev::lift(std::make_pair(q, *other_hash));
		});
	}).then([&](std::pair<Mint::MeltQuote, Sha256::Hash> other) {
		f.backend->set_next_pay(PaymentStatus_Succeeded, Ln::Amount::sat(0));
		auto successes = std::make_shared<int>(0);
		auto failures = std::make_shared<int>(0);
		auto attempt = [&melts, successes, failures]( std::string id
							    , std::vector<Cashu::Proof> ins
							    ) {
			return melts.melt(id, ins, {}
					 ).then([successes](Mint::MeltQuote q) {
				assert(q.state == Mint::MeltQuoteState_Paid);
				++*successes;
				return Ev::lift();
			}).catching<Mint::Failure>([failures](Mint::Failure const& e) {
				assert(e.get_code() == Mint::ErrorCode_ProofNotUnspent);
				++*failures;
				return Ev::lift();
			});
		};
		auto first = attempt(quote.id, proofs);
		auto second = attempt(other.first.id, proofs);
		auto other_hash = other.second;
		return Ev::concurrent(first).then([second]() {
			return Ev::concurrent(second);
		}).then([successes, failures]() {
			return wait_until([successes, failures]() {
				return *successes + *failures == 2;
			});
		}).then([&f, successes, failures, other_hash, &hash]() {
			assert(*successes == 1);
			assert(*failures == 1);
			assert( f.backend->pay_count(hash)
			      + f.backend->pay_count(other_hash)
			     == 1
			      );
			return Ev::lift();
		});
	}).then([&]() {
		return f.engine->proofs().check_state(Ys(proofs));
	}).then([&](std::vector<Cashu::ProofState> states) {
		assert_all(states, Cashu::ProofState_Spent);

		/* Bad requests.  */
		return expect_failure( melts.create_melt_quote("lnbc1garbage", "sat")
				     , Mint::ErrorCode_InvalidRequest
				     );
	}).then([&]() {
		auto invoice = f.backend->make_invoice(Ln::Amount::sat(10), hash);
		return expect_failure( melts.create_melt_quote(invoice, "usd")
				     , Mint::ErrorCode_UnsupportedUnit
				     );
	}).then([&]() {
		return expect_failure( melts.get_melt_quote("no-such-quote")
				     , Mint::ErrorCode_QuoteNotFound
				     );
	}).then([&]() {
		/* Quotes expire.  */
		auto invoice = f.backend->make_invoice(Ln::Amount::sat(30), hash);
		return melts.create_melt_quote(invoice, "sat");
	}).then([&](Mint::MeltQuote q) {
		quote = q;
		return f.mint(32);
	}).then([&](std::vector<Cashu::Proof> ps) {
		f.now = quote.expiry + 1;
		return expect_failure( melts.melt(quote.id, ps, {})
				     , Mint::ErrorCode_QuoteExpired
				     );
	}).then([&]() {
		return melts.prune(f.now);
	}).then([&](std::size_t count) {
		assert(count >= 1);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
