#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Ln/Bolt11.hpp"
#include"tests/mint/MintFixture.hpp"
#include"tests/mint/expect_failure.hpp"
#include<algorithm>
#include<assert.h>
#include<functional>
#include<memory>

namespace {

Ev::Io<void> wait_until(std::function<bool()> done) {
	return Ev::yield().then([done]() {
		if (done())
			return Ev::lift();
		return wait_until(done);
	});
}

}

int main() {
	MintFixture f;
	auto& mq = f.engine->mint_quotes();

	auto quote = Mint::MintQuote();
	auto pending = std::vector<TestWallet::Pending>();

	auto code = f.init().then([&]() {
		return mq.create_mint_quote(1000, "sat");
	}).then([&](Mint::MintQuote q) {
		assert(q.state == Mint::MintQuoteState_Unpaid);
		assert(q.amount == 1000);
		assert(q.unit == "sat");
		auto inv = Ln::Bolt11::decode(q.request);
		assert(inv.has_amount);
		assert(inv.amount == Ln::Amount::sat(1000));
		assert(inv.payment_hash == q.payment_hash);
		quote = q;

		pending = f.wallet.blind_amount(1000, f.keyset().get_id());
		return expect_failure( mq.issue(q.id, TestWallet::Wallet::messages(pending))
				     , Mint::ErrorCode_QuoteNotPaid
				     );
	}).then([&]() {
		return mq.poll_mint_quote(quote.id);
	}).then([&](Mint::MintQuote q) {
		assert(q.state == Mint::MintQuoteState_Unpaid);

		f.backend->settle_invoice(quote.payment_hash);
		return mq.poll_mint_quote(quote.id);
	}).then([&](Mint::MintQuote q) {
		assert(q.state == Mint::MintQuoteState_Paid);
		/* Polling a paid quote changes nothing.  */
		return mq.poll_mint_quote(quote.id);
	}).then([&](Mint::MintQuote q) {
		assert(q.state == Mint::MintQuoteState_Paid);

		/* Outputs short of the quoted amount.  */
		auto short_outputs = f.wallet.blind_amount(999, f.keyset().get_id());
		return expect_failure( mq.issue( quote.id
					       , TestWallet::Wallet::messages(short_outputs)
					       )
				     , Mint::ErrorCode_AmountMismatch
				     );
	}).then([&]() {
		/* The same B_ twice.  */
		auto twice = f.wallet.blind_amount(512, f.keyset().get_id());
		auto msgs = TestWallet::Wallet::messages(twice);
		auto more = TestWallet::Wallet::messages(twice);
		msgs.insert(msgs.end(), more.begin(), more.end());
		return expect_failure( mq.issue(quote.id, msgs)
				     , Mint::ErrorCode_DuplicateOutputs
				     );
	}).then([&]() {
		return mq.poll_mint_quote(quote.id);
	}).then([&](Mint::MintQuote q) {
		/* Failed issues leave the quote paid.  */
		assert(q.state == Mint::MintQuoteState_Paid);
		return mq.issue(quote.id, TestWallet::Wallet::messages(pending));
	}).then([&](std::vector<Cashu::BlindedSignature> sigs) {
		assert(sigs.size() == Cashu::split(1000).size());
		auto proofs = TestWallet::Wallet::unblind_all(pending, sigs, f.keyset());
		assert(TestWallet::Wallet::total(proofs) == 1000);
		for (auto const& p : proofs)
			assert(f.engine->signer().verify(p));

		return mq.poll_mint_quote(quote.id);
	}).then([&](Mint::MintQuote q) {
		assert(q.state == Mint::MintQuoteState_Issued);

		auto again = f.wallet.blind_amount(1000, f.keyset().get_id());
		return expect_failure( mq.issue(quote.id, TestWallet::Wallet::messages(again))
				     , Mint::ErrorCode_QuoteAlreadyIssued
				     );
	}).then([&]() {
		return expect_failure( mq.create_mint_quote(0, "sat")
				     , Mint::ErrorCode_AmountOutOfLimit
				     );
	}).then([&]() {
		return expect_failure( mq.create_mint_quote(100, "usd")
				     , Mint::ErrorCode_UnsupportedUnit
				     );
	}).then([&]() {
		return expect_failure( mq.poll_mint_quote("no-such-quote")
				     , Mint::ErrorCode_QuoteNotFound
				     );
	}).then([&]() {
		/* Two issues racing for one paid quote.  */
		return mq.create_mint_quote(64, "sat");
	}).then([&](Mint::MintQuote q) {
		f.backend->settle_invoice(q.payment_hash);
		auto successes = std::make_shared<int>(0);
		auto failures = std::make_shared<int>(0);
		auto attempt = [&f, &mq, q, successes, failures]() {
			auto outs = f.wallet.blind_amount(64, f.keyset().get_id());
			return mq.issue( q.id, TestWallet::Wallet::messages(outs)
				       ).then([successes](std::vector<Cashu::BlindedSignature> sigs) {
				assert(sigs.size() == 1);
				++*successes;
				return Ev::lift();
			}).catching<Mint::Failure>([failures](Mint::Failure const& e) {
				assert(e.get_code() == Mint::ErrorCode_QuoteAlreadyIssued);
				++*failures;
				return Ev::lift();
			});
		};
		return Ev::concurrent(attempt()).then([attempt]() {
			return Ev::concurrent(attempt());
		}).then([successes, failures]() {
			return wait_until([successes, failures]() {
				return *successes + *failures == 2;
			});
		}).then([successes, failures]() {
			assert(*successes == 1);
			assert(*failures == 1);
			return Ev::lift();
		});
	}).then([&]() {
		/* Expiry: nobody pays, time passes.  */
		return mq.create_mint_quote(128, "sat");
	}).then([&](Mint::MintQuote q) {
		quote = q;
		return mq.unpaid();
	}).then([&](std::vector<std::string> ids) {
		assert(std::find(ids.begin(), ids.end(), quote.id) != ids.end());

		f.now = quote.expiry + 1;
		return mq.unpaid();
	}).then([&](std::vector<std::string> ids) {
		assert(std::find(ids.begin(), ids.end(), quote.id) == ids.end());

		auto outs = f.wallet.blind_amount(128, f.keyset().get_id());
		return expect_failure( mq.issue(quote.id, TestWallet::Wallet::messages(outs))
				     , Mint::ErrorCode_QuoteExpired
				     );
	}).then([&]() {
		return mq.prune(f.now);
	}).then([&](std::size_t count) {
		assert(count >= 1);
		return expect_failure( mq.poll_mint_quote(quote.id)
				     , Mint::ErrorCode_QuoteNotFound
				     );
	}).then([&]() {
		/* Paid just before expiry, never polled: pruning
		 * finds the payment instead of dropping it.  */
		return mq.create_mint_quote(16, "sat");
	}).then([&](Mint::MintQuote q) {
		quote = q;
		f.backend->settle_invoice(q.payment_hash);
		f.now = q.expiry + 1;
		return mq.unpaid();
	}).then([&](std::vector<std::string> ids) {
		assert(std::find(ids.begin(), ids.end(), quote.id) == ids.end());
		return mq.prune(f.now);
	}).then([&](std::size_t) {
		return mq.poll_mint_quote(quote.id);
	}).then([&](Mint::MintQuote q) {
		assert(q.state == Mint::MintQuoteState_Paid);
		auto outs = f.wallet.blind_amount(16, f.keyset().get_id());
		return mq.issue(quote.id, TestWallet::Wallet::messages(outs));
	}).then([&](std::vector<Cashu::BlindedSignature> sigs) {
		assert(sigs.size() == 1);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
