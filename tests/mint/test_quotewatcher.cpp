#undef NDEBUG
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Mint/Mod/QuoteWatcher.hpp"
#include"Mint/Mod/Waiter.hpp"
#include"Mint/Msg/EngineReady.hpp"
#include"Mint/Shutdown.hpp"
#include"tests/mint/MintFixture.hpp"
#include"tests/mint/expect_failure.hpp"
#include<assert.h>

namespace {

Mint::Config fast_polling() {
	auto config = MintFixture::default_config();
	config.poll_interval = 0.01;
	return config;
}

}

int main() {
	MintFixture f(fast_polling());
	Mint::Mod::Waiter waiter(f.bus);
	Mint::Mod::QuoteWatcher watcher(f.bus, waiter);

	auto mint_quote = Mint::MintQuote();
	auto melt_hash = Sha256::Hash();
	auto melt_quote = Mint::MeltQuote();

	auto code = f.init().then([&]() {
		return f.engine->mint_quotes().create_mint_quote(256, "sat");
	}).then([&](Mint::MintQuote q) {
		mint_quote = q;

		/* A melt left pending by an uncertain payment.  */
		auto invoice = f.backend->make_invoice(Ln::Amount::sat(30), melt_hash);
		return f.engine->melt_quotes().create_melt_quote(invoice, "sat");
	}).then([&](Mint::MeltQuote q) {
		melt_quote = q;
		return f.mint(32);
	}).then([&](std::vector<Cashu::Proof> proofs) {
		f.backend->set_next_pay( Mint::Lightning::PaymentStatus_Uncertain
				       , Ln::Amount::sat(0)
				       );
		return expect_failure( f.engine->melt_quotes().melt(melt_quote.id, proofs, {})
				     , Mint::ErrorCode_PaymentUncertain
				     );
	}).then([&]() {
		return f.engine->mint_quotes().unpaid();
	}).then([&](std::vector<std::string> ids) {
		assert(ids.size() == 1);
		assert(ids[0] == mint_quote.id);

		/* The node learns of both outcomes; nobody asks
		 * the mint.  */
		f.backend->settle_invoice(mint_quote.payment_hash);
		f.backend->resolve_payment( melt_hash
					  , Mint::Lightning::PaymentStatus_Succeeded
					  );
		return f.bus.raise(Mint::Msg::EngineReady{*f.engine});
	}).then([&]() {
		return waiter.wait(0.2);
	}).then([&]() {
		return f.engine->mint_quotes().unpaid();
	}).then([&](std::vector<std::string> ids) {
		assert(ids.empty());
		return f.engine->melt_quotes().pending();
	}).then([&](std::vector<std::string> ids) {
		assert(ids.empty());

		/* Both stay settled.  */
		return f.engine->mint_quotes().poll_mint_quote(mint_quote.id);
	}).then([&](Mint::MintQuote q) {
		assert(q.state == Mint::MintQuoteState_Paid);
		return f.engine->melt_quotes().get_melt_quote(melt_quote.id);
	}).then([&](Mint::MeltQuote q) {
		assert(q.state == Mint::MeltQuoteState_Paid);

		/* Stops the polling loop.  */
		return f.bus.raise(Mint::Shutdown());
	}).then([]() {
		return Ev::lift(0);
	});

	return Ev::start(code);
}
