#ifndef TESTS_MINT_MINTFIXTURE_HPP
#define TESTS_MINT_MINTFIXTURE_HPP

#include"Cashu/BlindedSignature.hpp"
#include"Cashu/Keyset.hpp"
#include"Cashu/Proof.hpp"
#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Mint/Config.hpp"
#include"Mint/Engine.hpp"
#include"Mint/Lightning/FakeBackend.hpp"
#include"Mint/MintQuote.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include"tests/mint/TestWallet.hpp"
#include<memory>

/* A mint over an in-memory database and a fake
 * Lightning node, with a wallet to talk to it.
 * The mint's clock only moves when a test moves it.  */
class MintFixture {
public:
	S::Bus bus;
	Sqlite3::Db db;
	Mint::Config config;
	double now;
	std::unique_ptr<Mint::Lightning::FakeBackend> backend;
	std::unique_ptr<Mint::Engine> engine;
	TestWallet::Wallet wallet;

	static
	Mint::Config default_config() {
		auto config = Mint::Config();
		config.seed = "5f6e7d8c9bab0c1d2e3f405162738495"
			      "a6b7c8d9eafb0c1d2e3f405162738495";
		config.fee_percent = 0;
		config.reserve_fee_min = Ln::Amount::sat(2);
		return config;
	}

	explicit
	MintFixture(Mint::Config config_ = default_config())
		: db(":memory:")
		, config(std::move(config_))
		, now(Ev::now()) {
		backend = std::make_unique<Mint::Lightning::FakeBackend>(
			config
		);
		engine = std::make_unique<Mint::Engine>(
			bus, db, config, *backend, [this]() { return now; }
		);
	}

	Ev::Io<void> init() {
		return engine->init();
	}

	Cashu::Keyset const& keyset(std::string const& unit = "sat") {
		return engine->keysets().get_active(unit);
	}

	/* Mints `amount` sat all the way through: quote,
	 * payment, issue and unblinding.  */
	Ev::Io<std::vector<Cashu::Proof>> mint(std::uint64_t amount) {
		auto pending = std::make_shared<std::vector<TestWallet::Pending>>();
		return engine->mint_quotes().create_mint_quote(
			amount, "sat"
		).then([this](Mint::MintQuote q) {
			backend->settle_invoice(q.payment_hash);
			return engine->mint_quotes().poll_mint_quote(q.id);
		}).then([this, amount, pending](Mint::MintQuote q) {
			*pending = wallet.blind_amount(amount, keyset().get_id());
			return engine->mint_quotes().issue(
				q.id, TestWallet::Wallet::messages(*pending)
			);
		}).then([this, pending](std::vector<Cashu::BlindedSignature> sigs) {
			return Ev::lift(TestWallet::Wallet::unblind_all(
				*pending, sigs, keyset()
			));
		});
	}
};

#endif /* !defined(TESTS_MINT_MINTFIXTURE_HPP) */
