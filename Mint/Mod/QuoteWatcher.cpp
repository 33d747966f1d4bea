#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Mint/Engine.hpp"
#include"Mint/MeltQuote.hpp"
#include"Mint/MintQuote.hpp"
#include"Mint/Mod/QuoteWatcher.hpp"
#include"Mint/Mod/Waiter.hpp"
#include"Mint/Msg/EngineReady.hpp"
#include"Mint/concurrent.hpp"
#include"Mint/log.hpp"
#include"S/Bus.hpp"
#include<memory>

namespace {

/* Unpaid quotes are kept this long past expiry.  */
auto const prune_delay = double(3600);

}

namespace Mint { namespace Mod {

class QuoteWatcher::Impl {
private:
	S::Bus& bus;
	Waiter& waiter;
	Mint::Engine* engine;

	Ev::Io<void> warn(std::string const& what, std::exception const& e) {
		return Mint::log( bus, Warn
				, "QuoteWatcher: %s: %s"
				, what.c_str(), e.what()
				);
	}

	Ev::Io<void> poll_mint_quotes() {
		return engine->mint_quotes().unpaid(
		).then([this](std::vector<std::string> ids) {
			auto act = Ev::lift();
			for (auto const& id : ids)
				act += engine->mint_quotes().poll_mint_quote(
					id
				).then([this](Mint::MintQuote q) {
					if (q.state != MintQuoteState_Paid)
						return Ev::lift();
					return Mint::log( bus, Debug
							, "QuoteWatcher: mint quote %s paid."
							, q.id.c_str()
							);
				}).catching<std::exception>([this, id](std::exception const& e) {
					return warn("mint quote " + id, e);
				});
			return act;
		});
	}

	Ev::Io<void> reconcile_melts() {
		return engine->melt_quotes().pending(
		).then([this](std::vector<std::string> ids) {
			auto act = Ev::lift();
			for (auto const& id : ids)
				act += engine->melt_quotes().get_melt_quote(
					id
				).then([this](Mint::MeltQuote q) {
					if (q.state == MeltQuoteState_Pending)
						return Ev::lift();
					return Mint::log( bus, Debug
							, "QuoteWatcher: melt quote %s now %s."
							, q.id.c_str()
							, melt_quote_state_name(q.state).c_str()
							);
				}).catching<std::exception>([this, id](std::exception const& e) {
					return warn("melt quote " + id, e);
				});
			return act;
		});
	}

	Ev::Io<void> prune() {
		auto before = Ev::now() - prune_delay;
		auto mints = std::make_shared<std::size_t>(0);
		return engine->mint_quotes().prune(before
						  ).then([this, before, mints](std::size_t n) {
			*mints = n;
			return engine->melt_quotes().prune(before);
		}).then([this, mints](std::size_t melts) {
			if (*mints == 0 && melts == 0)
				return Ev::lift();
			return Mint::log( bus, Debug
					, "QuoteWatcher: pruned %zu mint and "
					  "%zu melt quotes."
					, *mints, melts
					);
		});
	}

	Ev::Io<void> sweep() {
		return poll_mint_quotes().then([this]() {
			return reconcile_melts();
		}).then([this]() {
			return prune();
		}).catching<std::exception>([this](std::exception const& e) {
			return Mint::log( bus, Error
					, "QuoteWatcher: sweep failed: %s"
					, e.what()
					);
		});
	}

	Ev::Io<void> loop() {
		return Ev::lift().then([this]() {
			return waiter.wait(engine->get_config().poll_interval);
		}).then([this]() {
			return sweep();
		}).then([this]() {
			return loop();
		});
	}

public:
	Impl( S::Bus& bus_
	    , Waiter& waiter_
	    ) : bus(bus_), waiter(waiter_), engine(nullptr) {
		bus.subscribe<Msg::EngineReady
			     >([this](Msg::EngineReady const& r) {
			engine = &r.engine;
			return Mint::concurrent(bus, "QuoteWatcher", loop());
		});
	}
};

QuoteWatcher::QuoteWatcher( S::Bus& bus
			  , Waiter& waiter
			  ) : pimpl(std::make_unique<Impl>(bus, waiter)) { }
QuoteWatcher::QuoteWatcher(QuoteWatcher&&) =default;
QuoteWatcher::~QuoteWatcher() =default;

}}
