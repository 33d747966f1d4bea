#include"Ev/Io.hpp"
#include"Ev/now.hpp"
#include"Jsmn/Object.hpp"
#include"Json/Out.hpp"
#include"Mint/Config.hpp"
#include"Mint/Engine.hpp"
#include"Mint/Lightning/ClnBackend.hpp"
#include"Mint/Lightning/FakeBackend.hpp"
#include"Mint/Mod/EngineLoader.hpp"
#include"Mint/Msg/EngineReady.hpp"
#include"Mint/Msg/Init.hpp"
#include"Mint/Msg/ManifestOption.hpp"
#include"Mint/Msg/Manifestation.hpp"
#include"Mint/Msg/Option.hpp"
#include"Mint/log.hpp"
#include"S/Bus.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<memory>
#include<cmath>
#include<map>
#include<stdexcept>

namespace {

struct OptionDef {
	char const* name;
	Mint::Msg::OptionType type;
	char const* def;
	char const* description;
};

OptionDef const option_defs[] =
{ { "clmint-seed", Mint::Msg::OptionType_String, ""
  , "Hex master seed of the keysets.  "
    "If empty, one is generated and kept in the database."
  }
, { "clmint-units", Mint::Msg::OptionType_String, "sat"
  , "Comma-separated units the mint issues."
  }
, { "clmint-max-order", Mint::Msg::OptionType_Int, "32"
  , "Number of denominations (powers of two) per keyset."
  }
, { "clmint-fee-percent", Mint::Msg::OptionType_String, "1"
  , "Lightning fee reserve of melts, as percent of the amount."
  }
, { "clmint-reserve-fee-min", Mint::Msg::OptionType_Int, "4"
  , "Minimum Lightning fee reserve of melts, in sat."
  }
, { "clmint-mint-quote-expiry", Mint::Msg::OptionType_Int, "3600"
  , "Seconds a mint quote invoice stays payable."
  }
, { "clmint-melt-quote-expiry", Mint::Msg::OptionType_Int, "1800"
  , "Seconds a melt quote stays usable."
  }
, { "clmint-keyset-retention", Mint::Msg::OptionType_Int, "0"
  , "Seconds a rotated-out keyset can still be redeemed; "
    "0 means forever."
  }
, { "clmint-mint-min-amount", Mint::Msg::OptionType_Int, "0"
  , "Smallest mint quote amount; 0 means no limit."
  }
, { "clmint-mint-max-amount", Mint::Msg::OptionType_Int, "0"
  , "Largest mint quote amount; 0 means no limit."
  }
, { "clmint-melt-min-amount", Mint::Msg::OptionType_Int, "0"
  , "Smallest melt quote amount; 0 means no limit."
  }
, { "clmint-melt-max-amount", Mint::Msg::OptionType_Int, "0"
  , "Largest melt quote amount; 0 means no limit."
  }
, { "clmint-backend", Mint::Msg::OptionType_String, "cln"
  , "Lightning backend: 'cln' for this node, "
    "'fake' for an in-process node that settles every invoice."
  }
, { "clmint-poll-interval", Mint::Msg::OptionType_Int, "30"
  , "Seconds between checks of unpaid and pending quotes."
  }
, { "clmint-pay-timeout", Mint::Msg::OptionType_Int, "120"
  , "Seconds a melt waits for its payment before "
    "reporting it uncertain."
  }
, { "clmint-name", Mint::Msg::OptionType_String, "clmint"
  , "Name of the mint, as advertised by clmint-info."
  }
, { "clmint-description", Mint::Msg::OptionType_String, ""
  , "Short description advertised by clmint-info."
  }
, { "clmint-description-long", Mint::Msg::OptionType_String, ""
  , "Long description advertised by clmint-info."
  }
, { "clmint-contact-email", Mint::Msg::OptionType_String, ""
  , "Contact e-mail advertised by clmint-info."
  }
, { "clmint-contact-nostr", Mint::Msg::OptionType_String, ""
  , "Contact nostr npub advertised by clmint-info."
  }
, { "clmint-motd", Mint::Msg::OptionType_String, ""
  , "Message of the day advertised by clmint-info."
  }
};

std::invalid_argument bad_option( std::string const& name
				, std::string const& why
				) {
	return Util::BacktraceException<std::invalid_argument>(
		name + ": " + why
	);
}

}

namespace Mint { namespace Mod {

class EngineLoader::Impl {
private:
	S::Bus& bus;
	Waiter& waiter;

	std::map<std::string, Jsmn::Object> values;

	std::unique_ptr<Lightning::BackendIF> backend;
	std::unique_ptr<Mint::Engine> engine;

	std::string text(std::string const& name) const {
		auto it = values.find(name);
		if (it == values.end())
			for (auto const& d : option_defs)
				if (name == d.name)
					return d.def;
		if (it == values.end())
			return "";
		auto const& v = it->second;
		if (v.is_string())
			return std::string(v);
		if (v.is_number())
			return Util::Str::fmt("%.0f", double(v));
		throw bad_option(name, "unexpected value type");
	}
	double number(std::string const& name) const {
		auto s = text(name);
		auto pos = std::size_t(0);
		auto rv = double(0);
		try {
			rv = std::stod(s, &pos);
		} catch (std::exception const&) {
			throw bad_option(name, "not a number: " + s);
		}
		if (pos != s.size() || !std::isfinite(rv) || rv < 0)
			throw bad_option(name, "not a non-negative number: " + s);
		return rv;
	}
	std::uint64_t integer(std::string const& name) const {
		auto v = number(name);
		if (v != std::floor(v) || v > 1e18)
			throw bad_option(name, "not an integer");
		return std::uint64_t(v);
	}

	Mint::Config make_config() const {
		auto config = Mint::Config();
		config.seed = text("clmint-seed");

		config.units.clear();
		auto units = text("clmint-units");
		auto start = std::size_t(0);
		for (;;) {
			auto comma = units.find(',', start);
			auto unit = Util::Str::trim(units.substr(
				start,
				comma == std::string::npos ?
					std::string::npos : comma - start
			));
			if (unit.empty())
				throw bad_option("clmint-units", "empty unit");
			config.units.push_back(unit);
			if (comma == std::string::npos)
				break;
			start = comma + 1;
		}

		auto max_order = integer("clmint-max-order");
		if (max_order < 1 || max_order > 64)
			throw bad_option("clmint-max-order", "must be 1 to 64");
		config.max_order = std::uint32_t(max_order);

		config.fee_percent = number("clmint-fee-percent");
		config.reserve_fee_min = Ln::Amount::sat(
			integer("clmint-reserve-fee-min")
		);
		config.mint_quote_expiry = number("clmint-mint-quote-expiry");
		config.melt_quote_expiry = number("clmint-melt-quote-expiry");
		config.keyset_retention = number("clmint-keyset-retention");
		config.mint_min_amount = integer("clmint-mint-min-amount");
		config.mint_max_amount = integer("clmint-mint-max-amount");
		config.melt_min_amount = integer("clmint-melt-min-amount");
		config.melt_max_amount = integer("clmint-melt-max-amount");

		config.backend = text("clmint-backend");
		if (config.backend != "cln" && config.backend != "fake")
			throw bad_option( "clmint-backend"
					, "must be 'cln' or 'fake'"
					);
		config.poll_interval = number("clmint-poll-interval");
		if (config.poll_interval < 1)
			throw bad_option("clmint-poll-interval", "must be at least 1");
		config.pay_timeout = number("clmint-pay-timeout");

		config.name = text("clmint-name");
		config.description = text("clmint-description");
		config.description_long = text("clmint-description-long");
		auto email = text("clmint-contact-email");
		if (!email.empty())
			config.contact.emplace_back("email", email);
		auto nostr = text("clmint-contact-nostr");
		if (!nostr.empty())
			config.contact.emplace_back("nostr", nostr);
		config.motd = text("clmint-motd");

		return config;
	}

	Ev::Io<void> on_init(Msg::Init const& init) {
		auto config = make_config();
		if (config.backend == "fake")
			backend = std::make_unique<Lightning::FakeBackend>(
				config, true
			);
		else
			backend = std::make_unique<Lightning::ClnBackend>(
				bus, init.rpc, waiter, config
			);
		engine = std::make_unique<Mint::Engine>(
			bus, init.db, config, *backend, &Ev::now
		);
		auto backend_name = config.backend;
		return engine->init().then([this, backend_name]() {
			return Mint::log( bus, Info
					, "EngineLoader: mint ready on %s backend, "
					  "%zu keysets known."
					, backend_name.c_str()
					, engine->keysets().list().size()
					);
		}).then([this]() {
			return bus.raise(Msg::EngineReady{*engine});
		});
	}

public:
	Impl( S::Bus& bus_
	    , Waiter& waiter_
	    ) : bus(bus_), waiter(waiter_) {
		bus.subscribe<Msg::Manifestation
			     >([this](Msg::Manifestation const&) {
			auto act = Ev::lift();
			for (auto const& d : option_defs) {
				auto def = Json::Out();
				if (d.type == Msg::OptionType_Int)
					def = Json::Out::direct(
						std::int64_t(std::stoll(d.def))
					);
				else
					def = Json::Out::direct(std::string(d.def));
				act += bus.raise(Msg::ManifestOption{
					d.name, d.type, std::move(def),
					d.description
				});
			}
			return act;
		});
		bus.subscribe<Msg::Option
			     >([this](Msg::Option const& o) {
			for (auto const& d : option_defs)
				if (o.name == d.name)
					values[o.name] = o.value;
			return Ev::lift();
		});
		bus.subscribe<Msg::Init
			     >([this](Msg::Init const& init) {
			return on_init(init);
		});
	}
};

EngineLoader::EngineLoader( S::Bus& bus
			  , Waiter& waiter
			  ) : pimpl(std::make_unique<Impl>(bus, waiter)) { }
EngineLoader::EngineLoader(EngineLoader&&) =default;
EngineLoader::~EngineLoader() =default;

}}
