#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"Mint/Mod/Manifester.hpp"
#include"Mint/Msg/CommandFail.hpp"
#include"Mint/Msg/CommandRequest.hpp"
#include"Mint/Msg/CommandResponse.hpp"
#include"Mint/Msg/Manifestation.hpp"
#include"S/Bus.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace {

char const* type_name(Mint::Msg::OptionType t) {
	switch (t) {
	case Mint::Msg::OptionType_String: return "string";
	case Mint::Msg::OptionType_Bool: return "bool";
	case Mint::Msg::OptionType_Int: return "int";
	case Mint::Msg::OptionType_Flag: return "flag";
	}
	return "string";
}

template<typename M>
void add_once(std::map<std::string, M>& m, M const& item, char const* what) {
	if (!m.emplace(item.name, item).second)
		throw Util::BacktraceException<std::logic_error>(
			std::string("Manifester: ") + what
			+ " registered twice: " + item.name
		);
}

Json::Out manifest(std::map<std::string, Mint::Msg::ManifestCommand> const& commands
		  , std::map<std::string, Mint::Msg::ManifestOption> const& options
		  ) {
	auto rv = Json::Out();
	auto obj = rv.start_object();

	auto methods = obj.start_array("rpcmethods");
	for (auto const& e : commands) {
		auto const& c = e.second;
		methods.start_object()
			.field("name", c.name)
			.field("usage", c.usage)
			.field("description", c.description)
			.field("deprecated", c.deprecated)
		.end_object();
	}
	methods.end_array();

	auto opts = obj.start_array("options");
	for (auto const& e : options) {
		auto const& o = e.second;
		opts.start_object()
			.field("name", o.name)
			.field("type", std::string(type_name(o.type)))
			.field("default", o.default_value)
			.field("description", o.description)
		.end_object();
	}
	opts.end_array();

	obj.start_array("subscriptions").end_array();
	obj.start_array("hooks").end_array();
	/* Command ids are kept as lightningd sends them.  */
	obj.field("nonnumericids", true);
	/* A melt stopped halfway leaves its proofs pending
	 * until the next start.  */
	obj.field("dynamic", false);

	obj.end_object();
	return rv;
}

}

namespace Mint { namespace Mod {

void Manifester::start() {
	bus.subscribe<Msg::CommandRequest>([this](Msg::CommandRequest const& req) {
		if (req.command != "getmanifest")
			return Ev::lift();

		auto id = req.id;
		auto collected = std::make_shared<Collected>();
		return Ev::lift().then([this, collected]() {
			collecting = collected;
			return bus.raise(Msg::Manifestation());
		}).then([this, id, collected]() {
			collecting = nullptr;
			return bus.raise(Msg::CommandResponse{
				id, manifest(collected->commands, collected->options)
			});
		}).catching<std::exception>([this, id](std::exception const& e) {
			collecting = nullptr;
			return bus.raise(Msg::CommandFail{
				id, -32603, e.what(), Json::Out::empty_object()
			});
		});
	});

	bus.subscribe<Msg::ManifestCommand>([this](Msg::ManifestCommand const& c) {
		if (collecting)
			add_once(collecting->commands, c, "command");
		return Ev::lift();
	});
	bus.subscribe<Msg::ManifestOption>([this](Msg::ManifestOption const& o) {
		if (collecting)
			add_once(collecting->options, o, "option");
		return Ev::lift();
	});
}

}}
