#include"Cashu/split.hpp"
#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"Ln/CommandId.hpp"
#include"Mint/Engine.hpp"
#include"Mint/Error.hpp"
#include"Mint/ModG/CommandTable.hpp"
#include"Mint/Msg/CommandFail.hpp"
#include"Mint/Msg/CommandRequest.hpp"
#include"Mint/Msg/CommandResponse.hpp"
#include"Mint/Msg/EngineReady.hpp"
#include"Mint/Msg/ManifestCommand.hpp"
#include"Mint/Msg/Manifestation.hpp"
#include"Mint/log.hpp"
#include"S/Bus.hpp"
#include<algorithm>

namespace Mint { namespace ModG {

Params::Params( Jsmn::Object params_
	      , std::vector<std::string> names_
	      ) : params(std::move(params_))
		, names(std::move(names_)) {
	if (params.is_array()) {
		if (params.size() > names.size())
			throw Mint::Failure( ErrorCode_InvalidRequest
					   , "too many parameters"
					   );
	} else if (params.is_object()) {
		for (auto const& k : params.keys()) {
			auto it = std::find(names.begin(), names.end(), k);
			if (it == names.end())
				throw Mint::Failure( ErrorCode_InvalidRequest
						   , "unknown parameter: " + k
						   );
		}
	} else if (!params.is_null())
		throw Mint::Failure( ErrorCode_InvalidRequest
				   , "params must be an object or array"
				   );
}

Jsmn::Object Params::optional(std::string const& name) const {
	if (params.is_object())
		return params[name];
	if (params.is_array()) {
		auto it = std::find(names.begin(), names.end(), name);
		if (it == names.end())
			return Jsmn::Object();
		return params[std::size_t(it - names.begin())];
	}
	return Jsmn::Object();
}
bool Params::has(std::string const& name) const {
	return !optional(name).is_null();
}
Jsmn::Object Params::required(std::string const& name) const {
	auto rv = optional(name);
	if (rv.is_null())
		throw Mint::Failure( ErrorCode_InvalidRequest
				   , "missing parameter: " + name
				   );
	return rv;
}

std::string Params::string(std::string const& name) const {
	auto o = required(name);
	if (!o.is_string())
		throw invalid(name, "expected a string");
	return std::string(o);
}
std::uint64_t Params::amount(std::string const& name) const {
	auto o = required(name);
	try {
		return Cashu::amount_from_json(o);
	} catch (std::invalid_argument const& e) {
		throw invalid(name, e.what());
	}
}
Jsmn::Object Params::array_object(std::string const& name) const {
	auto o = required(name);
	if (!o.is_array())
		throw invalid(name, "expected an array");
	return o;
}

Mint::Failure Params::invalid( std::string const& name
			     , std::string const& why
			     ) const {
	return Mint::Failure( ErrorCode_InvalidRequest
			    , "parameter " + name + ": " + why
			    );
}

class CommandTable::Impl {
private:
	S::Bus& bus;
	Mint::Engine* engine;
	std::map<std::string, Command> commands;

	Ev::Io<void> fail( Ln::CommandId id
			 , std::string const& name
			 , Mint::Failure const& e
			 ) {
		auto code = e.get_code();
		auto data = Json::Out()
			.start_object()
				.field("code", error_nut_code(code))
				.field("name", error_name(code))
				.field("detail", e.get_detail())
			.end_object()
			;
		auto what = std::string(e.what());
		return Mint::log( bus, Debug
				, "%s: %s"
				, name.c_str(), what.c_str()
				).then([this, id, code, what, data]() {
			return bus.raise(Msg::CommandFail{
				id, error_nut_code(code), what, data
			});
		});
	}

	Ev::Io<void> run( Command const& c
			, Jsmn::Object params
			, Ln::CommandId id
			) {
		auto name = c.name;
		return Ev::lift().then([this, &c, params]() {
			if (!engine)
				throw Mint::Failure( ErrorCode_BackendUnavailable
						   , "mint not initialized"
						   );
			auto p = std::make_shared<Params>(params, c.params);
			return c.handler(*engine, *p).then([p](Json::Out r) {
				return Ev::lift(std::move(r));
			});
		}).then([this, id](Json::Out result) {
			return bus.raise(Msg::CommandResponse{
				id, std::move(result)
			});
		}).catching<Mint::Failure>([this, id, name](Mint::Failure const& e) {
			return fail(id, name, e);
		}).catching<std::exception>([this, id, name](std::exception const& e) {
			auto msg = std::string(e.what());
			return Mint::log( bus, Error
					, "%s: internal error: %s"
					, name.c_str(), msg.c_str()
					).then([this, id, msg]() {
				return bus.raise(Msg::CommandFail{
					id, -32603, "Internal error",
					Json::Out()
						.start_object()
							.field("detail", msg)
						.end_object()
				});
			});
		});
	}

public:
	Impl( S::Bus& bus_
	    , std::vector<Command> commands_
	    ) : bus(bus_), engine(nullptr) {
		for (auto& c : commands_) {
			auto name = c.name;
			commands.emplace(std::move(name), std::move(c));
		}
	}

	void start() {
		bus.subscribe<Msg::EngineReady
			     >([this](Msg::EngineReady const& r) {
			engine = &r.engine;
			return Ev::lift();
		});
		bus.subscribe<Msg::Manifestation
			     >([this](Msg::Manifestation const&) {
			auto act = Ev::lift();
			for (auto const& c : commands)
				act += bus.raise(Msg::ManifestCommand{
					c.second.name, c.second.usage,
					c.second.description, false
				});
			return act;
		});
		bus.subscribe<Msg::CommandRequest
			     >([this](Msg::CommandRequest const& r) {
			auto it = commands.find(r.command);
			if (it == commands.end())
				return Ev::lift();
			return run(it->second, r.params, r.id);
		});
	}
};

CommandTable::CommandTable( S::Bus& bus
			  , std::vector<Command> commands
			  ) : pimpl(std::make_shared<Impl>( bus
							  , std::move(commands)
							  )) {
	pimpl->start();
}
CommandTable::CommandTable(CommandTable&&) =default;
CommandTable::~CommandTable() =default;

}}
