#include"Mint/Mod/CommandReceiver.hpp"
#include"Mint/Msg/CommandFail.hpp"
#include"Mint/Msg/CommandRequest.hpp"
#include"Mint/Msg/CommandResponse.hpp"
#include"Mint/Msg/JsonCin.hpp"
#include"Mint/Msg/JsonCout.hpp"
#include"Mint/concurrent.hpp"
#include"Ln/CommandId.hpp"
#include"S/Bus.hpp"

namespace Mint { namespace Mod {

CommandReceiver::CommandReceiver(S::Bus& bus_) : bus(bus_) {
	bus.subscribe<Mint::Msg::JsonCin>([this](Mint::Msg::JsonCin const& cin_msg) {
		auto& inp = cin_msg.obj;

		/* Silently fail.  */
		if (!inp.is_object())
			return Ev::lift();
		if (!inp.has("method"))
			return Ev::lift();
		if (!inp["method"].is_string())
			return Ev::lift();
		if (!inp.has("params"))
			return Ev::lift();
		/* We subscribe to no notifications.  */
		if (!inp.has("id"))
			return Ev::lift();

		auto method = std::string(inp["method"]);
		auto params = inp["params"];

		auto pid = Ln::command_id_from_jsmn_object(inp["id"]);
		if (!pid)
			return Ev::lift();

		auto const& id = *pid;
		pendings.insert(id);

		/* Each command runs in its own greenthread, so
		 * a slow one (a melt) does not hold up the
		 * others.  */
		return Mint::concurrent(
			bus, "CommandReceiver",
			bus.raise(Mint::Msg::CommandRequest{
				method, params, id
			})
		);
	});
	bus.subscribe<Mint::Msg::CommandResponse>([this](Mint::Msg::CommandResponse const& resp) {
		/* If not a pending command, ignore.  */
		auto it = pendings.find(resp.id);
		if (it == pendings.end())
			return Ev::lift();
		pendings.erase(it);
		auto js = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", resp.id)
				.field("result", resp.response)
			.end_object()
			;
		return bus.raise(Mint::Msg::JsonCout{std::move(js)});
	});
	bus.subscribe<Mint::Msg::CommandFail>([this](Mint::Msg::CommandFail const& fail) {
		auto it = pendings.find(fail.id);
		if (it == pendings.end())
			return Ev::lift();
		pendings.erase(it);
		auto js = Json::Out()
			.start_object()
				.field("jsonrpc", std::string("2.0"))
				.field("id", fail.id)
				.start_object("error")
					.field("code", fail.code)
					.field("message", fail.message)
					.field("data", fail.data)
				.end_object()
			.end_object()
			;
		return bus.raise(Mint::Msg::JsonCout{std::move(js)});
	});
}

}}
