#include"Cashu/BlindedMessage.hpp"
#include"Cashu/Proof.hpp"
#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"Mint/Engine.hpp"
#include"Mint/MeltQuote.hpp"
#include"Mint/Mod/MeltCommands.hpp"

namespace {

using Mint::ModG::CommandTable;
using Mint::ModG::Params;

Ev::Io<Json::Out> reply(Mint::MeltQuote q) {
	return Ev::lift(q.json());
}

std::vector<CommandTable::Command> commands() {
	auto rv = std::vector<CommandTable::Command>();
	rv.push_back(CommandTable::Command{
		"clmint-melt-quote", {"request", "unit"}, "request [unit]",
		"Quote the amount and fee reserve of paying "
		"BOLT11 invoice {request} with ecash of "
		"{unit} (NUT-05).",
		[](Mint::Engine& e, Params const& p) {
			auto request = p.string("request");
			auto unit = p.has("unit") ?
				p.string("unit") :
				e.get_config().units.front();
			return e.melt_quotes().create_melt_quote(
				request, unit
			).then(&reply);
		}
	});
	rv.push_back(CommandTable::Command{
		"clmint-melt-quote-check", {"quote"}, "quote",
		"State of melt quote {quote}; a pending "
		"payment is looked up on the node.",
		[](Mint::Engine& e, Params const& p) {
			auto id = p.string("quote");
			return e.melt_quotes().get_melt_quote(id).then(&reply);
		}
	});
	rv.push_back(CommandTable::Command{
		"clmint-melt", {"quote", "inputs", "outputs"},
		"quote inputs [outputs]",
		"Pay the invoice of melt quote {quote} with "
		"proofs {inputs}; unused fee reserve is "
		"returned as signatures on blank {outputs} "
		"(NUT-08).",
		[](Mint::Engine& e, Params const& p) {
			auto id = p.string("quote");
			auto inputs = p.array<Cashu::Proof>(
				"inputs", &Cashu::Proof::object
			);
			auto outputs = std::vector<Cashu::BlindedMessage>();
			if (p.has("outputs"))
				outputs = p.array<Cashu::BlindedMessage>(
					"outputs", &Cashu::BlindedMessage::object
				);
			return e.melt_quotes().melt(
				id, inputs, outputs
			).then(&reply);
		}
	});
	return rv;
}

}

namespace Mint { namespace Mod {

MeltCommands::MeltCommands(S::Bus& bus) : table(bus, commands()) { }

}}
