#include"Cashu/BlindedMessage.hpp"
#include"Cashu/BlindedSignature.hpp"
#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"Mint/Engine.hpp"
#include"Mint/MintQuote.hpp"
#include"Mint/Mod/MintCommands.hpp"

namespace {

using Mint::ModG::CommandTable;
using Mint::ModG::Params;

std::string unit_param(Mint::Engine& e, Params const& p) {
	if (p.has("unit"))
		return p.string("unit");
	return e.get_config().units.front();
}

std::vector<CommandTable::Command> commands() {
	auto rv = std::vector<CommandTable::Command>();
	rv.push_back(CommandTable::Command{
		"clmint-mint-quote", {"amount", "unit"}, "amount [unit]",
		"Get an invoice that, once paid, lets the "
		"caller mint {amount} of {unit} (NUT-04).",
		[](Mint::Engine& e, Params const& p) {
			auto amount = p.amount("amount");
			auto unit = unit_param(e, p);
			return e.mint_quotes().create_mint_quote(
				amount, unit
			).then([](Mint::MintQuote q) {
				return Ev::lift(q.json());
			});
		}
	});
	rv.push_back(CommandTable::Command{
		"clmint-mint-quote-check", {"quote"}, "quote",
		"State of mint quote {quote}.",
		[](Mint::Engine& e, Params const& p) {
			auto id = p.string("quote");
			return e.mint_quotes().poll_mint_quote(id
							      ).then([](Mint::MintQuote q) {
				return Ev::lift(q.json());
			});
		}
	});
	rv.push_back(CommandTable::Command{
		"clmint-mint", {"quote", "outputs"}, "quote outputs",
		"Sign blinded {outputs} for the paid mint "
		"quote {quote}.",
		[](Mint::Engine& e, Params const& p) {
			auto id = p.string("quote");
			auto outputs = p.array<Cashu::BlindedMessage>(
				"outputs", &Cashu::BlindedMessage::object
			);
			return e.mint_quotes().issue(
				id, outputs
			).then([](std::vector<Cashu::BlindedSignature> sigs) {
				auto rv = Json::Out();
				auto obj = rv.start_object();
				auto arr = obj.start_array("signatures");
				for (auto const& s : sigs)
					arr.entry(s.json());
				arr.end_array();
				obj.end_object();
				return Ev::lift(std::move(rv));
			});
		}
	});
	return rv;
}

}

namespace Mint { namespace Mod {

MintCommands::MintCommands(S::Bus& bus) : table(bus, commands()) { }

}}
