#include"Cashu/Keyset.hpp"
#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"Mint/Engine.hpp"
#include"Mint/Mod/InfoCommands.hpp"

namespace {

using Mint::ModG::CommandTable;
using Mint::ModG::Params;

std::vector<CommandTable::Command> commands() {
	auto rv = std::vector<CommandTable::Command>();
	rv.push_back(CommandTable::Command{
		"clmint-info", {}, "",
		"Describe the mint (NUT-06).",
		[](Mint::Engine& e, Params const&) {
			return Ev::lift(e.info().get_info());
		}
	});
	rv.push_back(CommandTable::Command{
		"clmint-keysets", {}, "",
		"List every keyset, active or not (NUT-02).",
		[](Mint::Engine& e, Params const&) {
			return Ev::lift(e.info().list_keysets());
		}
	});
	rv.push_back(CommandTable::Command{
		"clmint-keys", {"id"}, "[id]",
		"Public keys of the keyset {id}, or of all "
		"active keysets (NUT-01).",
		[](Mint::Engine& e, Params const& p) {
			if (p.has("id"))
				return Ev::lift(e.info().get_keyset_keys(
					p.string("id")
				));
			return Ev::lift(e.info().get_keys());
		}
	});
	rv.push_back(CommandTable::Command{
		"clmint-rotate", {"unit"}, "unit",
		"Retire the active keyset of {unit} and "
		"start a new one.",
		[](Mint::Engine& e, Params const& p) {
			auto unit = p.string("unit");
			return e.keysets().rotate(unit
						 ).then([](Cashu::Keyset k) {
				auto rv = Json::Out()
					.start_object()
						.field("id", k.get_id())
						.field("unit", k.get_unit())
						.field("counter", k.get_counter())
						.field("active", true)
					.end_object()
					;
				return Ev::lift(std::move(rv));
			});
		}
	});
	return rv;
}

}

namespace Mint { namespace Mod {

InfoCommands::InfoCommands(S::Bus& bus) : table(bus, commands()) { }

}}
