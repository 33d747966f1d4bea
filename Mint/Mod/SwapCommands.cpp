#include"Cashu/BlindedMessage.hpp"
#include"Cashu/BlindedSignature.hpp"
#include"Cashu/Proof.hpp"
#include"Cashu/ProofState.hpp"
#include"Ev/Io.hpp"
#include"Json/Out.hpp"
#include"Mint/Engine.hpp"
#include"Mint/Error.hpp"
#include"Mint/Mod/SwapCommands.hpp"
#include"Secp256k1/PubKey.hpp"
#include<memory>

namespace {

using Mint::ModG::CommandTable;
using Mint::ModG::Params;

std::string as_string(Jsmn::Object const& o) {
	if (!o.is_string())
		throw Jsmn::TypeError();
	return std::string(o);
}
std::string as_Y(Jsmn::Object const& o) {
	auto Y = as_string(o);
	/* Validates the point.  */
	return std::string(Secp256k1::PubKey(Y));
}
std::string secret_as_Y(Jsmn::Object const& o) {
	return Cashu::secret_to_Y(as_string(o));
}

std::vector<CommandTable::Command> commands() {
	auto rv = std::vector<CommandTable::Command>();
	rv.push_back(CommandTable::Command{
		"clmint-swap", {"inputs", "outputs"}, "inputs outputs",
		"Exchange proofs {inputs} for signatures on "
		"blinded {outputs} of equal total (NUT-03).",
		[](Mint::Engine& e, Params const& p) {
			auto inputs = p.array<Cashu::Proof>(
				"inputs", &Cashu::Proof::object
			);
			auto outputs = p.array<Cashu::BlindedMessage>(
				"outputs", &Cashu::BlindedMessage::object
			);
			return e.swaps().swap(
				inputs, outputs
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
	rv.push_back(CommandTable::Command{
		"clmint-checkstate", {"Ys", "secrets"}, "[Ys] [secrets]",
		"Whether each proof, named by its Y or by "
		"its secret, is unspent, pending or spent "
		"(NUT-07).",
		[](Mint::Engine& e, Params const& p) {
			auto pYs = std::make_shared<std::vector<std::string>>();
			if (p.has("Ys") == p.has("secrets"))
				throw Mint::Failure( Mint::ErrorCode_InvalidRequest
						   , "give exactly one of Ys "
						     "and secrets"
						   );
			if (p.has("Ys"))
				*pYs = p.array<std::string>("Ys", &as_Y);
			else
				*pYs = p.array<std::string>( "secrets"
							   , &secret_as_Y
							   );
			return e.proofs().check_state(
				*pYs
			).then([pYs](std::vector<Cashu::ProofState> states) {
				auto rv = Json::Out();
				auto obj = rv.start_object();
				auto arr = obj.start_array("states");
				for (auto i = std::size_t(0); i < states.size(); ++i)
					arr.start_object()
						.field("Y", (*pYs)[i])
						.field("state", Cashu::proof_state_name(states[i]))
						.field("witness", nullptr)
					.end_object();
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

SwapCommands::SwapCommands(S::Bus& bus) : table(bus, commands()) { }

}}
