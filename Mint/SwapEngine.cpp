#include"Ev/Io.hpp"
#include"Mint/Error.hpp"
#include"Mint/ProofTracker.hpp"
#include"Mint/SwapEngine.hpp"
#include"Mint/BlindSigner.hpp"
#include"Mint/log.hpp"
#include"Mint/validate.hpp"
#include"S/Bus.hpp"
#include"Sqlite3.hpp"
#include<sstream>

namespace Mint {

Ev::Io<std::vector<Cashu::BlindedSignature>>
SwapEngine::swap( std::vector<Cashu::Proof> const& inputs
		, std::vector<Cashu::BlindedMessage> const& outputs
		) {
	return Ev::lift().then([this, inputs, outputs]() {
		auto in = check_inputs(signer, keysets, inputs);
		auto out = check_outputs(keysets, outputs, in.unit);
		if (in.amount != out) {
			auto os = std::ostringstream();
			os << "inputs total " << in.amount
			   << ", outputs total " << out;
			throw Mint::Failure(ErrorCode_AmountMismatch, os.str());
		}
		return db.transact();
	}).then([this, inputs, outputs](Sqlite3::Tx tx) {
		tracker.reserve(tx, inputs, Cashu::ProofState_Spent);
		auto sigs = signer.sign_all(outputs);
		tx.commit();
		return Mint::log( bus, Debug
				, "SwapEngine: %zu inputs SPENT, "
				  "%zu outputs signed."
				, inputs.size(), outputs.size()
				).then([sigs]() {
			return Ev::lift(sigs);
		});
	});
}

}
