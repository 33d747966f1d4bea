#include"Cashu/BlindedMessage.hpp"
#include"Cashu/Proof.hpp"
#include"Cashu/split.hpp"
#include"Mint/BlindSigner.hpp"
#include"Mint/Error.hpp"
#include"Mint/KeysetManager.hpp"
#include"Mint/validate.hpp"
#include<set>
#include<sstream>

namespace {

void add(std::uint64_t& total, std::uint64_t amount) {
	if (total + amount < total)
		throw Mint::Failure( Mint::ErrorCode_AmountMismatch
				   , "amounts overflow"
				   );
	total += amount;
}

void check_keyset( Mint::KeysetManager const& keysets
		 , std::string const& id
		 , std::string const& unit
		 ) {
	auto const& ks = keysets.get_by_id(id);
	if (ks.get_unit() != unit)
		throw Mint::Failure( Mint::ErrorCode_UnitMismatch
				   , "keyset " + id + " is " + ks.get_unit()
				   + ", expected " + unit
				   );
	if (!keysets.is_active(id))
		throw Mint::Failure( Mint::ErrorCode_InactiveKeyset
				   , "keyset " + id
				   );
}

void check_unique_B_(std::vector<Cashu::BlindedMessage> const& outputs) {
	auto seen = std::set<std::string>();
	for (auto const& o : outputs)
		if (!seen.insert(std::string(o.B_)).second)
			throw Mint::Failure( Mint::ErrorCode_DuplicateOutputs
					   , "B_ " + std::string(o.B_)
					   );
}

}

namespace Mint {

InputTotal check_inputs( BlindSigner& signer
		       , KeysetManager const& keysets
		       , std::vector<Cashu::Proof> const& inputs
		       ) {
	if (inputs.empty())
		throw Mint::Failure(ErrorCode_InvalidRequest, "no inputs");

	auto secrets = std::set<std::string>();
	for (auto const& p : inputs)
		if (!secrets.insert(p.secret).second)
			throw Mint::Failure( ErrorCode_DuplicateInputs
					   , "secret repeated in inputs"
					   );

	auto rv = InputTotal();
	rv.amount = 0;
	for (auto const& p : inputs) {
		auto const& unit = keysets.get_by_id(p.id).get_unit();
		if (rv.unit.empty())
			rv.unit = unit;
		else if (rv.unit != unit)
			throw Mint::Failure( ErrorCode_UnitMismatch
					   , "inputs mix " + rv.unit
					   + " and " + unit
					   );
		if (!Cashu::is_power_of_two(p.amount)) {
			auto os = std::ostringstream();
			os << "input amount " << p.amount;
			throw Mint::Failure( ErrorCode_UnknownDenomination
					   , os.str()
					   );
		}
		add(rv.amount, p.amount);
	}

	signer.verify_all(inputs);
	return rv;
}

std::uint64_t check_outputs( KeysetManager const& keysets
			   , std::vector<Cashu::BlindedMessage> const& outputs
			   , std::string const& unit
			   ) {
	if (outputs.empty())
		throw Mint::Failure(ErrorCode_InvalidRequest, "no outputs");

	auto total = std::uint64_t(0);
	for (auto const& o : outputs) {
		check_keyset(keysets, o.id, unit);
		if ( !Cashu::is_power_of_two(o.amount)
		  || !keysets.get_by_id(o.id).has_amount(o.amount)
		   ) {
			auto os = std::ostringstream();
			os << "output amount " << o.amount
			   << " in keyset " << o.id;
			throw Mint::Failure( ErrorCode_UnknownDenomination
					   , os.str()
					   );
		}
		add(total, o.amount);
	}
	check_unique_B_(outputs);
	return total;
}

void check_blank_outputs( KeysetManager const& keysets
			, std::vector<Cashu::BlindedMessage> const& outputs
			, std::string const& unit
			) {
	if (outputs.size() > max_blank_outputs)
		throw Mint::Failure( ErrorCode_InvalidRequest
				   , "too many change outputs"
				   );
	for (auto const& o : outputs)
		check_keyset(keysets, o.id, unit);
	check_unique_B_(outputs);
}

}
