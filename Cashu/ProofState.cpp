#include"Cashu/ProofState.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Cashu {

std::string proof_state_name(ProofState s) {
	switch (s) {
	case ProofState_Unspent: return "UNSPENT";
	case ProofState_Pending: return "PENDING";
	case ProofState_Spent: return "SPENT";
	}
	throw Util::BacktraceException<std::invalid_argument>(
		"Cashu::proof_state_name: invalid state"
	);
}

ProofState proof_state_from_name(std::string const& s) {
	if (s == "UNSPENT")
		return ProofState_Unspent;
	if (s == "PENDING")
		return ProofState_Pending;
	if (s == "SPENT")
		return ProofState_Spent;
	throw Util::BacktraceException<std::invalid_argument>(
		"Cashu::proof_state_from_name: " + s
	);
}

}
