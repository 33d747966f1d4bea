#ifndef CASHU_PROOFSTATE_HPP
#define CASHU_PROOFSTATE_HPP

#include<string>

namespace Cashu {

enum ProofState {
	ProofState_Unspent,
	ProofState_Pending,
	ProofState_Spent
};

/* "UNSPENT", "PENDING" or "SPENT".  */
std::string proof_state_name(ProofState);
/* Throws std::invalid_argument on an unknown name.  */
ProofState proof_state_from_name(std::string const&);

}

#endif /* !defined(CASHU_PROOFSTATE_HPP) */
