#include"Mint/Error.hpp"

namespace Mint {

std::string error_name(ErrorCode c) {
	switch (c) {
	case ErrorCode_InvalidRequest: return "InvalidRequest";
	case ErrorCode_InvalidProof: return "InvalidProof";
	case ErrorCode_DuplicateInputs: return "DuplicateInputs";
	case ErrorCode_DuplicateOutputs: return "DuplicateOutputs";
	case ErrorCode_AmountMismatch: return "AmountMismatch";
	case ErrorCode_UnitMismatch: return "UnitMismatch";
	case ErrorCode_UnsupportedUnit: return "UnsupportedUnit";
	case ErrorCode_AmountOutOfLimit: return "AmountOutOfLimit";
	case ErrorCode_UnknownKeyset: return "UnknownKeyset";
	case ErrorCode_InactiveKeyset: return "InactiveKeyset";
	case ErrorCode_UnknownDenomination: return "UnknownDenomination";
	case ErrorCode_ProofNotUnspent: return "ProofNotUnspent";
	case ErrorCode_QuoteNotFound: return "QuoteNotFound";
	case ErrorCode_QuoteNotPaid: return "QuoteNotPaid";
	case ErrorCode_QuoteAlreadyIssued: return "QuoteAlreadyIssued";
	case ErrorCode_QuotePending: return "QuotePending";
	case ErrorCode_QuoteAlreadyPaid: return "QuoteAlreadyPaid";
	case ErrorCode_QuoteExpired: return "QuoteExpired";
	case ErrorCode_PaymentFailed: return "PaymentFailed";
	case ErrorCode_PaymentUncertain: return "PaymentUncertain";
	case ErrorCode_BackendUnavailable: return "BackendUnavailable";
	}
	return "Unknown";
}

int error_nut_code(ErrorCode c) {
	switch (c) {
	case ErrorCode_InvalidRequest: return 10000;
	case ErrorCode_InvalidProof: return 10003;
	case ErrorCode_DuplicateInputs: return 11007;
	case ErrorCode_DuplicateOutputs: return 11008;
	case ErrorCode_AmountMismatch: return 11002;
	case ErrorCode_UnitMismatch: return 11010;
	case ErrorCode_UnsupportedUnit: return 11005;
	case ErrorCode_AmountOutOfLimit: return 11006;
	case ErrorCode_UnknownKeyset: return 12001;
	case ErrorCode_InactiveKeyset: return 12002;
	case ErrorCode_UnknownDenomination: return 12003;
	case ErrorCode_ProofNotUnspent: return 11001;
	case ErrorCode_QuoteNotFound: return 20004;
	case ErrorCode_QuoteNotPaid: return 20001;
	case ErrorCode_QuoteAlreadyIssued: return 20002;
	case ErrorCode_QuotePending: return 20005;
	case ErrorCode_QuoteAlreadyPaid: return 20006;
	case ErrorCode_QuoteExpired: return 20007;
	case ErrorCode_PaymentFailed: return 20008;
	case ErrorCode_PaymentUncertain: return 20009;
	case ErrorCode_BackendUnavailable: return 20010;
	}
	return 10000;
}

}
