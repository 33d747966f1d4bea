#ifndef MINT_ERROR_HPP
#define MINT_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Mint {

/** enum Mint::ErrorCode
 *
 * @brief every way a mint operation can be
 * refused.
 */
enum ErrorCode {
	/* Validation.  */
	ErrorCode_InvalidRequest,
	ErrorCode_InvalidProof,
	ErrorCode_DuplicateInputs,
	ErrorCode_DuplicateOutputs,
	ErrorCode_AmountMismatch,
	ErrorCode_UnitMismatch,
	ErrorCode_UnsupportedUnit,
	ErrorCode_AmountOutOfLimit,
	ErrorCode_UnknownKeyset,
	ErrorCode_InactiveKeyset,
	ErrorCode_UnknownDenomination,
	/* State conflicts.  */
	ErrorCode_ProofNotUnspent,
	ErrorCode_QuoteNotFound,
	ErrorCode_QuoteNotPaid,
	ErrorCode_QuoteAlreadyIssued,
	ErrorCode_QuotePending,
	ErrorCode_QuoteAlreadyPaid,
	ErrorCode_QuoteExpired,
	/* Lightning backend.  */
	ErrorCode_PaymentFailed,
	ErrorCode_PaymentUncertain,
	ErrorCode_BackendUnavailable
};

/* "ProofNotUnspent" etc.  */
std::string error_name(ErrorCode);
/* The numeric code used on the wire, e.g. 11001.  */
int error_nut_code(ErrorCode);

/** class Mint::Failure
 *
 * @brief thrown (through the `Ev::Io` failure
 * channel) when a mint operation is refused.
 */
class Failure : public Util::BacktraceException<std::runtime_error> {
private:
	ErrorCode code;
	std::string detail;

public:
	Failure(ErrorCode code_, std::string detail_)
		: Util::BacktraceException<std::runtime_error>(
			error_name(code_) + ": " + detail_
		  )
		, code(code_)
		, detail(std::move(detail_))
		{ }

	ErrorCode get_code() const { return code; }
	std::string const& get_detail() const { return detail; }
};

}

#endif /* !defined(MINT_ERROR_HPP) */
