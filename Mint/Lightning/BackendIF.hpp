#ifndef MINT_LIGHTNING_BACKENDIF_HPP
#define MINT_LIGHTNING_BACKENDIF_HPP

#include"Ln/Amount.hpp"
#include"Ln/Preimage.hpp"
#include"Sha256/Hash.hpp"
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Mint { namespace Lightning {

struct Invoice {
	std::string request;
	Sha256::Hash payment_hash;
	/* Absolute, seconds from the epoch.  */
	double expiry;
};

enum InvoiceStatus {
	InvoiceStatus_Unpaid,
	InvoiceStatus_Paid,
	InvoiceStatus_Expired
};

/* `pay` returns Succeeded, Failed or Uncertain.
 * `payment_status` returns Succeeded, Failed, InFlight or Unknown.
 */
enum PaymentStatus {
	PaymentStatus_Succeeded,
	PaymentStatus_Failed,
	PaymentStatus_Uncertain,
	PaymentStatus_InFlight,
	PaymentStatus_Unknown
};

struct PaymentResult {
	PaymentStatus status;
	/* Only meaningful on success.  */
	Ln::Preimage preimage;
	Ln::Amount fee_paid;
};

/** class Mint::Lightning::BackendIF
 *
 * @brief abstract interface to the Lightning
 * node that receives and sends the mint's
 * payments.
 *
 * @desc Implementations report node-level
 * trouble by throwing `Mint::Failure` with
 * `ErrorCode_BackendUnavailable`.
 * A payment whose outcome is not known must be
 * reported as `PaymentStatus_Uncertain`, never as
 * failed.
 */
class BackendIF {
public:
	virtual ~BackendIF() { }

	virtual
	Ev::Io<Invoice> create_invoice( Ln::Amount amount
				      , std::string const& description
				      , double expiry
				      ) =0;

	virtual
	Ev::Io<InvoiceStatus> invoice_status(Sha256::Hash const& payment_hash) =0;

	/* Maximum routing fee the mint will allow for the payment.  */
	virtual
	Ev::Io<Ln::Amount> estimate_fee( std::string const& request
				       , Ln::Amount amount
				       ) =0;

	virtual
	Ev::Io<PaymentResult> pay( std::string const& request
				 , Ln::Amount amount
				 , Ln::Amount max_fee
				 ) =0;

	virtual
	Ev::Io<PaymentResult> payment_status(Sha256::Hash const& payment_hash) =0;
};

}}

#endif /* !defined(MINT_LIGHTNING_BACKENDIF_HPP) */
