#ifndef MINT_LIGHTNING_FAKEBACKEND_HPP
#define MINT_LIGHTNING_FAKEBACKEND_HPP

#include"Mint/Config.hpp"
#include"Mint/Lightning/BackendIF.hpp"
#include<map>
#include<memory>

namespace Mint { namespace Lightning {

/** class Mint::Lightning::FakeBackend
 *
 * @brief an in-process Lightning node with no
 * network behind it.
 *
 * @desc Invoices it creates are real, signed
 * BOLT11 strings for an ephemeral node key, but
 * they are only settled by `settle_invoice` (or
 * immediately, with `auto_settle`).
 * Outgoing payments complete with whatever
 * outcome `set_next_pay` last chose.
 */
class FakeBackend : public BackendIF {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	FakeBackend() =delete;
	explicit
	FakeBackend(Mint::Config const& config, bool auto_settle = false);
	~FakeBackend();

	Ev::Io<Invoice> create_invoice( Ln::Amount amount
				      , std::string const& description
				      , double expiry
				      ) override;
	Ev::Io<InvoiceStatus> invoice_status(Sha256::Hash const&) override;
	Ev::Io<Ln::Amount> estimate_fee( std::string const& request
				       , Ln::Amount amount
				       ) override;
	Ev::Io<PaymentResult> pay( std::string const& request
				 , Ln::Amount amount
				 , Ln::Amount max_fee
				 ) override;
	Ev::Io<PaymentResult> payment_status(Sha256::Hash const&) override;

	/* Mark an invoice we issued as paid by someone.  */
	void settle_invoice(Sha256::Hash const& payment_hash);

	/* Outcome and routing fee of the next `pay` calls.  */
	void set_next_pay(PaymentStatus status, Ln::Amount fee);
	/* While set, `pay` fails with BackendUnavailable
	 * before the payment is ever attempted.  */
	void set_unreachable(bool unreachable);
	/* Resolve an uncertain outgoing payment.  */
	void resolve_payment( Sha256::Hash const& payment_hash
			    , PaymentStatus status
			    );
	/* How many times `pay` was called for the hash.  */
	unsigned int pay_count(Sha256::Hash const& payment_hash) const;

	/** Mint::Lightning::FakeBackend::make_invoice
	 *
	 * @brief creates an invoice as if from some
	 * other node, for a caller to melt.
	 */
	std::string make_invoice(Ln::Amount amount, Sha256::Hash& payment_hash);
};

}}

#endif /* !defined(MINT_LIGHTNING_FAKEBACKEND_HPP) */
