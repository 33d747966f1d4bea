#ifndef MINT_LIGHTNING_CLNBACKEND_HPP
#define MINT_LIGHTNING_CLNBACKEND_HPP

#include"Mint/Config.hpp"
#include"Mint/Lightning/BackendIF.hpp"

namespace Mint { namespace Mod { class Rpc; }}
namespace Mint { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Mint { namespace Lightning {

/** class Mint::Lightning::ClnBackend
 *
 * @brief receives and sends payments through
 * the `lightningd` we are a plugin of, using
 * `invoice`, `listinvoices`, `pay` and
 * `listpays`.
 *
 * @desc A `pay` command that errors is not
 * trusted as a definite failure: `listpays` is
 * asked what became of the payment.
 * A `pay` that does not return within
 * `clmint-pay-timeout` is reported uncertain.
 */
class ClnBackend : public BackendIF {
private:
	S::Bus& bus;
	Mint::Mod::Rpc& rpc;
	Mint::Mod::Waiter& waiter;
	Mint::Config config;

public:
	ClnBackend() =delete;
	ClnBackend(ClnBackend const&) =delete;

	ClnBackend( S::Bus& bus_
		  , Mint::Mod::Rpc& rpc_
		  , Mint::Mod::Waiter& waiter_
		  , Mint::Config const& config_
		  ) : bus(bus_)
		    , rpc(rpc_)
		    , waiter(waiter_)
		    , config(config_)
		    { }

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
};

}}

#endif /* !defined(MINT_LIGHTNING_CLNBACKEND_HPP) */
