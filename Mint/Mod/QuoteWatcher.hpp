#ifndef MINT_MOD_QUOTEWATCHER_HPP
#define MINT_MOD_QUOTEWATCHER_HPP

#include<memory>

namespace Mint { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::QuoteWatcher
 *
 * @brief periodically settles quotes nobody is
 * asking about.
 *
 * @desc Every `clmint-poll-interval` seconds,
 * checks the invoices of unpaid mint quotes,
 * reconciles pending melts with the node, and
 * deletes unpaid quotes that expired over an
 * hour ago.
 */
class QuoteWatcher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	QuoteWatcher() =delete;
	QuoteWatcher(S::Bus& bus, Waiter& waiter);
	QuoteWatcher(QuoteWatcher&&);
	~QuoteWatcher();
};

}}

#endif /* !defined(MINT_MOD_QUOTEWATCHER_HPP) */
