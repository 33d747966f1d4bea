#ifndef MINT_MOD_LOGGER_HPP
#define MINT_MOD_LOGGER_HPP

#include<memory>

namespace S { class Bus; }

namespace Mint { namespace Mod {

/** class Mint::Mod::Logger
 *
 * @brief forwards `Mint::Msg::Log` records at or
 * above `clmint-log-level` to `lightningd` as `log`
 * notifications, one per line of the message.
 *
 * @desc Until `init` delivers the option, the
 * threshold is `debug`.
 */
class Logger {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Logger() =delete;
	explicit
	Logger(S::Bus& bus);
	Logger(Logger&&);
	~Logger();
};

}}

#endif /* !defined(MINT_MOD_LOGGER_HPP) */
