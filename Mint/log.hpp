#ifndef MINT_LOG_HPP
#define MINT_LOG_HPP

#ifdef HAVE_CONFIG_H
# include"config.h"
#endif

#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Mint {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/* The level names `lightningd` accepts in `log`
 * notifications.  */
char const* log_level_name(LogLevel);
/* Returns false if `name` is not a level.  */
bool log_level_from_name(std::string const& name, LogLevel& level);

/** Mint::log
 *
 * @brief formats a message and broadcasts it as
 * `Mint::Msg::Log`.
 *
 * @desc `Mint::Mod::Logger` decides whether it
 * reaches `lightningd`.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* MINT_LOG_HPP */
